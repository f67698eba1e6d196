#include "tags/TagParser.hpp"
#include "tags/TextUtil.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace tags {

static std::string read_all(const fs::path& p) {
    std::error_code ec;
    if (!fs::exists(p, ec)) throw IoError("tag file not found: " + p.string(), p.string());
    if (!fs::is_regular_file(p, ec)) throw IoError("not a regular file: " + p.string(), p.string());

    std::ifstream in(p, std::ios::binary);
    if (!in) throw IoError("failed to open tag file: " + p.string(), p.string());

    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) throw IoError("failed to read tag file: " + p.string(), p.string());
    return ss.str();
}

TagParser::TagParser(std::string text, ParseOptions opts)
    : m_text(std::move(text)), m_opts(opts) {}

TagParser TagParser::from_path(const std::string& path, ParseOptions opts) {
    TagParser p(read_all(fs::path(path)), opts);
    if (opts.verbose) {
        std::cerr << "TagParser: loaded " << path << " (" << p.m_text.size() << " bytes)\n";
    }
    return p;
}

TagParser TagParser::from_text(std::string text, ParseOptions opts) {
    TagParser p(std::move(text), opts);
    p.parse();
    return p;
}

void TagParser::parse() {
    m_groups.clear();

    std::vector<Group> out;
    Group cur;

    const std::vector<std::string> lines = textutil::split_lines(m_text);
    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& raw = lines[i];
        if (raw.empty() || raw[0] == '#') continue;

        const std::string line = textutil::trim(textutil::strip_comment(raw));
        if (line.empty()) continue;

        if (line.front() == '[') {
            if (line.size() < 2 || line.back() != ']') throw MalformedHeader(i + 1, raw);

            if (!cur.name.empty()) {
                out.push_back(std::move(cur));
                cur = Group{};
            }
            cur.name = textutil::trim(line.substr(1, line.size() - 2));
            continue;
        }

        if (cur.name.empty()) {
            if (m_opts.verbose) {
                std::cerr << "TagParser: discarded orphan tag at line " << (i + 1) << ": " << line << "\n";
            }
            continue;
        }

        cur.tags.push_back(line);
    }

    if (!cur.name.empty() || m_opts.keep_unnamed_trailing) out.push_back(std::move(cur));

    m_groups = std::move(out);
}

const Group* TagParser::find(const std::string& name) const {
    for (const auto& g : m_groups) {
        if (g.name == name) return &g;
    }
    return nullptr;
}

}  // namespace tags
