#include "io/JsonIO.hpp"
#include "tags/Errors.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

using json = nlohmann::json;

namespace tags {

// j[key], or a "missing required field" error naming where it was expected
static const json& require_field(const json& j, const char* key, const std::string& where) {
    if (!j.is_object()) throw std::runtime_error(where + " must be an object");
    if (!j.contains(key)) throw std::runtime_error(where + " missing required field: " + key);
    return j.at(key);
}

static Group parse_group(const json& j, const std::string& where) {
    Group g;

    const json& name = require_field(j, "name", where);
    if (!name.is_string()) throw std::runtime_error(where + ".name must be a string");
    g.name = name.get<std::string>();

    const json& arr = require_field(j, "tags", where);
    if (!arr.is_array()) throw std::runtime_error(where + ".tags must be an array");

    g.tags.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_string()) {
            std::ostringstream oss;
            oss << where << ".tags[" << i << "] must be a string";
            throw std::runtime_error(oss.str());
        }
        g.tags.push_back(arr.at(i).get<std::string>());
    }
    return g;
}

json groups_to_json(const std::vector<Group>& groups) {
    json arr = json::array();
    for (const auto& g : groups) {
        arr.push_back({
            {"name", g.name},
            {"tags", g.tags}
        });
    }

    json j;
    j["groups"] = arr;
    return j;
}

void write_groups_json(const std::filesystem::path& path, const std::vector<Group>& groups) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw IoError("failed to create output directory: " + path.parent_path().string() + ": " + ec.message(),
                          path.string());
        }
    }

    std::ofstream out(path);
    if (!out) throw IoError("failed to open output file: " + path.string(), path.string());

    out << groups_to_json(groups).dump(2) << "\n";
}

std::vector<Group> load_groups_json(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw IoError("failed to open catalog file: " + path, path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }

    const json& groups = require_field(j, "groups", "root");
    if (!groups.is_array()) {
        throw std::runtime_error("root.groups must be an array");
    }

    std::vector<Group> out;
    out.reserve(groups.size());
    for (size_t i = 0; i < groups.size(); ++i) {
        std::ostringstream oss;
        oss << "root.groups[" << i << "]";
        out.push_back(parse_group(groups.at(i), oss.str()));
    }
    return out;
}

}  // namespace tags
