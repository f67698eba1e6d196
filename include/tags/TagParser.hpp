#pragma once

#include <string>
#include <vector>

#include "tags/Errors.hpp"
#include "tags/Models.hpp"

namespace tags {

struct ParseOptions {
    bool keep_unnamed_trailing = false;  // emit the final accumulator even when no header named it
    bool verbose = false;                // report discarded orphan lines on stderr
};

class TagParser {
public:
    // Loads the file into the working buffer without parsing it.
    // Throws IoError if the file is missing or unreadable.
    static TagParser from_path(const std::string& path, ParseOptions opts = {});

    // Parses eagerly; groups() is valid on return. May throw MalformedHeader.
    static TagParser from_text(std::string text, ParseOptions opts = {});

    // Rebuilds groups() from the buffer. Calling it again gives the same result.
    void parse();

    const std::vector<Group>& groups() const { return m_groups; }
    const std::string& text() const { return m_text; }
    const ParseOptions& options() const { return m_opts; }

    // first group with this name, nullptr if none.
    // The pointer is invalidated by the next parse().
    const Group* find(const std::string& name) const;

private:
    TagParser(std::string text, ParseOptions opts);

    std::string m_text;
    ParseOptions m_opts;
    std::vector<Group> m_groups;
};

}  // namespace tags
