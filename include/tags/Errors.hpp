#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace tags {

// tag file (or catalog JSON) missing or unreadable
class IoError : public std::runtime_error {
public:
    IoError(const std::string& what, const std::string& path)
        : std::runtime_error(what), m_path(path) {}

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

// a line starting with '[' that does not end with ']' once its comment is stripped
class MalformedHeader : public std::runtime_error {
public:
    MalformedHeader(size_t line_number, const std::string& line)
        : std::runtime_error("malformed header at line " + std::to_string(line_number) + ": " + line),
          m_line_number(line_number),
          m_line(line) {}

    size_t line_number() const { return m_line_number; }
    const std::string& line() const { return m_line; }

private:
    size_t m_line_number = 0;
    std::string m_line;
};

}  // namespace tags
