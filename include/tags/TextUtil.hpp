#pragma once
#include <string>
#include <vector>

namespace textutil {

// split on "\n", "\r\n" or a lone "\r"; terminators are not kept
std::vector<std::string> split_lines(const std::string& text);

// strip whitespace from both ends, including UTF-8 encoded Unicode spaces (U+00A0, U+3000, ...)
std::string trim(const std::string& s);

// drop everything from the first '#' onward
std::string strip_comment(const std::string& line);

}
