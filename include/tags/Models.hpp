#pragma once
#include <string>
#include <vector>

namespace tags {

struct Group {
    std::string name;                // text between the header brackets, trimmed
    std::vector<std::string> tags;   // one entry per tag line, in file order
};

}  // namespace tags
