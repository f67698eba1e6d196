#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "tags/Models.hpp"

namespace tags {

// {"groups": [{"name": ..., "tags": [...]}, ...]} in parse order
nlohmann::json groups_to_json(const std::vector<Group>& groups);

void write_groups_json(const std::filesystem::path& path, const std::vector<Group>& groups);

// Reads a document produced by write_groups_json.
// Throws IoError if the file cannot be opened, std::runtime_error on bad JSON or shape.
std::vector<Group> load_groups_json(const std::string& path);

}  // namespace tags
