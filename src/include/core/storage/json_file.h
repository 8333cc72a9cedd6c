#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>

namespace fileferry::core::json_file {

// A missing, unreadable or non-object file reads as an empty object.
nlohmann::json LoadObject(const std::filesystem::path& path);

bool Save(const std::filesystem::path& path, const nlohmann::json& data);

} // namespace fileferry::core::json_file
