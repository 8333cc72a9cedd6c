#include <core/storage/json_file.h>
#include <fstream>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace fileferry::core::json_file {

json LoadObject(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return json::object();
    }
    try {
        auto data = json::parse(ifs);
        if (data.is_object()) {
            return data;
        }
        spdlog::warn("\"{}\" does not hold a json object, ignoring it", path.string());
    } catch (const json::parse_error& e) {
        spdlog::error("\"{}\" could not be parsed: {}", path.string(), e.what());
    }
    return json::object();
}

bool Save(const std::filesystem::path& path, const json& data) {
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs.is_open()) {
        spdlog::error("Failed to open \"{}\" for saving.", path.string());
        return false;
    }
    ofs << data.dump(2);
    return static_cast<bool>(ofs);
}

} // namespace fileferry::core::json_file
