// src/core/config_base.cpp

#include "canslim_bt/core/config_base.hpp"
#include <iomanip>

namespace canslim_bt {

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open file for writing: " + filepath, "ConfigBase");
    }
    try {
        file << std::setw(4) << to_json() << std::endl;
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                std::string("Error serializing config: ") + e.what(),
                                "ConfigBase");
    }
    return Result<void>();
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND,
                                "Failed to open file for reading: " + filepath, "ConfigBase");
    }
    try {
        nlohmann::json j;
        file >> j;
        from_json(j);
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                std::string("Error loading config: ") + e.what(), "ConfigBase");
    } catch (const CanslimError& e) {
        return make_error<void>(e.code(), e.what(), "ConfigBase");
    }
    return Result<void>();
}

}  // namespace canslim_bt
