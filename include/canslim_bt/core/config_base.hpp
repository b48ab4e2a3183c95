// include/canslim_bt/core/config_base.hpp
#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include "canslim_bt/core/error.hpp"

namespace canslim_bt {

/**
 * @brief Base class for all configuration types
 * Provides JSON file persistence on top of to_json/from_json
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Save configuration to a JSON file
     * @param filepath Path to save the file
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Load configuration from a JSON file
     * @param filepath Path to the file
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;

    /**
     * @brief Load configuration from JSON; absent keys keep their current values
     */
    virtual void from_json(const nlohmann::json& j) = 0;
};

}  // namespace canslim_bt
