#pragma once

#include "config/config_types.hpp"

#include <string>
#include <vector>

namespace sqlorm {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads OrmConfig from TOML (toml++)
 *
 * ${VAR} references in string values are expanded from the environment
 * before extraction. The pool array is read from the table named after the
 * dialect ([[postgres]] or [[mysql]]). Every validation problem is reported
 * in a single error message.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        OrmConfig config;

        static LoadResult ok(OrmConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to the .toml file
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief All problems with an already extracted config; empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const OrmConfig& config);
};

} // namespace sqlorm
