#pragma once

#include "config/config_types.hpp"

#include <string>
#include <vector>

namespace authguard {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads [logging] and [auth] sections
 *
 * String values may reference the environment as ${VAR_NAME}; an unset
 * variable expands to the empty string, an unclosed "${" is a load error.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        GuardConfig config;

        static LoadResult ok(GuardConfig cfg) {
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
     * @param config_path Path to the TOML file
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
     * @brief Check cross-field constraints
     * @return One message per violation; empty when the config is usable
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const GuardConfig& config);

private:
    static LoadResult validate_and_return(GuardConfig config);
};

} // namespace authguard
