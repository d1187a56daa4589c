#pragma once

#include "config/config_types.hpp"

#include <string>
#include <vector>

namespace reskfmt {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads reskfmt.toml
 *
 * String values may reference environment variables as ${NAME}; unset
 * variables expand to "". Unknown sections and keys are ignored.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        std::vector<std::string> warnings;
        ReskConfig config;

        static LoadResult ok(ReskConfig cfg, std::vector<std::string> warnings = {}) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            result.warnings = std::move(warnings);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    static constexpr int64_t kMaxDecimalDigits = 20;

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to reskfmt.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    // Hard errors; an empty result means the config is usable
    [[nodiscard]] static std::vector<std::string> validate_config(const ReskConfig& config);

    // Accepted but suspicious settings
    [[nodiscard]] static std::vector<std::string> collect_warnings(const ReskConfig& config);
};

} // namespace reskfmt
