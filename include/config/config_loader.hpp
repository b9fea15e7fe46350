#pragma once

#include "config/config_types.hpp"

#include <string>
#include <vector>

namespace querywatch {

/**
 * @brief Loads QuerywatchConfig from TOML (toml++)
 *
 * Missing sections and keys keep their defaults. ${VAR} references in
 * string values are replaced with environment variables (unset -> empty).
 * All validation errors are collected into a single message.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        QuerywatchConfig config;

        static LoadResult ok(QuerywatchConfig cfg) {
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
     * @brief Load config from a TOML file
     * @param config_path Path to querywatch.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML text
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// @return One message per invalid setting (empty when valid)
    [[nodiscard]] static std::vector<std::string> validate_config(const QuerywatchConfig& config);

    /**
     * @brief Replace ${VAR} with the environment value
     * @throws std::runtime_error on an unclosed "${"
     */
    [[nodiscard]] static std::string expand_env_vars(const std::string& input);

private:
    static LoadResult validate_and_return(QuerywatchConfig config);
};

} // namespace querywatch
