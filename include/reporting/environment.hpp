#pragma once

#include <string>
#include <string_view>

namespace querywatch {

namespace env {
    inline constexpr std::string_view kEnvironmentVar = "QUERYWATCH_ENVIRONMENT";
    inline constexpr std::string_view kApplicationNameVar = "APPLICATION_NAME";
    inline constexpr std::string_view kDevelopment = "Development";
    inline constexpr std::string_view kProduction = "Production";
    inline constexpr std::string_view kUnknown = "Unknown";
}

/**
 * @brief Resolve the environment tag
 *
 * configured (non-empty) -> $QUERYWATCH_ENVIRONMENT -> "Production"
 */
[[nodiscard]] std::string resolve_environment(const std::string& configured);

/**
 * @brief Resolve the application name
 *
 * configured -> $APPLICATION_NAME -> executable name (/proc/self/exe) -> "Unknown"
 */
[[nodiscard]] std::string resolve_application_name(const std::string& configured);

/// configured -> "Unknown"
[[nodiscard]] std::string resolve_version(const std::string& configured);

/// Case-insensitive comparison against "Development"
[[nodiscard]] bool is_development(std::string_view environment);

} // namespace querywatch
