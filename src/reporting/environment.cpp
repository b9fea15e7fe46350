#include "reporting/environment.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>

namespace querywatch {

namespace {

std::string getenv_or_empty(std::string_view name) {
    const char* value = std::getenv(std::string(name).c_str());
    return value ? utils::trim(value) : std::string{};
}

} // anonymous namespace

std::string resolve_environment(const std::string& configured) {
    if (const auto trimmed = utils::trim(configured); !trimmed.empty()) {
        return trimmed;
    }
    if (auto from_env = getenv_or_empty(env::kEnvironmentVar); !from_env.empty()) {
        return from_env;
    }
    return std::string(env::kProduction);
}

std::string resolve_application_name(const std::string& configured) {
    if (const auto trimmed = utils::trim(configured); !trimmed.empty()) {
        return trimmed;
    }
    if (auto from_env = getenv_or_empty(env::kApplicationNameVar); !from_env.empty()) {
        return from_env;
    }

    std::error_code ec;
    const auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec && !exe.filename().empty()) {
        return exe.filename().string();
    }
    return std::string(env::kUnknown);
}

std::string resolve_version(const std::string& configured) {
    if (const auto trimmed = utils::trim(configured); !trimmed.empty()) {
        return trimmed;
    }
    return std::string(env::kUnknown);
}

bool is_development(std::string_view environment) {
    return utils::iequals(environment, env::kDevelopment);
}

} // namespace querywatch
