#include <gradebox/logging.hpp>
#include <gradebox/sandbox/environment.hpp>
#include <gradebox/sandbox/submission.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace gradebox {

namespace {

constexpr std::array<std::string_view, 4> BASELINE_VARIABLES = {"HOME", "LANG", "LC_ALL", "PATH"};

} // namespace

bool is_baseline_variable(std::string_view name) {
    return ranges::any_of(BASELINE_VARIABLES, [name](std::string_view var) { return var == name; });
}

EnvironmentMap build_environment(const ExecutionPolicy& policy) {
    EnvironmentMap env{
        {"PATH", std::string{BASELINE_PATH}},
        {"LANG", std::string{BASELINE_LOCALE}},
        {"LC_ALL", std::string{BASELINE_LOCALE}},
        {"HOME", std::string{BASELINE_HOME}},
    };

    for (const auto& [name, value] : policy.extra_environment) {
        // emplace never overwrites a baseline value
        if (!env.emplace(name, value).second) {
            LOG_WARN("Ignoring extra environment variable {:?} that overrides the baseline", name);
        }
    }

    LOG_TRACE("Built child environment with {} variables", env.size());

    return env;
}

Expected<void, std::string> validate_extra_environment(const std::map<std::string, std::string>& extra) {
    for (const auto& [name, value] : extra) {
        if (name.empty()) {
            return std::string{"environment variable names must not be empty"};
        }
        if (name.find('=') != std::string::npos) {
            return fmt::format("environment variable name {:?} must not contain '='", name);
        }
        if (name.find('\0') != std::string::npos || value.find('\0') != std::string::npos) {
            return fmt::format("environment variable {:?} must not contain NUL bytes", name);
        }
        if (is_baseline_variable(name)) {
            return fmt::format("environment variable {:?} is fixed by the sandbox and cannot be overridden", name);
        }
    }

    return {};
}

std::vector<std::string> to_env_strings(const EnvironmentMap& env) {
    return env | ranges::views::transform([](const auto& entry) {
               return fmt::format("{}={}", entry.first, entry.second);
           }) |
           ranges::to<std::vector<std::string>>();
}

} // namespace gradebox
