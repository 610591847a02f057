#pragma once

#include <gradebox/common/expected.hpp>

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace gradebox {

struct ExecutionPolicy;

/// The complete environment of a child process. Ordered, so that the same policy always yields
/// the same `envp` array.
using EnvironmentMap = std::map<std::string, std::string, std::less<>>;

/// Variables every child receives. Nothing else from this process is ever passed on.
inline constexpr std::string_view BASELINE_PATH = "/usr/local/bin:/usr/bin:/bin";
inline constexpr std::string_view BASELINE_LOCALE = "C.UTF-8";
inline constexpr std::string_view BASELINE_HOME = "/nonexistent";

/// Build the child environment for `policy`: the fixed baseline plus `policy.extra_environment`.
/// Pure; never consults the environment of the current process.
///
/// `policy.extra_environment` must already be valid (see `validate_extra_environment`)
EnvironmentMap build_environment(const ExecutionPolicy& policy);

/// Check user-supplied variables: names must be non-empty, contain no '=' or NUL, and must not
/// override a baseline variable; values must not contain NUL.
Expected<void, std::string> validate_extra_environment(const std::map<std::string, std::string>& extra);

/// Whether `name` is one of the variables `build_environment` always sets
bool is_baseline_variable(std::string_view name);

/// "KEY=VALUE" strings in map order, suitable for building an `envp` array
std::vector<std::string> to_env_strings(const EnvironmentMap& env);

} // namespace gradebox
