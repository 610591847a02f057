#include "user/program_options.hpp"

#include <gradebox/common/error_types.hpp>
#include <gradebox/common/linux.hpp>
#include <gradebox/sandbox/submission.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace gradebox {

Expected<std::string> ProgramOptions::read_file(const std::filesystem::path& path) {
    // ifstream leaves the reason for a failure in errno
    const auto last_error = [] { return linux::make_error_code(errno != 0 ? errno : EIO); };

    errno = 0;
    std::ifstream file{path, std::ios::binary};

    if (!file) {
        return last_error();
    }

    std::ostringstream contents;
    contents << file.rdbuf();

    if (file.bad()) {
        return last_error();
    }

    return contents.str();
}

std::string ProgramOptions::describe_read_error(const std::filesystem::path& path, const std::error_code& err) {
    return fmt::format("Could not read {:?}: {}", path.string(), err.message());
}

Expected<std::pair<std::string, std::string>, std::string>
ProgramOptions::parse_env_assignment(std::string_view text) {
    const auto eq_pos = text.find('=');

    if (eq_pos == std::string_view::npos) {
        return fmt::format("Environment assignment {:?} is not of the form KEY=VALUE", text);
    }

    return std::pair{std::string{text.substr(0, eq_pos)}, std::string{text.substr(eq_pos + 1)}};
}

Expected<ExecutionPolicy, std::string> ProgramOptions::make_policy() const {
    ExecutionPolicy policy;

    policy.max_seconds = timeout_seconds;
    policy.max_output_bytes = max_output_bytes;
    policy.interpreter = interpreter;
    policy.strip_ansi_escapes = strip_ansi;

    if (!allowed_imports.empty()) {
        policy.allowed_imports = allowed_imports;
    }

    if (stdin_file) {
        auto data = read_file(*stdin_file);
        if (!data) {
            return describe_read_error(*stdin_file, data.error());
        }
        policy.stdin_data = std::move(data).value();
    }

    for (const std::string& assignment : env_assignments) {
        auto [key, value] = TRY(parse_env_assignment(assignment));

        if (policy.extra_environment.contains(key)) {
            return fmt::format("Environment variable {:?} is given more than once", key);
        }

        policy.extra_environment.emplace(std::move(key), std::move(value));
    }

    TRY(policy.validate());

    return policy;
}

Expected<void, std::string> ProgramOptions::validate() {
    // Assume that all enumerators have valid values except for verbosity
    // which we will just clamp to [MIN, MAX]

    constexpr auto MAX_VERBOSITY = VerbosityLevel::Max;
    constexpr auto MIN_VERBOSITY = VerbosityLevel{};

    verbosity = std::clamp(verbosity, MIN_VERBOSITY, MAX_VERBOSITY);

    if (files.empty()) {
        return std::string{"No submission files given"};
    }

    for (const std::string& file : files) {
        TRY(ensure_is_regular_file(file, "Submission file {:?}"));
    }

    if (stdin_file) {
        TRY(ensure_is_regular_file(*stdin_file, "Standard input file {:?}"));
    }

    if (assignment_name.empty()) {
        return std::string{"Assignment name may not be empty"};
    }

    TRY(make_policy());

    return {};
}

} // namespace gradebox
