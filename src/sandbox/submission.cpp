#include <gradebox/sandbox/environment.hpp>
#include <gradebox/sandbox/submission.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/find.hpp>

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace gradebox {

namespace {

/// ASCII Python identifier: [A-Za-z_][A-Za-z0-9_]*
bool is_identifier(std::string_view name) {
    if (name.empty()) {
        return false;
    }

    auto is_start = [](unsigned char chr) { return std::isalpha(chr) != 0 || chr == '_'; };
    auto is_continue = [](unsigned char chr) { return std::isalnum(chr) != 0 || chr == '_'; };

    return is_start(static_cast<unsigned char>(name.front())) &&
           ranges::all_of(name.substr(1), [&](char chr) { return is_continue(static_cast<unsigned char>(chr)); });
}

} // namespace

std::vector<std::string> ExecutionPolicy::default_allowed_imports() {
    // The grading course's library list, without `os` (process and filesystem control)
    // and `requests` (network access)
    return {"json", "openpyxl", "pandas", "numpy", "matplotlib", "math", "random", "datetime", "re"};
}

bool ExecutionPolicy::allows_import(std::string_view top_level_module) const {
    return ranges::any_of(allowed_imports, [top_level_module](const std::string& name) {
        return name == top_level_module;
    });
}

Expected<void, std::string> ExecutionPolicy::validate() const {
    if (max_seconds < 1 || max_seconds > MAX_SECONDS_LIMIT) {
        return fmt::format("max_seconds must be in [1, {}], got {}", MAX_SECONDS_LIMIT, max_seconds);
    }

    if (max_output_bytes == 0 || max_output_bytes > MAX_OUTPUT_BYTES_LIMIT) {
        return fmt::format("max_output_bytes must be in [1, {}], got {}", MAX_OUTPUT_BYTES_LIMIT, max_output_bytes);
    }

    for (std::size_t i = 0; i < allowed_imports.size(); ++i) {
        const auto& name = allowed_imports[i];

        if (!is_identifier(name)) {
            return fmt::format("allowed_imports[{}] = {:?} is not a top-level module name", i, name);
        }

        auto first = ranges::find(allowed_imports, name);
        if (first != allowed_imports.begin() + static_cast<std::ptrdiff_t>(i)) {
            return fmt::format("allowed_imports lists {:?} more than once", name);
        }
    }

    if (interpreter.empty() || interpreter.front() != '/') {
        return fmt::format("interpreter must be an absolute path, got {:?}", interpreter);
    }
    if (interpreter.find('\0') != std::string::npos) {
        return std::string{"interpreter path must not contain NUL bytes"};
    }

    if (auto res = validate_extra_environment(extra_environment); !res) {
        return res.error();
    }

    return {};
}

} // namespace gradebox
