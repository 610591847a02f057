#pragma once

#include <gradebox/common/expected.hpp>
#include <gradebox/sandbox/python_lexer.hpp>
#include <gradebox/sandbox/submission.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gradebox {

/// One module named by an import statement
struct ImportRecord
{
    /// Dotted module name as written, without leading dots. Empty for `from . import x`.
    std::string module;

    /// Number of leading dots; non-zero means a relative import
    int level = 0;

    int line = 0;

    /// First component of `module`, which is what the allow-list is checked against
    std::string_view top_level() const { return std::string_view{module}.substr(0, module.find('.')); }

    bool is_relative() const { return level > 0; }

    bool operator==(const ImportRecord&) const = default;
};

/// The result of statically checking a submission against an ExecutionPolicy
class PolicyVerdict
{
public:
    enum class Kind { Allowed, DisallowedImport, Unparseable };

    static PolicyVerdict make_allowed(std::vector<ImportRecord> imports) {
        return {Kind::Allowed, std::move(imports), {}};
    }

    static PolicyVerdict make_disallowed(std::vector<ImportRecord> imports, std::vector<std::string> reasons) {
        return {Kind::DisallowedImport, std::move(imports), std::move(reasons)};
    }

    static PolicyVerdict make_unparseable(const python::LexError& error);

    Kind get_kind() const { return kind_; }

    bool is_violation() const { return kind_ != Kind::Allowed; }

    /// Every import found, in source order. Empty if the source was unparseable.
    const std::vector<ImportRecord>& get_imports() const { return imports_; }

    /// One human-readable line per problem. Empty iff the verdict is Allowed.
    const std::vector<std::string>& get_reasons() const { return reasons_; }

private:
    PolicyVerdict(Kind kind, std::vector<ImportRecord> imports, std::vector<std::string> reasons)
        : kind_{kind}
        , imports_{std::move(imports)}
        , reasons_{std::move(reasons)} {}

    Kind kind_;
    std::vector<ImportRecord> imports_;
    std::vector<std::string> reasons_;
};

constexpr std::string_view format_as(PolicyVerdict::Kind kind) {
    switch (kind) {
    case PolicyVerdict::Kind::Allowed:
        return "Allowed";
    case PolicyVerdict::Kind::DisallowedImport:
        return "DisallowedImport";
    case PolicyVerdict::Kind::Unparseable:
        return "Unparseable";
    default:
        return "<unknown>";
    }
}

/// Modules any submission may import regardless of policy
bool is_always_permitted(std::string_view top_level_module);

/// List every import statement in `source`, wherever it appears (module level, function bodies,
/// conditionals, `try` blocks). Fails on any lexical error or malformed import statement.
///
/// Imports assembled at run time (`__import__("o" + "s")`, `importlib.import_module`, `exec`)
/// are invisible here.
Expected<std::vector<ImportRecord>, python::LexError> find_imports(std::string_view source);

/// Decide whether `source` may run under `policy`. Never executes anything.
PolicyVerdict check(const SubmissionSource& source, const ExecutionPolicy& policy);

} // namespace gradebox
