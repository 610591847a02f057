#include <gradebox/common/error_types.hpp>
#include <gradebox/logging.hpp>
#include <gradebox/sandbox/policy_checker.hpp>
#include <gradebox/sandbox/python_lexer.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <gsl/util>
#include <range/v3/algorithm/any_of.hpp>

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gradebox {

namespace {

using python::LexError;
using python::Token;
using python::TokenKind;

constexpr std::array<std::string_view, 1> ALWAYS_PERMITTED = {"__future__"};

/// Walks a token stream and collects the modules named by every import statement
class ImportScanner
{
public:
    explicit ImportScanner(const std::vector<Token>& tokens)
        : tokens_{tokens} {}

    Expected<std::vector<ImportRecord>, LexError> run() {
        bool statement_start = true;
        int bracket_depth = 0;

        while (current().kind != TokenKind::EndMarker) {
            const Token& tok = current();

            if (statement_start && tok.is_name("import")) {
                TRY(parse_import());
                continue;
            }

            if (statement_start && tok.is_name("from")) {
                TRY(parse_from());
                continue;
            }

            if (tok.is_name("import")) {
                return malformed(tok, "'import' outside of an import statement");
            }

            if (tok.is_op("(") || tok.is_op("[") || tok.is_op("{")) {
                ++bracket_depth;
            } else if (tok.is_op(")") || tok.is_op("]") || tok.is_op("}")) {
                --bracket_depth;
            }

            // A ':' outside brackets ends a compound statement header; a simple statement may follow it
            statement_start = tok.kind == TokenKind::Newline || tok.kind == TokenKind::Indent ||
                              tok.kind == TokenKind::Dedent || tok.is_op(";") ||
                              (tok.is_op(":") && bracket_depth == 0);
            advance();
        }

        return std::move(records_);
    }

private:
    using Status = Expected<void, LexError>;

    const Token& current() const { return tokens_[idx_]; }

    void advance() {
        // EndMarker is always last; never step past it
        if (idx_ + 1 < tokens_.size()) {
            ++idx_;
        }
    }

    static LexError malformed(const Token& at, std::string_view what) {
        return LexError{.line = at.line, .column = at.column, .message = fmt::format("invalid syntax: {}", what)};
    }

    /// `dotted_name: NAME ('.' NAME)*`
    Expected<std::string, LexError> parse_dotted_name() {
        if (current().kind != TokenKind::Name) {
            return malformed(current(), "expected a module name");
        }

        std::string name = current().text;
        advance();

        while (current().is_op(".")) {
            advance();
            if (current().kind != TokenKind::Name) {
                return malformed(current(), "expected a name after '.'");
            }
            name += '.';
            name += current().text;
            advance();
        }

        return name;
    }

    /// Optional `as NAME`
    Status parse_alias() {
        if (!current().is_name("as")) {
            return {};
        }
        advance();
        if (current().kind != TokenKind::Name) {
            return malformed(current(), "expected a name after 'as'");
        }
        advance();
        return {};
    }

    /// Statement must end here. Consumes ';' or Newline, so the next token starts a statement.
    Status expect_statement_end() {
        const Token& tok = current();

        if (tok.kind == TokenKind::EndMarker) {
            return {};
        }
        if (tok.kind == TokenKind::Newline || tok.is_op(";")) {
            advance();
            return {};
        }

        return malformed(tok, fmt::format("unexpected {:?} in import statement", tok.text));
    }

    /// `import dotted_name [as NAME] (',' dotted_name [as NAME])*`
    Status parse_import() {
        int line = current().line;
        advance();

        while (true) {
            std::string name = TRY(parse_dotted_name());
            records_.push_back({.module = std::move(name), .level = 0, .line = line});

            TRY(parse_alias());

            if (!current().is_op(",")) {
                break;
            }
            advance();
        }

        return expect_statement_end();
    }

    /// `from ('.'* dotted_name | '.'+) import ('*' | '(' names [','] ')' | names)`
    Status parse_from() {
        const Token& from_tok = current();
        int line = from_tok.line;
        advance();

        int level = 0;
        while (current().is_op(".") || current().is_op("...")) {
            level += gsl::narrow_cast<int>(current().text.size());
            advance();
        }

        std::string module;
        if (current().kind == TokenKind::Name && !current().is_name("import")) {
            module = TRY(parse_dotted_name());
        } else if (level == 0) {
            return malformed(current(), "expected a module name after 'from'");
        }

        if (!current().is_name("import")) {
            return malformed(current(), "expected 'import'");
        }
        advance();

        records_.push_back({.module = std::move(module), .level = level, .line = line});

        if (current().is_op("*")) {
            advance();
            return expect_statement_end();
        }

        const bool parenthesized = current().is_op("(");
        if (parenthesized) {
            advance();
        }

        while (true) {
            if (current().kind != TokenKind::Name) {
                return malformed(current(), "expected a name to import");
            }
            advance();
            TRY(parse_alias());

            if (!current().is_op(",")) {
                break;
            }
            advance();

            // Only a parenthesized list may end with a trailing comma
            if (parenthesized && current().is_op(")")) {
                break;
            }
        }

        if (parenthesized) {
            if (!current().is_op(")")) {
                return malformed(current(), "expected ')'");
            }
            advance();
        }

        return expect_statement_end();
    }

    const std::vector<Token>& tokens_;
    std::size_t idx_ = 0;
    std::vector<ImportRecord> records_;
};

std::string describe_violation(const ImportRecord& record) {
    if (record.is_relative()) {
        return fmt::format("line {}: relative import '{}{}' is not allowed", record.line,
                           std::string(gsl::narrow_cast<std::size_t>(record.level), '.'), record.module);
    }

    if (record.top_level() == record.module) {
        return fmt::format("line {}: import of '{}' is not allowed", record.line, record.module);
    }

    return fmt::format("line {}: import of '{}' is not allowed (module '{}' is not on the allow-list)", record.line,
                       record.module, record.top_level());
}

} // namespace

PolicyVerdict PolicyVerdict::make_unparseable(const python::LexError& error) {
    return {Kind::Unparseable, {}, {fmt::format("unparseable source: {}", error)}};
}

bool is_always_permitted(std::string_view top_level_module) {
    return ranges::any_of(ALWAYS_PERMITTED, [&](std::string_view name) { return name == top_level_module; });
}

Expected<std::vector<ImportRecord>, LexError> find_imports(std::string_view source) {
    auto tokens = TRY(python::tokenize(source));

    return ImportScanner{tokens}.run();
}

PolicyVerdict check(const SubmissionSource& source, const ExecutionPolicy& policy) {
    auto imports = find_imports(source.text());

    if (!imports) {
        LOG_DEBUG("Submission from {:?} for {:?} is unparseable: {}", source.student_id(), source.assignment_id(),
                  imports.error());
        return PolicyVerdict::make_unparseable(imports.error());
    }

    std::vector<std::string> reasons;

    for (const ImportRecord& record : imports.value()) {
        const bool permitted = policy.allows_import(record.top_level()) || is_always_permitted(record.top_level());

        // A single-file submission has no package for a relative import to resolve against
        if (record.is_relative() || !permitted) {
            reasons.push_back(describe_violation(record));
        }
    }

    if (!reasons.empty()) {
        LOG_DEBUG("Submission from {:?} for {:?} violates policy: {}", source.student_id(), source.assignment_id(),
                  fmt::join(reasons, "; "));
        return PolicyVerdict::make_disallowed(std::move(imports).value(), std::move(reasons));
    }

    return PolicyVerdict::make_allowed(std::move(imports).value());
}

} // namespace gradebox
