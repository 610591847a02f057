#pragma once

#include <gradebox/common/expected.hpp>

#include <fmt/format.h>

#include <string>
#include <string_view>
#include <vector>

namespace gradebox::python {

enum class TokenKind { Name, Number, String, Operator, Newline, Indent, Dedent, EndMarker };

constexpr std::string_view format_as(TokenKind kind) {
    switch (kind) {
    case TokenKind::Name:
        return "Name";
    case TokenKind::Number:
        return "Number";
    case TokenKind::String:
        return "String";
    case TokenKind::Operator:
        return "Operator";
    case TokenKind::Newline:
        return "Newline";
    case TokenKind::Indent:
        return "Indent";
    case TokenKind::Dedent:
        return "Dedent";
    case TokenKind::EndMarker:
        return "EndMarker";
    default:
        return "<unknown>";
    }
}

struct Token
{
    TokenKind kind;

    /// Exact source text. Empty for Newline, Indent, Dedent and EndMarker.
    std::string text;

    /// 1-based line and byte column of the first character
    int line;
    int column;

    bool is(TokenKind k, std::string_view txt) const { return kind == k && text == txt; }
    bool is_op(std::string_view op) const { return is(TokenKind::Operator, op); }
    bool is_name(std::string_view name) const { return is(TokenKind::Name, name); }

    bool operator==(const Token&) const = default;

    friend std::string format_as(const Token& from) {
        return fmt::format("{}({:?}) @ {}:{}", from.kind, from.text, from.line, from.column);
    }
};

/// The first lexical problem found in a source text, positioned like a Python SyntaxError
struct LexError
{
    int line;
    int column;
    std::string message;

    bool operator==(const LexError&) const = default;

    friend std::string format_as(const LexError& from) {
        return fmt::format("line {}, column {}: {}", from.line, from.column, from.message);
    }
};

/// Split Python 3 source text into tokens without evaluating any of it.
///
/// Comments and blank lines produce no tokens. Newline tokens mark the end of each logical
/// line; Indent/Dedent tokens bracket indented blocks. The returned sequence always ends with
/// EndMarker.
///
/// Anything the interpreter's own tokenizer would reject (and a few structural problems it leaves
/// to the parser, like a missing indented block) is reported as a LexError instead.
Expected<std::vector<Token>, LexError> tokenize(std::string_view source);

} // namespace gradebox::python
