#include "catch2_custom.hpp"

#include <gradebox/sandbox/python_lexer.hpp>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <string>
#include <string_view>
#include <vector>

using namespace std::literals;
using gradebox::python::LexError;
using gradebox::python::Token;
using gradebox::python::tokenize;
using enum gradebox::python::TokenKind;

namespace {

std::vector<gradebox::python::TokenKind> kinds_of(std::string_view source) {
    auto tokens = tokenize(source);
    REQUIRE(tokens);

    return *tokens | ranges::views::transform([](const Token& tok) { return tok.kind; }) | ranges::to<std::vector>();
}

/// Text of every token that has any (i.e., not Newline/Indent/Dedent/EndMarker)
std::vector<std::string> texts_of(std::string_view source) {
    auto tokens = tokenize(source);
    REQUIRE(tokens);

    std::vector<std::string> texts;
    for (const Token& tok : *tokens) {
        if (!tok.text.empty()) {
            texts.push_back(tok.text);
        }
    }
    return texts;
}

LexError error_of(std::string_view source) {
    auto tokens = tokenize(source);
    REQUIRE(!tokens);

    return tokens.error();
}

} // namespace

TEST_CASE("Tokenize a simple statement") {
    auto tokens = tokenize("import math\n");
    REQUIRE(tokens);

    REQUIRE(tokens->size() == 4);
    REQUIRE(tokens->at(0) == Token{.kind = Name, .text = "import", .line = 1, .column = 1});
    REQUIRE(tokens->at(1) == Token{.kind = Name, .text = "math", .line = 1, .column = 8});
    REQUIRE(tokens->at(2).kind == Newline);
    REQUIRE(tokens->at(3).kind == EndMarker);
}

TEST_CASE("A missing final newline still ends the logical line") {
    REQUIRE(kinds_of("x = 1") == std::vector{Name, Operator, Number, Newline, EndMarker});
    REQUIRE(kinds_of("") == std::vector{EndMarker});
    REQUIRE(kinds_of("# only a comment\n\n") == std::vector{EndMarker});
}

TEST_CASE("Indentation produces Indent and Dedent tokens") {
    REQUIRE(kinds_of("if x:\n    y\nz\n") == std::vector{Name, Name, Operator, Newline, Indent, Name, Newline, Dedent,
                                                        Name, Newline, EndMarker});

    // Dedents are closed at end of input
    REQUIRE(kinds_of("def f():\n    return 1\n") ==
            std::vector{Name, Name, Operator, Operator, Operator, Newline, Indent, Name, Number, Newline, Dedent,
                        EndMarker});

    // Blank and comment-only lines don't count
    REQUIRE(kinds_of("if x:\n\n        # note\n    y\n") ==
            std::vector{Name, Name, Operator, Newline, Indent, Name, Newline, Dedent, EndMarker});
}

TEST_CASE("Line breaks inside brackets and after a backslash are not newlines") {
    REQUIRE(kinds_of("f(1,\n      2)\n") ==
            std::vector{Name, Operator, Number, Operator, Number, Operator, Newline, EndMarker});

    REQUIRE(kinds_of("x = 1 + \\\n        2\n") ==
            std::vector{Name, Operator, Number, Operator, Number, Newline, EndMarker});
}

TEST_CASE("String literals are single tokens") {
    REQUIRE(texts_of(R"(a = 'x' + "y" + b'z' + rb"\d")") ==
            std::vector<std::string>{"a", "=", "'x'", "+", R"("y")", "+", "b'z'", "+", R"(rb"\d")"});

    auto tokens = tokenize("s = '''one\ntwo'''\nt = 1\n");
    REQUIRE(tokens);
    REQUIRE(tokens->at(2) == Token{.kind = String, .text = "'''one\ntwo'''", .line = 1, .column = 5});
    REQUIRE(tokens->at(4) == Token{.kind = Name, .text = "t", .line = 3, .column = 1});

    // Escaped quotes don't end the literal
    REQUIRE(texts_of(R"(s = 'it\'s')") == std::vector<std::string>{"s", "=", R"('it\'s')"});
}

TEST_CASE("f-strings are scanned through their replacement fields") {
    REQUIRE(texts_of(R"(f"{x}")") == std::vector<std::string>{R"(f"{x}")"});

    // Reusing the enclosing quote inside a replacement field is valid since Python 3.12
    REQUIRE(texts_of(R"(f"{'a' + "b"}")") == std::vector<std::string>{R"(f"{'a' + "b"}")"});

    REQUIRE(texts_of(R"(f"{x:{width}.{prec}f} {{literal}} {y!r:>10}")").size() == 1);
    REQUIRE(texts_of(R"(f"{d['key']}")").size() == 1);
    REQUIRE(texts_of(R"(f"{x == 1!s}")").size() == 1);

    // Triple-quoted f-strings may span lines inside a replacement field
    REQUIRE(kinds_of("f'''{\n  x\n}'''\n") == std::vector{String, Newline, EndMarker});
}

TEST_CASE("Operators use longest match") {
    REQUIRE(texts_of("a **= b // c -> d ... e := f != g") ==
            std::vector<std::string>{"a", "**=", "b", "//", "c", "->", "d", "...", "e", ":=", "f", "!=", "g"});
}

TEST_CASE("Number literals") {
    REQUIRE(texts_of("1e-5 0x1F 3.14j 1_000 .5") ==
            std::vector<std::string>{"1e-5", "0x1F", "3.14j", "1_000", ".5"});
}

TEST_CASE("A UTF-8 byte order mark is skipped") {
    auto tokens = tokenize("\xEF\xBB\xBFx = 1\n");
    REQUIRE(tokens);
    REQUIRE(tokens->at(0) == Token{.kind = Name, .text = "x", .line = 1, .column = 1});
}

TEST_CASE("Bracket errors") {
    REQUIRE(error_of("x = (1,\n") == LexError{.line = 1, .column = 5, .message = "'(' was never closed"});
    REQUIRE(error_of(")") == LexError{.line = 1, .column = 1, .message = "unmatched ')'"});
    REQUIRE(error_of("(]").message == "closing parenthesis ']' does not match opening parenthesis '('");
    REQUIRE(error_of("[\n)").message == "closing parenthesis ')' does not match opening parenthesis '[' on line 1");
}

TEST_CASE("Unterminated strings") {
    REQUIRE(error_of("s = 'abc\n") ==
            LexError{.line = 1, .column = 5, .message = "unterminated string literal (detected at line 1)"});
    REQUIRE(error_of("s = '''abc\n") ==
            LexError{.line = 1, .column = 5, .message = "unterminated triple-quoted string literal (detected at line 2)"});
    REQUIRE(error_of("f'{x\n}'").message == "unterminated f-string literal (detected at line 1)");
}

TEST_CASE("Indentation errors") {
    REQUIRE(error_of("if x:\ny\n") ==
            LexError{.line = 2, .column = 1, .message = "expected an indented block after line 1"});
    REQUIRE(error_of("if x:\n") == LexError{.line = 2, .column = 1, .message = "expected an indented block after line 1"});
    REQUIRE(error_of("x\n  y\n") == LexError{.line = 2, .column = 3, .message = "unexpected indent"});
    REQUIRE(error_of("if x:\n    a\n  b\n").message == "unindent does not match any outer indentation level");
    REQUIRE(error_of("if x:\n\ta\n        b\n").message == "inconsistent use of tabs and spaces in indentation");
}

TEST_CASE("Line continuation errors") {
    REQUIRE(error_of("x = 1 \\ + 2\n").message == "unexpected character after line continuation character");
    REQUIRE(error_of("x = \\\n").message == "unexpected EOF while parsing");
}

TEST_CASE("Characters that cannot start a token") {
    REQUIRE(error_of("x = $") == LexError{.line = 1, .column = 5, .message = "invalid character '$' (U+0024)"});
    REQUIRE(error_of("a ? b").message == "invalid character '?' (U+003F)");
}

TEST_CASE("Binary junk is rejected before tokenizing") {
    REQUIRE(error_of("x = 1\n\0y"sv) ==
            LexError{.line = 2, .column = 1, .message = "source code cannot contain null bytes"});
    REQUIRE(error_of("x = '\xff'") == LexError{.line = 1, .column = 6, .message = "invalid UTF-8 byte 0xff"});

    // Overlong encoding of '/'
    REQUIRE(error_of("x = '\xC0\xAF'").message == "invalid UTF-8 byte 0xc0");
}

TEST_CASE("Coding declarations") {
    REQUIRE(tokenize("# -*- coding: utf-8 -*-\nx = 1\n"));
    REQUIRE(tokenize("#!/usr/bin/env python3\n# vim: set fileencoding=utf8 :\n"));

    REQUIRE(error_of("# -*- coding: latin-1 -*-\nx = 1\n") ==
            LexError{.line = 1, .column = 1, .message = "unsupported encoding declaration 'latin-1'"});
    REQUIRE(error_of("#!/usr/bin/env python3\n# coding=cp1252\n") ==
            LexError{.line = 2, .column = 1, .message = "unsupported encoding declaration 'cp1252'"});

    // Only counts on line 2 if line 1 is a comment or blank
    REQUIRE(tokenize("x = 1\n# coding: latin-1\n"));
}

TEST_CASE("f-string replacement field errors") {
    REQUIRE(error_of(R"(f"{}")").message == "f-string: valid expression required before '}'");
    REQUIRE(error_of(R"(f"}")").message == "f-string: single '}' is not allowed");
    REQUIRE(error_of(R"(f"{x!z}")").message == "f-string: invalid conversion character 'z': expected 's', 'r', or 'a'");
    REQUIRE(error_of(R"(f"{x!}")").message == "f-string: missing conversion character");
    REQUIRE(error_of(R"(f"{x#}")").message == "f-string expression part cannot include '#'");
    REQUIRE(error_of(R"(f"{x)}")").message == "f-string: unmatched ')'");
}

TEST_CASE("Deeply nested f-strings are rejected") {
    std::string source;
    std::string closing;
    for (int i = 0; i < 200; ++i) {
        source += "f'{";
        closing += "}'";
    }
    source += "x" + closing;

    REQUIRE(error_of(source).message == "too many nested f-strings");
}
