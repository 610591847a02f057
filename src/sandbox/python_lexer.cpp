#include <gradebox/common/error_types.hpp>
#include <gradebox/common/expected.hpp>
#include <gradebox/common/utf8.hpp>
#include <gradebox/logging.hpp>
#include <gradebox/sandbox/python_lexer.hpp>

#include <fmt/format.h>
#include <gsl/util>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/any_of.hpp>

#include <array>
#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gradebox::python {

namespace {

constexpr int TAB_SIZE = 8;

/// CPython refuses f-strings nested deeper than this
constexpr int MAX_FSTRING_NESTING = 150;

constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

constexpr std::array<std::string_view, 5> THREE_CHAR_OPS = {"**=", "//=", ">>=", "<<=", "..."};

constexpr std::array<std::string_view, 19> TWO_CHAR_OPS = {"->", "**", "//", ">>", "<<", "<=", ">=",
                                                           "==", "!=", ":=", "+=", "-=", "*=", "/=",
                                                           "%=", "&=", "|=", "^=", "@="};

constexpr std::string_view ONE_CHAR_OPS = "+-*/%@&|^~<>()[]{},:;.=";

constexpr std::array<std::string_view, 11> STRING_PREFIXES = {"r",  "u",  "b",  "f",  "t", "br",
                                                              "rb", "fr", "rf", "tr", "rt"};

bool is_ident_start(char chr) {
    auto uchr = static_cast<unsigned char>(chr);
    return std::isalpha(uchr) != 0 || chr == '_' || uchr >= 0x80;
}

bool is_ident_continue(char chr) {
    return is_ident_start(chr) || std::isdigit(static_cast<unsigned char>(chr)) != 0;
}

bool is_digit(char chr) {
    return std::isdigit(static_cast<unsigned char>(chr)) != 0;
}

bool is_quote(char chr) {
    return chr == '"' || chr == '\'';
}

std::string to_lower(std::string_view str) {
    std::string res{str};
    for (char& chr : res) {
        chr = static_cast<char>(std::tolower(static_cast<unsigned char>(chr)));
    }
    return res;
}

bool is_string_prefix(std::string_view word) {
    if (word.size() > 2) {
        return false;
    }
    std::string lowered = to_lower(word);
    return ranges::any_of(STRING_PREFIXES, [&](std::string_view prefix) { return prefix == lowered; });
}

bool prefix_has(std::string_view prefix, char lower_chr) {
    return to_lower(prefix).find(lower_chr) != std::string::npos;
}

char closing_for(char open) {
    switch (open) {
    case '(':
        return ')';
    case '[':
        return ']';
    case '{':
        return '}';
    default:
        UNREACHABLE("not an opening bracket", open);
    }
}

/// The encoding named by a PEP 263 declaration on `line`, if there is one.
/// Equivalent to the regex `^[ \t\f]*#.*?coding[:=][ \t]*([-\w.]+)`
std::optional<std::string_view> find_coding_declaration(std::string_view line) {
    std::size_t idx = line.find_first_not_of(" \t\f");
    if (idx == std::string_view::npos || line[idx] != '#') {
        return std::nullopt;
    }

    constexpr std::string_view keyword = "coding";
    for (std::size_t pos = line.find(keyword, idx); pos != std::string_view::npos;
         pos = line.find(keyword, pos + 1)) {
        std::size_t after = pos + keyword.size();
        if (after >= line.size() || (line[after] != ':' && line[after] != '=')) {
            continue;
        }

        std::size_t begin = line.find_first_not_of(" \t", after + 1);
        if (begin == std::string_view::npos) {
            continue;
        }
        std::size_t end = begin;
        while (end < line.size() && (is_ident_continue(line[end]) || line[end] == '-' || line[end] == '.')) {
            ++end;
        }
        if (end > begin) {
            return line.substr(begin, end - begin);
        }
    }

    return std::nullopt;
}

bool is_utf8_encoding_name(std::string_view name) {
    std::string normal = to_lower(name);
    for (char& chr : normal) {
        if (chr == '_') {
            chr = '-';
        }
    }
    return normal == "utf-8" || normal == "utf8" || normal.starts_with("utf-8-");
}

bool is_blank_or_comment(std::string_view line) {
    std::size_t idx = line.find_first_not_of(" \t\f");
    return idx == std::string_view::npos || line[idx] == '#';
}

struct Bracket
{
    char open;
    int line;
    int column;
};

struct IndentLevel
{
    int col;    ///< tabs advance to the next multiple of TAB_SIZE
    int altcol; ///< tabs count as 1; used to detect ambiguous tab/space mixes
};

class Lexer
{
public:
    explicit Lexer(std::string_view source)
        : src_{source} {}

    Expected<std::vector<Token>, LexError> run() {
        TRY(check_encoding());

        if (src_.starts_with(UTF8_BOM)) {
            pos_ = line_start_ = UTF8_BOM.size();
        }

        indents_.push_back({.col = 0, .altcol = 0});

        while (true) {
            if (at_line_start_) {
                at_line_start_ = false;
                TRY(handle_indentation());
            }

            skip_inline_whitespace();

            if (at_end()) {
                break;
            }

            char chr = peek();

            if (chr == '#') {
                skip_comment();
            } else if (newline_length(pos_) != 0) {
                handle_newline();
            } else if (chr == '\\') {
                TRY(handle_continuation());
            } else if (is_ident_start(chr)) {
                TRY(lex_name_or_string());
            } else if (is_digit(chr) || (chr == '.' && is_digit(peek(1)))) {
                lex_number();
            } else if (is_quote(chr)) {
                TRY(lex_string_token(pos_));
            } else {
                TRY(lex_operator());
            }
        }

        TRY(finish());

        LOG_TRACE("Tokenized {} lines into {} tokens", line_, tokens_.size());

        return std::move(tokens_);
    }

private:
    using Status = Expected<void, LexError>;

    bool at_end() const { return pos_ >= src_.size(); }

    /// '\0' past the end; NUL bytes are rejected up front, so it never appears in the text
    char peek(std::size_t offset = 0) const {
        return pos_ + offset < src_.size() ? src_[pos_ + offset] : '\0';
    }

    int column(std::size_t pos) const { return gsl::narrow_cast<int>(pos - line_start_) + 1; }
    int column() const { return column(pos_); }

    /// Length of the line terminator ("\n", "\r\n" or "\r") at `pos`, or 0 if there is none
    std::size_t newline_length(std::size_t pos) const {
        if (pos >= src_.size()) {
            return 0;
        }
        if (src_[pos] == '\n') {
            return 1;
        }
        if (src_[pos] == '\r') {
            return (pos + 1 < src_.size() && src_[pos + 1] == '\n') ? 2 : 1;
        }
        return 0;
    }

    void consume_newline() {
        pos_ += newline_length(pos_);
        ++line_;
        line_start_ = pos_;
    }

    LexError error_at(int line, int col, std::string message) const {
        return LexError{.line = line, .column = col, .message = std::move(message)};
    }

    LexError error_here(std::string message) const { return error_at(line_, column(), std::move(message)); }

    void emit(TokenKind kind, std::string_view text, int line, int col) {
        tokens_.push_back(Token{.kind = kind, .text = std::string{text}, .line = line, .column = col});

        if (kind != TokenKind::Newline && kind != TokenKind::Indent && kind != TokenKind::Dedent &&
            kind != TokenKind::EndMarker) {
            line_has_tokens_ = true;
        }
    }

    /// 1-based (line, column) of an arbitrary byte offset. Only used for error reporting.
    std::pair<int, int> position_of(std::size_t offset) const {
        int line = 1;
        std::size_t start = 0;
        for (std::size_t i = 0; i < offset; ++i) {
            if (src_[i] == '\n' || (src_[i] == '\r' && (i + 1 >= src_.size() || src_[i + 1] != '\n'))) {
                ++line;
                start = i + 1;
            }
        }
        return {line, gsl::narrow_cast<int>(offset - start) + 1};
    }

    Status check_encoding() const {
        if (auto nul = src_.find('\0'); nul != std::string_view::npos) {
            auto [line, col] = position_of(nul);
            return error_at(line, col, "source code cannot contain null bytes");
        }

        if (auto bad = utf8::find_invalid(src_); bad != std::string_view::npos) {
            auto [line, col] = position_of(bad);
            return error_at(line, col,
                            fmt::format("invalid UTF-8 byte 0x{:02x}", static_cast<unsigned char>(src_[bad])));
        }

        std::string_view rest = src_;
        if (rest.starts_with(UTF8_BOM)) {
            rest.remove_prefix(UTF8_BOM.size());
        }

        for (int line = 1; line <= 2 && !rest.empty(); ++line) {
            std::size_t eol = rest.find_first_of("\r\n");
            std::string_view text = rest.substr(0, eol);

            if (auto name = find_coding_declaration(text); name && !is_utf8_encoding_name(*name)) {
                return error_at(line, 1, fmt::format("unsupported encoding declaration '{}'", *name));
            }

            // A declaration on line 2 only counts if line 1 is blank or a comment
            if (eol == std::string_view::npos || !is_blank_or_comment(text)) {
                break;
            }
            rest.remove_prefix(eol + 1);
        }

        return {};
    }

    void skip_inline_whitespace() {
        while (peek() == ' ' || peek() == '\t' || peek() == '\f') {
            ++pos_;
        }
    }

    void skip_comment() {
        while (!at_end() && newline_length(pos_) == 0) {
            ++pos_;
        }
    }

    Status handle_indentation() {
        int col = 0;
        int altcol = 0;

        for (;; ++pos_) {
            char chr = peek();
            if (chr == ' ') {
                ++col;
                ++altcol;
            } else if (chr == '\t') {
                col = (col / TAB_SIZE + 1) * TAB_SIZE;
                ++altcol;
            } else if (chr == '\f') {
                col = altcol = 0;
            } else {
                break;
            }
        }

        // Blank and comment-only lines don't take part in indentation
        if (at_end() || peek() == '#' || newline_length(pos_) != 0) {
            return {};
        }

        const auto tab_error = [this] { return error_here("inconsistent use of tabs and spaces in indentation"); };
        const auto missing_block = [this] {
            return error_here(fmt::format("expected an indented block after line {}", block_line_));
        };

        const IndentLevel top = indents_.back();

        if (col == top.col) {
            if (altcol != top.altcol) {
                return tab_error();
            }
            if (pending_block_) {
                return missing_block();
            }
        } else if (col > top.col) {
            if (altcol <= top.altcol) {
                return tab_error();
            }
            if (!pending_block_) {
                return error_here("unexpected indent");
            }
            indents_.push_back({.col = col, .altcol = altcol});
            emit(TokenKind::Indent, "", line_, column());
        } else {
            if (pending_block_) {
                return missing_block();
            }
            while (indents_.size() > 1 && col < indents_.back().col) {
                indents_.pop_back();
                emit(TokenKind::Dedent, "", line_, column());
            }
            if (col != indents_.back().col) {
                return error_here("unindent does not match any outer indentation level");
            }
            if (altcol != indents_.back().altcol) {
                return tab_error();
            }
        }

        pending_block_ = false;
        return {};
    }

    void handle_newline() {
        // Inside brackets, a line break is just whitespace
        if (!brackets_.empty()) {
            consume_newline();
            return;
        }

        if (line_has_tokens_) {
            end_logical_line();
        }

        consume_newline();
        at_line_start_ = true;
    }

    void end_logical_line() {
        DEBUG_ASSERT(!tokens_.empty());

        pending_block_ = tokens_.back().is_op(":");
        block_line_ = tokens_.back().line;

        emit(TokenKind::Newline, "", line_, column());
        line_has_tokens_ = false;
    }

    Status handle_continuation() {
        if (newline_length(pos_ + 1) == 0) {
            return error_here("unexpected character after line continuation character");
        }

        ++pos_;
        consume_newline();

        if (at_end()) {
            return error_here("unexpected EOF while parsing");
        }

        return {};
    }

    Status lex_name_or_string() {
        std::size_t start = pos_;
        int col = column();

        while (!at_end() && is_ident_continue(peek())) {
            ++pos_;
        }

        std::string_view word = src_.substr(start, pos_ - start);

        if (is_quote(peek()) && is_string_prefix(word)) {
            return lex_string_token(start);
        }

        emit(TokenKind::Name, word, line_, col);
        return {};
    }

    void lex_number() {
        std::size_t start = pos_;
        int col = column();
        bool hex = peek() == '0' && (peek(1) == 'x' || peek(1) == 'X');

        while (!at_end()) {
            char chr = peek();
            if (!hex && (chr == 'e' || chr == 'E') && (peek(1) == '+' || peek(1) == '-')) {
                pos_ += 2;
            } else if (is_ident_continue(chr) || chr == '.') {
                ++pos_;
            } else {
                break;
            }
        }

        emit(TokenKind::Number, src_.substr(start, pos_ - start), line_, col);
    }

    /// `start` is the first character of the literal (its prefix, if any); the quote is at `pos_`
    Status lex_string_token(std::size_t start) {
        int line = line_;
        int col = column(start);

        TRY(scan_string(src_.substr(start, pos_ - start)));

        emit(TokenKind::String, src_.substr(start, pos_ - start), line, col);
        return {};
    }

    LexError unterminated(bool is_fstring, bool triple, int line, int col) const {
        std::string_view kind = triple ? "triple-quoted " : "";
        std::string_view what = is_fstring ? "f-string" : "string";
        return error_at(line, col, fmt::format("unterminated {}{} literal (detected at line {})", kind, what, line_));
    }

    struct StringContext
    {
        char quote;
        bool triple;
        bool is_fstring;
        int line;
        int column;
    };

    bool at_closing_quote(const StringContext& ctx) const {
        return peek() == ctx.quote && (!ctx.triple || (peek(1) == ctx.quote && peek(2) == ctx.quote));
    }

    /// Scan a string literal whose opening quote is at `pos_`, leaving `pos_` just past its end.
    /// f-strings are scanned through their replacement fields, which may hold further strings.
    Status scan_string(std::string_view prefix) {
        const bool raw = prefix_has(prefix, 'r');
        const bool is_fstring = prefix_has(prefix, 'f') || prefix_has(prefix, 't');

        const StringContext ctx{.quote = peek(),
                                .triple = peek(1) == peek() && peek(2) == peek(),
                                .is_fstring = is_fstring,
                                .line = line_,
                                .column = column()};

        const int depth_step = is_fstring ? 1 : 0;
        fstring_depth_ += depth_step;
        auto restore_depth = gsl::finally([this, depth_step] { fstring_depth_ -= depth_step; });

        if (fstring_depth_ > MAX_FSTRING_NESTING) {
            return error_here("too many nested f-strings");
        }

        pos_ += ctx.triple ? 3 : 1;

        while (true) {
            if (at_end()) {
                return unterminated(is_fstring, ctx.triple, ctx.line, ctx.column);
            }

            if (at_closing_quote(ctx)) {
                pos_ += ctx.triple ? 3 : 1;
                return {};
            }

            if (newline_length(pos_) != 0) {
                if (!ctx.triple) {
                    return unterminated(is_fstring, false, ctx.line, ctx.column);
                }
                consume_newline();
                continue;
            }

            char chr = peek();

            if (chr == '\\') {
                if (is_fstring && !raw && peek(1) == 'N' && peek(2) == '{') {
                    // \N{NAME}: the braces belong to the escape, not to a replacement field
                    pos_ += 3;
                    while (!at_end() && peek() != '}' && !at_closing_quote(ctx) && newline_length(pos_) == 0) {
                        ++pos_;
                    }
                    if (peek() == '}') {
                        ++pos_;
                    }
                } else if (is_fstring && (peek(1) == '{' || peek(1) == '}')) {
                    ++pos_;
                } else {
                    ++pos_;
                    if (newline_length(pos_) != 0) {
                        consume_newline();
                    } else if (!at_end()) {
                        ++pos_;
                    }
                }
                continue;
            }

            if (is_fstring && chr == '{') {
                if (peek(1) == '{') {
                    pos_ += 2;
                    continue;
                }
                ++pos_;
                TRY(scan_replacement_field(ctx));
                continue;
            }

            if (is_fstring && chr == '}') {
                if (peek(1) == '}') {
                    pos_ += 2;
                    continue;
                }
                return error_here("f-string: single '}' is not allowed");
            }

            ++pos_;
        }
    }

    /// Scan an f-string replacement field; `pos_` is just past its '{'
    Status scan_replacement_field(const StringContext& ctx) {
        std::vector<char> nesting;
        bool has_expression = false;

        while (true) {
            if (at_end()) {
                return unterminated(true, ctx.triple, ctx.line, ctx.column);
            }

            if (newline_length(pos_) != 0) {
                if (!ctx.triple) {
                    return unterminated(true, false, ctx.line, ctx.column);
                }
                consume_newline();
                continue;
            }

            char chr = peek();

            if (chr == ' ' || chr == '\t' || chr == '\f') {
                ++pos_;
                continue;
            }

            if (chr == '#') {
                if (!ctx.triple) {
                    return error_here("f-string expression part cannot include '#'");
                }
                skip_comment();
                continue;
            }

            if (chr == '\\') {
                if (!ctx.triple || newline_length(pos_ + 1) == 0) {
                    return error_here("unexpected character after line continuation character");
                }
                ++pos_;
                consume_newline();
                continue;
            }

            if (nesting.empty()) {
                if (chr == '}') {
                    if (!has_expression) {
                        return error_here("f-string: valid expression required before '}'");
                    }
                    ++pos_;
                    return {};
                }

                if (chr == '!' && peek(1) != '=') {
                    if (!has_expression) {
                        return error_here("f-string: valid expression required before '!'");
                    }
                    ++pos_;
                    return scan_conversion(ctx);
                }

                if (chr == ':') {
                    if (!has_expression) {
                        return error_here("f-string: valid expression required before ':'");
                    }
                    ++pos_;
                    return scan_format_spec(ctx);
                }
            }

            has_expression = true;

            if (is_quote(chr)) {
                TRY(scan_string(""));
                continue;
            }

            if (is_ident_start(chr)) {
                std::size_t start = pos_;
                while (!at_end() && is_ident_continue(peek())) {
                    ++pos_;
                }
                std::string_view word = src_.substr(start, pos_ - start);
                if (is_quote(peek()) && is_string_prefix(word)) {
                    TRY(scan_string(word));
                }
                continue;
            }

            if (chr == '(' || chr == '[' || chr == '{') {
                nesting.push_back(chr);
            } else if (chr == ')' || chr == ']' || chr == '}') {
                if (nesting.empty()) {
                    return error_here(fmt::format("f-string: unmatched '{}'", chr));
                }
                if (closing_for(nesting.back()) != chr) {
                    return error_here(fmt::format("f-string: closing parenthesis '{}' does not match opening "
                                                  "parenthesis '{}'",
                                                  chr, nesting.back()));
                }
                nesting.pop_back();
            }

            ++pos_;
        }
    }

    /// `pos_` is just past the '!' of a replacement field
    Status scan_conversion(const StringContext& ctx) {
        std::size_t start = pos_;
        while (!at_end() && is_ident_continue(peek())) {
            ++pos_;
        }

        std::string_view conversion = src_.substr(start, pos_ - start);
        if (conversion.empty()) {
            return error_here("f-string: missing conversion character");
        }
        if (conversion != "s" && conversion != "r" && conversion != "a") {
            return error_at(line_, column(start),
                            fmt::format("f-string: invalid conversion character '{}': expected 's', 'r', or 'a'",
                                        conversion));
        }

        if (peek() == ':') {
            ++pos_;
            return scan_format_spec(ctx);
        }
        if (peek() != '}') {
            return error_here("f-string: expecting '}'");
        }

        ++pos_;
        return {};
    }

    /// `pos_` is just past the ':' of a replacement field. Ends after the field's closing '}'.
    Status scan_format_spec(const StringContext& ctx) {
        while (true) {
            if (at_end()) {
                return unterminated(true, ctx.triple, ctx.line, ctx.column);
            }

            if (newline_length(pos_) != 0) {
                if (!ctx.triple) {
                    return unterminated(true, false, ctx.line, ctx.column);
                }
                consume_newline();
                continue;
            }

            if (at_closing_quote(ctx)) {
                return error_here("f-string: expecting '}'");
            }

            char chr = peek();
            ++pos_;

            if (chr == '{') {
                TRY(scan_replacement_field(ctx));
            } else if (chr == '}') {
                return {};
            } else if (chr == '\\' && !at_end() && newline_length(pos_) == 0) {
                ++pos_;
            }
        }
    }

    Status lex_operator() {
        int col = column();

        const auto match = [this](std::string_view op) { return src_.substr(pos_, op.size()) == op; };

        for (std::string_view op : THREE_CHAR_OPS) {
            if (match(op)) {
                emit(TokenKind::Operator, op, line_, col);
                pos_ += op.size();
                return {};
            }
        }

        for (std::string_view op : TWO_CHAR_OPS) {
            if (match(op)) {
                emit(TokenKind::Operator, op, line_, col);
                pos_ += op.size();
                return {};
            }
        }

        char chr = peek();

        if (ONE_CHAR_OPS.find(chr) == std::string_view::npos) {
            return error_here(
                fmt::format("invalid character '{}' (U+{:04X})", chr, static_cast<unsigned int>(chr)));
        }

        if (chr == '(' || chr == '[' || chr == '{') {
            brackets_.push_back({.open = chr, .line = line_, .column = col});
        } else if (chr == ')' || chr == ']' || chr == '}') {
            if (brackets_.empty()) {
                return error_here(fmt::format("unmatched '{}'", chr));
            }

            const Bracket& open = brackets_.back();
            if (closing_for(open.open) != chr) {
                std::string where = open.line == line_ ? "" : fmt::format(" on line {}", open.line);
                return error_here(fmt::format("closing parenthesis '{}' does not match opening parenthesis '{}'{}",
                                              chr, open.open, where));
            }
            brackets_.pop_back();
        }

        emit(TokenKind::Operator, src_.substr(pos_, 1), line_, col);
        ++pos_;
        return {};
    }

    Status finish() {
        if (!brackets_.empty()) {
            const Bracket& open = brackets_.back();
            return error_at(open.line, open.column, fmt::format("'{}' was never closed", open.open));
        }

        if (line_has_tokens_) {
            end_logical_line();
        }

        if (pending_block_) {
            return error_here(fmt::format("expected an indented block after line {}", block_line_));
        }

        while (indents_.size() > 1) {
            indents_.pop_back();
            emit(TokenKind::Dedent, "", line_, column());
        }

        emit(TokenKind::EndMarker, "", line_, column());
        return {};
    }

    std::string_view src_;
    std::size_t pos_ = 0;
    int line_ = 1;
    std::size_t line_start_ = 0;

    bool at_line_start_ = true;
    bool line_has_tokens_ = false;

    /// The last logical line ended with ':', so the next one must be indented further
    bool pending_block_ = false;
    int block_line_ = 0;

    int fstring_depth_ = 0;

    std::vector<IndentLevel> indents_;
    std::vector<Bracket> brackets_;
    std::vector<Token> tokens_;
};

} // namespace

Expected<std::vector<Token>, LexError> tokenize(std::string_view source) {
    return Lexer{source}.run();
}

} // namespace gradebox::python
