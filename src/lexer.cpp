#include "lexer.hpp"

#include <array>

// The std::is* functions are locale dependent and UB for negative chars;
// NASM source is ASCII as far as the grammar is concerned.
static bool is_digit(char c) { return c >= '0' && c <= '9'; }
static bool is_alpha(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }
static bool is_alnum(char c) { return is_alpha(c) || is_digit(c); }

static bool is_symbol_start(char c) { return is_alpha(c) || c == '_' || c == '.'; }
static bool is_symbol_char(char c) { return is_alnum(c) || c == '_' || c == '.' || c == '$'; }
static bool is_macro_call_char(char c) { return is_alnum(c) || c == '_' || c == '.'; }
static bool is_blank(char c) { return c == ' ' || c == '\t' || c == '\f' || c == '\r'; }

template<typename Pred>
static usize run_length(std::string_view str, usize start, Pred pred) {
    usize end = start;
    while (end < str.length() && pred(str[end])) end += 1;
    return end - start;
}

static bool punctuation_type(char c, TokenType &out) {
    switch (c) {
        case ':': out = TokenType::COLON; return true;
        case ',': out = TokenType::COMMA; return true;
        case '[': out = TokenType::LEFT_BRACKET; return true;
        case ']': out = TokenType::RIGHT_BRACKET; return true;
        case '+': out = TokenType::PLUS; return true;
        case '-': out = TokenType::MINUS; return true;
        case '*': out = TokenType::ASTERISK; return true;
        case '/': out = TokenType::SLASH; return true;
        case '~': out = TokenType::BIT_NOT; return true;
        case '|': out = TokenType::BIT_OR; return true;
        case '^': out = TokenType::BIT_XOR; return true;
        case '&': out = TokenType::BIT_AND; return true;
        case '(': out = TokenType::LEFT_PAREN; return true;
        case ')': out = TokenType::RIGHT_PAREN; return true;
        default: return false;
    }
}

static bool is_register(std::string_view word) {
    if (word.length() < 2 || word[0] != 'r') return false;
    for (usize i = 1; i < word.length(); ++i) {
        if (!is_digit(word[i])) return false;
    }
    return true;
}

// Identifier-shaped text: exact keywords and mnemonics win over the generic
// patterns, so `mov` is a mnemonic but `move` is a symbol.
static TokenType classify_word(std::string_view word) {
    if (auto keyword = keyword_type(word)) return *keyword;
    if (is_register(word)) return TokenType::REGISTER;
    return TokenType::SYMBOL;
}

// Length of a quoted string starting at `start`, or 0 if it is unterminated.
// Strings do not span lines.
static usize string_length(std::string_view str, usize start) {
    const char quote = str[start];
    usize i = start + 1;
    while (i < str.length() && str[i] != '\n') {
        if (str[i] == '\\') {
            if (i + 1 >= str.length() || str[i + 1] == '\n') return 0;
            i += 2;
            continue;
        }
        if (str[i] == quote) return i + 1 - start;
        i += 1;
    }
    return 0;
}

// Length and kind of the token at `start`, false if nothing matches.
// Whitespace matches with skip = true.
static bool match_token(std::string_view src, usize start, TokenType &type, usize &len, bool &skip) {
    static constexpr std::array<std::string_view, 4> DIRECTIVES = {
        "%endmacro", "%include", "%define", "%macro"
    };

    const char c = src[start];
    skip = false;

    if (is_blank(c)) {
        len = run_length(src, start, is_blank);
        skip = true;
        return true;
    }

    if (c == '\n') {
        type = TokenType::NEWLINE;
        len = 1;
        return true;
    }

    if (c == ';') {
        type = TokenType::COMMENT;
        len = run_length(src, start, [](char ch) { return ch != '\n'; });
        return true;
    }

    if (is_symbol_start(c)) {
        len = 1 + run_length(src, start + 1, is_symbol_char);
        type = classify_word(src.substr(start, len));
        return true;
    }

    if (is_digit(c)) {
        type = TokenType::NUMBER;
        len = run_length(src, start, is_digit);
        return true;
    }

    if (c == '$') {
        len = 1 + run_length(src, start + 1, is_macro_call_char);
        type = len > 1 ? TokenType::MACRO_CALL : TokenType::CURRENT_POSITION;
        return true;
    }

    if (c == '%') {
        const auto rest = src.substr(start);
        for (auto directive : DIRECTIVES) {
            if (rest.starts_with(directive)) {
                type = *keyword_type(directive);
                len = directive.length();
                return true;
            }
        }

        const usize digits = run_length(src, start + 1, is_digit);
        if (digits == 0) return false;

        type = TokenType::MACRO_ARG;
        len = 1 + digits;
        return true;
    }

    if (c == '"' || c == '\'') {
        len = string_length(src, start);
        type = TokenType::STRING;
        return len != 0;
    }

    if (punctuation_type(c, type)) {
        len = 1;
        return true;
    }

    return false;
}

namespace Lexer {
    bool tokenize(std::string_view file_name, std::string_view source, TokenStream &out, ParseError &error) {
        out.tokens.clear();

        usize pos = 0;
        usize line = 1;
        usize col = 1;

        while (pos < source.length()) {
            TokenType type{};
            usize len = 0;
            bool skip = false;

            if (!match_token(source, pos, type, len, skip)) {
                error = ParseError{};
                error.type = ParseErrorType::INVALID_INPUT;
                error.trace.push_back(TraceFrame{ "lex", OwnedLocation{ std::string{ file_name }, line, col } });
                return false;
            }

            if (!skip) {
                out.tokens.push_back(Token{
                    .type = type,
                    .value = source.substr(pos, len),
                    .loc = SourceLocation{ file_name, line, col },
                });
            }

            if (!skip && type == TokenType::NEWLINE) {
                line += 1;
                col = 1;
            } else {
                col += len;
            }
            pos += len;
        }

        out.eof = Token{
            .type = TokenType::END_OF_FILE,
            .value = source.substr(source.length()),
            .loc = SourceLocation{ file_name, line, col },
        };
        return true;
    }
}
