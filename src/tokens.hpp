#pragma once

#include <string>
#include <string_view>
#include <optional>

#include "types.hpp"

// NASM token kinds. Keywords and directives come first; when a keyword and a
// generic pattern match the same text, the keyword wins.
enum class TokenType : u8 {
    BITS,
    SECTION,
    GLOBAL,
    EXTERN,
    QWORD,
    DWORD,

    INCLUDE,
    DEFINE,
    MACRO,
    END_MACRO,

    MNEMONIC,

    MACRO_CALL,     // $name
    MACRO_ARG,      // %1
    REGISTER,       // r8, r15
    SYMBOL,
    CURRENT_POSITION, // lone $

    NUMBER,
    STRING,
    COMMENT,

    COLON,
    COMMA,
    LEFT_BRACKET,
    RIGHT_BRACKET,
    PLUS,
    MINUS,
    ASTERISK,
    SLASH,
    BIT_NOT,
    BIT_OR,
    BIT_XOR,
    BIT_AND,
    LEFT_PAREN,
    RIGHT_PAREN,

    NEWLINE,

    END_OF_FILE // sentinel, never produced by the lexer
};

// Borrowed location; `file` points at the caller's file name.
struct SourceLocation {
    std::string_view file;
    usize line = 1;
    usize col = 1;
};

// Owning copy of a location, for values that outlive the token stream.
struct OwnedLocation {
    std::string file;
    usize line = 1;
    usize col = 1;

    static OwnedLocation from(const SourceLocation &loc) {
        return OwnedLocation{ std::string{ loc.file }, loc.line, loc.col };
    }
};

struct Token {
    TokenType type;
    std::string_view value; // slice of the source text
    SourceLocation loc;
};

// A discarded token kept on the item that swallowed it.
struct RawToken {
    TokenType type;
    std::string text;

    bool operator==(const RawToken &) const = default;
};

std::string_view token_type_name(TokenType type);

// Exact keyword, directive or mnemonic spelled by `text`, if any.
std::optional<TokenType> keyword_type(std::string_view text);

// Newlines and other control characters are escaped so the text fits on one line.
std::string escape_token_text(std::string_view text);
