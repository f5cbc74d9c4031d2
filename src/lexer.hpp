#pragma once

#include <string_view>
#include <vector>

#include "tokens.hpp"
#include "parse_error.hpp"

// Tokens borrow from the source text and file name passed to tokenize(),
// so both must outlive the stream.
struct TokenStream {
    std::vector<Token> tokens; // whitespace is dropped, newlines are kept
    Token eof;                 // located just past the last byte
};

namespace Lexer {
    bool tokenize(std::string_view file_name, std::string_view source, TokenStream &out, ParseError &error);
}
