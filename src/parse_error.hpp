#pragma once

#include <string>
#include <vector>
#include <optional>
#include <utility>

#include "types.hpp"
#include "tokens.hpp"

enum class ParseErrorType {
    INVALID_INPUT,  // no token matches at some offset
    UNEXPECTED_EOF, // a rule was entered at end of input
    UNEXPECTED,     // token kind mismatch, see expected/received
    INVALID_SYNTAX, // well-typed token with an unusable value
};

// One active grammar rule (or the offending token) when parsing failed.
struct TraceFrame {
    std::string rule;
    OwnedLocation loc;
};

struct ParseError {
    ParseErrorType type = ParseErrorType::INVALID_SYNTAX;

    // Only meaningful for UNEXPECTED. `received` is empty when the input ran out.
    TokenType expected = TokenType::END_OF_FILE;
    std::optional<std::pair<TokenType, std::string>> received;

    std::vector<TraceFrame> trace;

    // Location of the innermost frame, which names the offending token.
    const OwnedLocation *location() const {
        return trace.empty() ? nullptr : &trace.back().loc;
    }
};

// "Expected Symbol, but received Newline (`\n`)"
std::string describe_error_type(const ParseError &error);

// "<description>: rule(file:line:col) > rule(file:line:col)"
std::string to_string(const ParseError &error);
