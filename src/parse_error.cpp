#include "parse_error.hpp"

#include <filesystem>

std::string describe_error_type(const ParseError &error) {
    switch (error.type) {
        case ParseErrorType::INVALID_INPUT: return "Invalid input";
        case ParseErrorType::UNEXPECTED_EOF: return "Unexpected end-of-file";
        case ParseErrorType::INVALID_SYNTAX: return "Invalid syntax";
        case ParseErrorType::UNEXPECTED: break;
    }

    auto text = std::string{ "Expected " };
    text += token_type_name(error.expected);
    if (error.received) {
        const auto &[type, value] = *error.received;
        text += ", but received ";
        text += token_type_name(type);
        text += " (`";
        text += escape_token_text(value);
        text += "`)";
    }
    return text;
}

std::string to_string(const ParseError &error) {
    auto text = describe_error_type(error);
    if (!error.trace.empty()) text += ": ";

    for (usize i = 0; i < error.trace.size(); ++i) {
        const auto &frame = error.trace[i];
        if (i > 0) text += " > ";

        text += frame.rule;
        text += '(';
        text += std::filesystem::path(frame.loc.file).filename().string();
        text += ':';
        text += std::to_string(frame.loc.line);
        text += ':';
        text += std::to_string(frame.loc.col);
        text += ')';
    }
    return text;
}
