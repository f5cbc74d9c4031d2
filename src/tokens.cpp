#include "tokens.hpp"

#include <cstdio>

#include "tsl/robin_map.h"

static tsl::robin_map<std::string_view, TokenType> &keyword_table() {
    static auto table = tsl::robin_map<std::string_view, TokenType>{
        { "bits", TokenType::BITS },
        { "section", TokenType::SECTION },
        { "global", TokenType::GLOBAL },
        { "extern", TokenType::EXTERN },
        { "qword", TokenType::QWORD },
        { "dword", TokenType::DWORD },

        { "%include", TokenType::INCLUDE },
        { "%define", TokenType::DEFINE },
        { "%macro", TokenType::MACRO },
        { "%endmacro", TokenType::END_MACRO },

        // Operands are never decoded, so only the mnemonic itself is recognized.
        // TODO: extend to the full x86-64 mnemonic list (cmov*, set*, sse moves).
        { "mov", TokenType::MNEMONIC },     { "add", TokenType::MNEMONIC },
        { "jmp", TokenType::MNEMONIC },     { "push", TokenType::MNEMONIC },
        { "pop", TokenType::MNEMONIC },     { "call", TokenType::MNEMONIC },
        { "ret", TokenType::MNEMONIC },     { "sub", TokenType::MNEMONIC },
        { "mul", TokenType::MNEMONIC },     { "div", TokenType::MNEMONIC },
        { "inc", TokenType::MNEMONIC },     { "dec", TokenType::MNEMONIC },
        { "and", TokenType::MNEMONIC },     { "or", TokenType::MNEMONIC },
        { "xor", TokenType::MNEMONIC },     { "not", TokenType::MNEMONIC },
        { "shl", TokenType::MNEMONIC },     { "shr", TokenType::MNEMONIC },
        { "cmp", TokenType::MNEMONIC },     { "test", TokenType::MNEMONIC },
        { "db", TokenType::MNEMONIC },      { "dd", TokenType::MNEMONIC },
        { "align", TokenType::MNEMONIC },   { "equ", TokenType::MNEMONIC },
        { "lea", TokenType::MNEMONIC },     { "jne", TokenType::MNEMONIC },
        { "je", TokenType::MNEMONIC },      { "imul", TokenType::MNEMONIC },
        { "syscall", TokenType::MNEMONIC }, { "jz", TokenType::MNEMONIC },
        { "jnz", TokenType::MNEMONIC },
    };
    return table;
}

std::optional<TokenType> keyword_type(std::string_view text) {
    auto &tbl = keyword_table();
    if (auto it = tbl.find(text); it != tbl.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::string_view token_type_name(TokenType type) {
    switch (type) {
        case TokenType::BITS: return "Bits";
        case TokenType::SECTION: return "Section";
        case TokenType::GLOBAL: return "Global";
        case TokenType::EXTERN: return "Extern";
        case TokenType::QWORD: return "QWord";
        case TokenType::DWORD: return "DWord";
        case TokenType::INCLUDE: return "Include";
        case TokenType::DEFINE: return "Define";
        case TokenType::MACRO: return "Macro";
        case TokenType::END_MACRO: return "EndMacro";
        case TokenType::MNEMONIC: return "Mnemonic";
        case TokenType::MACRO_CALL: return "MacroCall";
        case TokenType::MACRO_ARG: return "MacroArg";
        case TokenType::REGISTER: return "Register";
        case TokenType::SYMBOL: return "Symbol";
        case TokenType::CURRENT_POSITION: return "CurrentPosition";
        case TokenType::NUMBER: return "Number";
        case TokenType::STRING: return "String";
        case TokenType::COMMENT: return "Comment";
        case TokenType::COLON: return "Colon";
        case TokenType::COMMA: return "Comma";
        case TokenType::LEFT_BRACKET: return "LeftBracket";
        case TokenType::RIGHT_BRACKET: return "RightBracket";
        case TokenType::PLUS: return "Plus";
        case TokenType::MINUS: return "Minus";
        case TokenType::ASTERISK: return "Asterisk";
        case TokenType::SLASH: return "Slash";
        case TokenType::BIT_NOT: return "BitNot";
        case TokenType::BIT_OR: return "BitOr";
        case TokenType::BIT_XOR: return "BitXor";
        case TokenType::BIT_AND: return "BitAnd";
        case TokenType::LEFT_PAREN: return "LeftParen";
        case TokenType::RIGHT_PAREN: return "RightParen";
        case TokenType::NEWLINE: return "Newline";
        case TokenType::END_OF_FILE: return "EOF";
        default: return "{??}";
    }
}

std::string escape_token_text(std::string_view text) {
    auto result = std::string{};
    result.reserve(text.length());

    for (char c : text) {
        switch (c) {
            case '\n': result += "\\n"; break;
            case '\t': result += "\\t"; break;
            case '\r': result += "\\r"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\x%02x", static_cast<unsigned char>(c));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}
