#include "parser.hpp"

#include <charconv>
#include <algorithm>
#include <cctype>

#include "lexer.hpp"

// Rules push themselves onto the rule stack on entry and pop on success.
// On failure the stack is left as is: the error already holds a snapshot and
// the whole parse is abandoned.
class NasmParser {
    struct ActiveRule {
        std::string_view name;
        SourceLocation loc;
    };

    using RuleFn = bool (NasmParser::*)();

public:
    NasmParser(const TokenStream &stream, ParseError &error)
        : stream(stream), error(error) {}

    bool parse(AssemblyFile &out) {
        if (!is_eof()) {
            rule_stack.push_back({ "parse", current().loc });
        }

        skip_newlines();
        while (!is_eof()) {
            if (!parse_top_level()) return false;
            skip_newlines();
        }

        out = std::move(file);
        return true;
    }

private:
    bool parse_top_level() {
        switch (current().type) {
            case TokenType::BITS: return rule("bits", &NasmParser::rule_bits);
            case TokenType::SECTION: return rule("section", &NasmParser::rule_section);
            case TokenType::SYMBOL:
                if (peek_is(TokenType::COLON)) return rule("label", &NasmParser::rule_label);
                return fail(ParseErrorType::INVALID_SYNTAX);
            case TokenType::MNEMONIC: return rule("mnemonic", &NasmParser::rule_mnemonic);
            case TokenType::GLOBAL: return rule("global", &NasmParser::rule_global);
            case TokenType::EXTERN: return rule("extern", &NasmParser::rule_extern);
            case TokenType::MACRO: return rule("macro_definition", &NasmParser::rule_macro_definition);
            case TokenType::MACRO_CALL: return rule("macro_call", &NasmParser::rule_macro_call);
            case TokenType::INCLUDE: return rule("include", &NasmParser::rule_include);
            case TokenType::DEFINE: return rule("define", &NasmParser::rule_define);
            case TokenType::COMMENT:
                // Comments are not attached to anything yet.
                advance();
                return true;
            default: return fail(ParseErrorType::INVALID_SYNTAX);
        }
    }

    bool rule(std::string_view name, RuleFn fn) {
        if (is_eof()) return fail(ParseErrorType::UNEXPECTED_EOF);

        rule_stack.push_back({ name, current().loc });
        if (!(this->*fn)()) return false;
        rule_stack.pop_back();
        return true;
    }

    bool rule_bits() {
        Token number{};
        if (!expect(TokenType::BITS) || !expect(TokenType::NUMBER, &number)) return false;
        return parse_unsigned(number, file.bits);
    }

    bool rule_section() {
        Token name{};
        if (!expect(TokenType::SECTION) || !expect(TokenType::SYMBOL, &name)) return false;

        auto lowercase = std::string{ name.value };
        std::transform(lowercase.begin(), lowercase.end(), lowercase.begin(),
            [](unsigned char c) { return char(std::tolower(c)); });

        if (lowercase == ".text") current_section = AssemblySection::TEXT;
        else if (lowercase == ".data") current_section = AssemblySection::DATA;
        else if (lowercase == ".rodata") current_section = AssemblySection::RO_DATA;
        else if (lowercase == ".bss") current_section = AssemblySection::BSS;
        else return fail_at(name, ParseErrorType::INVALID_SYNTAX);

        return expect(TokenType::NEWLINE);
    }

    // No newline required: `label: mov rax, 1` is one line.
    bool rule_label() {
        Token name{};
        if (!expect(TokenType::SYMBOL, &name) || !expect(TokenType::COLON)) return false;

        file.sections[current_section].push_back(AssemblyItem::label(std::string{ name.value }));
        return true;
    }

    // Operands are not decoded.
    bool rule_mnemonic() {
        if (!expect(TokenType::MNEMONIC)) return false;
        skip_until(TokenType::NEWLINE);
        return expect(TokenType::NEWLINE);
    }

    bool rule_global() {
        Token name{};
        if (!expect(TokenType::GLOBAL) || !expect(TokenType::SYMBOL, &name) || !expect(TokenType::NEWLINE)) {
            return false;
        }
        file.globals.insert(std::string{ name.value });
        return true;
    }

    bool rule_extern() {
        Token name{};
        if (!expect(TokenType::EXTERN) || !expect(TokenType::SYMBOL, &name) || !expect(TokenType::NEWLINE)) {
            return false;
        }
        file.externs.push_back(std::string{ name.value });
        return true;
    }

    bool rule_include() {
        Token path{};
        if (!expect(TokenType::INCLUDE) || !expect(TokenType::STRING, &path) || !expect(TokenType::NEWLINE)) {
            return false;
        }
        // Strip the quotes; escapes are kept verbatim.
        file.includes.push_back(std::string{ path.value.substr(1, path.value.length() - 2) });
        return true;
    }

    bool rule_define() {
        Token name{};
        if (!expect(TokenType::DEFINE) || !expect(TokenType::SYMBOL, &name)) return false;

        auto value = skip_until(TokenType::NEWLINE);
        if (!expect(TokenType::NEWLINE)) return false;

        file.defines.push_back(AssemblyDefine{ std::string{ name.value }, std::move(value) });
        return true;
    }

    // %macro name count ... %endmacro. The body is kept as raw tokens and
    // never checked against the grammar.
    bool rule_macro_definition() {
        if (!expect(TokenType::MACRO)) return false;

        Token name{};
        const auto name_type = !is_eof() && current().type == TokenType::SYMBOL
            ? TokenType::SYMBOL
            : TokenType::MACRO_CALL;
        if (!expect(name_type, &name)) return false;

        Token count{};
        usize arg_count = 0;
        if (!expect(TokenType::NUMBER, &count) || !parse_unsigned(count, arg_count)) return false;

        auto body = skip_until(TokenType::END_MACRO);
        if (!expect(TokenType::END_MACRO)) return false;

        file.macros.push_back(AssemblyMacro{
            .name = std::string{ name.value },
            .arg_count = arg_count,
            .body = {},
            .raw_body = std::move(body),
        });
        return true;
    }

    bool rule_macro_call() {
        Token name{};
        if (!expect(TokenType::MACRO_CALL, &name)) return false;

        auto tail = skip_until(TokenType::NEWLINE);
        if (!expect(TokenType::NEWLINE)) return false;

        file.sections[current_section].push_back(AssemblyItem::macro_call(std::string{ name.value }, std::move(tail)));
        return true;
    }

    // Token helpers

    bool is_eof() const { return pos >= stream.tokens.size(); }

    const Token &current() const { return is_eof() ? stream.eof : stream.tokens[pos]; }

    void advance() { pos += 1; }

    bool peek_is(TokenType type) const {
        return pos + 1 < stream.tokens.size() && stream.tokens[pos + 1].type == type;
    }

    void skip_newlines() {
        while (!is_eof() && current().type == TokenType::NEWLINE) advance();
    }

    // Consumes tokens up to (not including) the next `stop` token or end of input.
    std::vector<RawToken> skip_until(TokenType stop) {
        auto skipped = std::vector<RawToken>{};
        while (!is_eof() && current().type != stop) {
            skipped.push_back(RawToken{ current().type, std::string{ current().value } });
            advance();
        }
        return skipped;
    }

    bool expect(TokenType expected, Token *out = nullptr) {
        if (is_eof()) {
            fail(ParseErrorType::UNEXPECTED);
            error.expected = expected;
            return false;
        }

        const Token &token = current();
        if (token.type != expected) {
            fail(ParseErrorType::UNEXPECTED);
            error.expected = expected;
            error.received.emplace(token.type, std::string{ token.value });
            return false;
        }

        if (out) *out = token;
        advance();
        return true;
    }

    bool parse_unsigned(const Token &token, usize &out) {
        const auto text = token.value;
        usize value{};
        const auto result = std::from_chars(text.data(), text.data() + text.length(), value);
        if (result.ec != std::errc{} || result.ptr != text.data() + text.length()) {
            return fail_at(token, ParseErrorType::INVALID_SYNTAX);
        }
        out = value;
        return true;
    }

    // Diagnostics

    bool fail(ParseErrorType type) {
        if (is_eof()) return fail_with_frame(type, "end-of-file", stream.eof.loc);
        return fail_at(current(), type);
    }

    bool fail_at(const Token &token, ParseErrorType type) {
        return fail_with_frame(type, token_type_name(token.type), token.loc);
    }

    bool fail_with_frame(ParseErrorType type, std::string_view frame, const SourceLocation &loc) {
        error = ParseError{};
        error.type = type;
        for (const auto &active : rule_stack) {
            error.trace.push_back(TraceFrame{ std::string{ active.name }, OwnedLocation::from(active.loc) });
        }
        error.trace.push_back(TraceFrame{ std::string{ frame }, OwnedLocation::from(loc) });
        return false;
    }

    const TokenStream &stream;
    ParseError &error;
    usize pos = 0;

    AssemblyFile file{};
    AssemblySection current_section = AssemblySection::TEXT;
    std::vector<ActiveRule> rule_stack;
};

bool NasmSyntax::parse(std::string_view file_name, std::string_view source, AssemblyFile &out, ParseError &error) {
    auto stream = TokenStream{};
    if (!Lexer::tokenize(file_name, source, stream, error)) return false;

    return NasmParser(stream, error).parse(out);
}
