#include <cassert>
#include <iostream>
#include <string_view>
#include <vector>

#include "lexer.hpp"

static std::vector<TokenType> types_of(const TokenStream &stream){
    std::vector<TokenType> types;
    for(const auto &tok : stream.tokens) types.push_back(tok.type);
    return types;
}

static TokenStream lex_ok(std::string_view src){
    TokenStream stream; ParseError err;
    bool ok = Lexer::tokenize("test.asm", src, stream, err);
    assert(ok && "lexing should succeed");
    return stream;
}

static void test_keywords_beat_symbols(){
    auto s = lex_ok("mov move bits bitsy r12 r12d section global extern qword dword db dbx\n");
    std::vector<TokenType> expected = {
        TokenType::MNEMONIC, TokenType::SYMBOL, TokenType::BITS, TokenType::SYMBOL,
        TokenType::REGISTER, TokenType::SYMBOL, TokenType::SECTION, TokenType::GLOBAL,
        TokenType::EXTERN, TokenType::QWORD, TokenType::DWORD, TokenType::MNEMONIC,
        TokenType::SYMBOL, TokenType::NEWLINE
    };
    assert(types_of(s) == expected);
    assert(s.tokens[1].value == "move");
    assert(s.tokens[5].value == "r12d");
}

static void test_sigils_and_directives(){
    auto s = lex_ok("%macro $print 2 %1 $ %endmacro %include %define\n");
    std::vector<TokenType> expected = {
        TokenType::MACRO, TokenType::MACRO_CALL, TokenType::NUMBER, TokenType::MACRO_ARG,
        TokenType::CURRENT_POSITION, TokenType::END_MACRO, TokenType::INCLUDE, TokenType::DEFINE,
        TokenType::NEWLINE
    };
    assert(types_of(s) == expected);
    assert(s.tokens[1].value == "$print");
    assert(s.tokens[3].value == "%1");
}

static void test_strings_comments_punctuation(){
    auto s = lex_ok("db \"a\\\"b\", 'c' ; trailing [x]\n[rax+8*2-1]:~|^&()/\n");
    assert(s.tokens[0].type == TokenType::MNEMONIC);
    assert(s.tokens[1].type == TokenType::STRING);
    assert(s.tokens[1].value == "\"a\\\"b\"");
    assert(s.tokens[2].type == TokenType::COMMA);
    assert(s.tokens[3].type == TokenType::STRING && s.tokens[3].value == "'c'");
    assert(s.tokens[4].type == TokenType::COMMENT && s.tokens[4].value == "; trailing [x]");
    assert(s.tokens[5].type == TokenType::NEWLINE);
    std::vector<TokenType> second = {
        TokenType::LEFT_BRACKET, TokenType::SYMBOL, TokenType::PLUS, TokenType::NUMBER,
        TokenType::ASTERISK, TokenType::NUMBER, TokenType::MINUS, TokenType::NUMBER,
        TokenType::RIGHT_BRACKET, TokenType::COLON, TokenType::BIT_NOT, TokenType::BIT_OR,
        TokenType::BIT_XOR, TokenType::BIT_AND, TokenType::LEFT_PAREN, TokenType::RIGHT_PAREN,
        TokenType::SLASH, TokenType::NEWLINE
    };
    auto all = types_of(s);
    std::vector<TokenType> actual(all.begin() + 6, all.end());
    assert(actual == second);
}

static void test_locations(){
    auto s = lex_ok("global  main\n\tmain:\n");
    assert(s.tokens.size() == 6);
    assert(s.tokens[0].loc.line == 1 && s.tokens[0].loc.col == 1);
    assert(s.tokens[1].loc.line == 1 && s.tokens[1].loc.col == 9);
    assert(s.tokens[2].loc.line == 1 && s.tokens[2].loc.col == 13);
    assert(s.tokens[3].loc.line == 2 && s.tokens[3].loc.col == 2);
    assert(s.tokens[4].loc.line == 2 && s.tokens[4].loc.col == 6);
    assert(s.tokens[0].loc.file == "test.asm");
    assert(s.eof.type == TokenType::END_OF_FILE);
    assert(s.eof.loc.line == 3 && s.eof.loc.col == 1);
}

static void test_whitespace_is_dropped(){
    auto s = lex_ok("  \t\r\n\n");
    std::vector<TokenType> expected = { TokenType::NEWLINE, TokenType::NEWLINE };
    assert(types_of(s) == expected);
    auto empty = lex_ok("");
    assert(empty.tokens.empty());
    assert(empty.eof.loc.line == 1 && empty.eof.loc.col == 1);
}

static void test_invalid_input(){
    TokenStream stream; ParseError err;
    bool ok = Lexer::tokenize("bad.asm", "mov rax, 1\nx = 2\n", stream, err);
    assert(!ok);
    assert(err.type == ParseErrorType::INVALID_INPUT);
    assert(err.trace.size() == 1);
    assert(err.trace[0].rule == "lex");
    assert(err.trace[0].loc.line == 2 && err.trace[0].loc.col == 3);

    ParseError unterminated;
    ok = Lexer::tokenize("bad.asm", "db \"abc\n", stream, unterminated);
    assert(!ok && unterminated.type == ParseErrorType::INVALID_INPUT);
    assert(unterminated.trace[0].loc.col == 4);

    ParseError bare_percent;
    ok = Lexer::tokenize("bad.asm", "%foo\n", stream, bare_percent);
    assert(!ok && bare_percent.type == ParseErrorType::INVALID_INPUT);
}

void run_lexer_tests(){
    std::cout << "[lexer] tests...\n";
    test_keywords_beat_symbols();
    test_sigils_and_directives();
    test_strings_comments_punctuation();
    test_locations();
    test_whitespace_is_dropped();
    test_invalid_input();
    std::cout << "[lexer] tests passed\n";
}
