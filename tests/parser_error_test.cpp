#include <cassert>
#include <iostream>
#include <string>
#include <string_view>

#include "parser.hpp"

static ParseError parse_err(std::string_view src){
    AssemblyFile file; ParseError err;
    file.bits = 16; // sentinel: a failed parse must not touch the output
    bool ok = Parser::parse<NasmSyntax>("dir/err.asm", src, file, err);
    assert(!ok && "parse should fail");
    assert(file.bits == 16 && file.sections.empty());
    return err;
}

static void assert_frame(const ParseError &err, std::size_t i, std::string_view rule, std::size_t line, std::size_t col){
    assert(i < err.trace.size());
    assert(err.trace[i].rule == rule);
    assert(err.trace[i].loc.line == line);
    assert(err.trace[i].loc.col == col);
    assert(err.trace[i].loc.file == "dir/err.asm");
}

static void test_unknown_section(){
    auto err = parse_err("section .bogus\n");
    assert(err.type == ParseErrorType::INVALID_SYNTAX);
    assert(err.trace.size() == 3);
    assert_frame(err, 0, "parse", 1, 1);
    assert_frame(err, 1, "section", 1, 1);
    assert_frame(err, 2, "Symbol", 1, 9);
    assert(to_string(err) == "Invalid syntax: parse(err.asm:1:1) > section(err.asm:1:1) > Symbol(err.asm:1:9)");
}

static void test_missing_symbol(){
    auto err = parse_err("global\n");
    assert(err.type == ParseErrorType::UNEXPECTED);
    assert(err.expected == TokenType::SYMBOL);
    assert(err.received.has_value());
    assert(err.received->first == TokenType::NEWLINE);
    assert(err.received->second == "\n");
    assert_frame(err, 2, "Newline", 1, 7);
    assert(to_string(err) ==
        "Expected Symbol, but received Newline (`\\n`): parse(err.asm:1:1) > global(err.asm:1:1) > Newline(err.asm:1:7)");
}

static void test_input_ends_early(){
    auto err = parse_err("global main");
    assert(err.type == ParseErrorType::UNEXPECTED);
    assert(err.expected == TokenType::NEWLINE);
    assert(!err.received.has_value());
    assert_frame(err, 1, "global", 1, 1);
    assert_frame(err, 2, "end-of-file", 1, 12);
    assert(to_string(err) == "Expected Newline: parse(err.asm:1:1) > global(err.asm:1:1) > end-of-file(err.asm:1:12)");

    auto macro = parse_err("%macro $m 1\nmov rax, 1\n");
    assert(macro.type == ParseErrorType::UNEXPECTED);
    assert(macro.expected == TokenType::END_MACRO && !macro.received);
    assert_frame(macro, 1, "macro_definition", 1, 1);
}

static void test_rule_trace_follows_nesting(){
    auto err = parse_err("section .text\nmain:\n    mov rax, 1\n    extern\n");
    assert(err.trace.size() == 3);
    assert_frame(err, 0, "parse", 1, 1);
    assert_frame(err, 1, "extern", 4, 5);
    assert_frame(err, 2, "Newline", 4, 11);

    // Leading blank lines: the parse frame starts at the first token.
    auto blank = parse_err("\n\nbits x\n");
    assert(blank.expected == TokenType::NUMBER);
    assert(blank.received->first == TokenType::SYMBOL && blank.received->second == "x");
    assert_frame(blank, 0, "parse", 1, 1);
    assert_frame(blank, 1, "bits", 3, 1);
    assert_frame(blank, 2, "Symbol", 3, 6);
}

static void test_invalid_values(){
    auto bits = parse_err("bits 99999999999999999999999999\n");
    assert(bits.type == ParseErrorType::INVALID_SYNTAX);
    assert_frame(bits, 2, "Number", 1, 6);

    auto count = parse_err("%macro $m x\n%endmacro\n");
    assert(count.type == ParseErrorType::UNEXPECTED);
    assert(count.expected == TokenType::NUMBER);
    assert(count.received->first == TokenType::SYMBOL);

    auto name = parse_err("%macro 2 2\n%endmacro\n");
    assert(name.expected == TokenType::MACRO_CALL);

    auto include = parse_err("%include macros.inc\n");
    assert(include.expected == TokenType::STRING);
    assert(include.received->second == "macros.inc");
}

static void test_unexpected_top_level(){
    auto stray = parse_err("foo bar\n");
    assert(stray.type == ParseErrorType::INVALID_SYNTAX);
    assert(stray.trace.size() == 2);
    assert_frame(stray, 1, "Symbol", 1, 1);

    auto number = parse_err("\n123\n");
    assert(number.type == ParseErrorType::INVALID_SYNTAX);
    assert_frame(number, 1, "Number", 2, 1);

    // Trailing comments are not part of the directive grammar.
    auto comment = parse_err("extern puts ; libc\n");
    assert(comment.expected == TokenType::NEWLINE);
    assert(comment.received->first == TokenType::COMMENT);
}

static void test_lexical_error(){
    auto err = parse_err("section .text\nmov rax, =1\n");
    assert(err.type == ParseErrorType::INVALID_INPUT);
    assert(err.trace.size() == 1);
    assert_frame(err, 0, "lex", 2, 10);
    assert(to_string(err) == "Invalid input: lex(err.asm:2:10)");
    assert(err.location() && err.location()->line == 2);
}

void run_parser_error_tests(){
    std::cout << "[parser] error tests...\n";
    test_unknown_section();
    test_missing_symbol();
    test_input_ends_early();
    test_rule_trace_follows_nesting();
    test_invalid_values();
    test_unexpected_top_level();
    test_lexical_error();
    std::cout << "[parser] error tests passed\n";
}
