#pragma once

#include <string_view>

#include "assembly_file.hpp"
#include "parse_error.hpp"

// NASM front end. Parsing is all-or-nothing: `out` is only written on success,
// and the first error aborts the file.
struct NasmSyntax {
    static bool parse(std::string_view file_name, std::string_view source, AssemblyFile &out, ParseError &error);
};

namespace Parser {
    // Syntax is any front end with NasmSyntax's static parse() signature.
    template<typename Syntax>
    bool parse(std::string_view file_name, std::string_view source, AssemblyFile &out, ParseError &error) {
        return Syntax::parse(file_name, source, out, error);
    }
}
