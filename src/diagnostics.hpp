#pragma once

#include <string_view>

#include "types.hpp"
#include "parse_error.hpp"
#include "assembly_project.hpp"

struct Logging {
    u32 num_errors = 0;
    u32 num_warnings = 0;
};

class Message {
public:
    static Message error(Logging &logging) {
        logging.num_errors += 1;
        return Message();
    }

    static Message warning(Logging &logging) {
        logging.num_warnings += 1;
        return Message();
    }

    static Message misc() {
        return Message();
    }

    // Prefixes the message with `file:line:col:` and shows `line_text` below it
    // with a caret under `loc.col`.
    Message &at(const OwnedLocation &loc, std::string_view line_text) {
        this->loc = &loc;
        this->line_text = line_text;
        return *this;
    }

    Message &with_hint(std::string_view hint) { this->hint = hint; return *this; }

    Message &printf(const char *format...);

private:
    Message() = default;

    const OwnedLocation *loc = nullptr;
    std::string_view line_text = "";
    std::string_view hint = "";
};

// Line `line` (1-based) of `source` without its newline, empty if out of range.
std::string_view source_line(std::string_view source, usize line);

void report_parse_error(Logging &logging, const ParseError &error, std::string_view source);

void report_collisions(Logging &logging, const AssemblyProject &project);

// Prints "N error(s), M warning(s)" if anything was reported.
void report_summary(const Logging &logging);
