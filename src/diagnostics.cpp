#include "diagnostics.hpp"

#include <cstdio>
#include <cstdarg>
#include <string>

Message &Message::printf(const char *format...) {
    if (loc) {
        std::printf("%s:%zu:%zu:\n", loc->file.c_str(), loc->line, loc->col);
    }

    va_list args;
    va_start(args, format);
    std::vprintf(format, args);
    va_end(args);
    std::printf("\n");

    if (loc && !line_text.empty()) {
        // Tabs are kept so the caret lines up with the echoed source.
        auto underline = std::string{};
        for (usize i = 0; i + 1 < loc->col && i < line_text.length(); ++i) {
            underline += line_text[i] == '\t' ? '\t' : ' ';
        }
        underline += '^';

        std::printf(
            "     |     \n"
            "%4zu | %.*s\n"
            "     | %s ",
            loc->line, (int)line_text.length(), line_text.data(),
            underline.c_str()
        );
        if (!hint.empty()) {
            std::printf("(%.*s)", (int)hint.length(), hint.data());
        }
        std::printf("\n");
    } else if (!hint.empty()) {
        std::printf("(%.*s)\n", (int)hint.length(), hint.data());
    }
    std::printf("\n");
    return *this;
}

std::string_view source_line(std::string_view source, usize line) {
    usize start = 0;
    for (usize current = 1; current < line; ++current) {
        const auto newline = source.find('\n', start);
        if (newline == source.npos) return {};
        start = newline + 1;
    }

    auto end = source.find('\n', start);
    if (end == source.npos) end = source.length();
    return source.substr(start, end - start);
}

static std::string_view hint_for(const ParseError &error) {
    switch (error.type) {
        case ParseErrorType::INVALID_INPUT: return "no token starts with this character";
        case ParseErrorType::INVALID_SYNTAX:
            if (error.trace.size() >= 2 && error.trace[error.trace.size() - 2].rule == "section") {
                return "expected one of .text, .data, .rodata, .bss";
            }
            return "";
        default: return "";
    }
}

void report_parse_error(Logging &logging, const ParseError &error, std::string_view source) {
    const auto message = to_string(error);

    auto msg = Message::error(logging);
    if (const OwnedLocation *loc = error.location()) {
        msg.at(*loc, source_line(source, loc->line));
    }
    msg.with_hint(hint_for(error))
        .printf("Error: %s", message.c_str());
}

void report_collisions(Logging &logging, const AssemblyProject &project) {
    for (const auto &collision : project.collisions()) {
        const auto kept = collision.kept.string();
        const auto hint = "using the definition from " + kept;
        Message::warning(logging)
            .with_hint(hint)
            .printf("Warning: '%s' is declared global in both %s and %s",
                collision.name.c_str(), kept.c_str(), collision.ignored.string().c_str());
    }
}

void report_summary(const Logging &logging) {
    if (logging.num_errors == 0 && logging.num_warnings == 0) return;

    std::printf("%u error%s, %u warning%s\n",
        logging.num_errors, logging.num_errors == 1 ? "" : "s",
        logging.num_warnings, logging.num_warnings == 1 ? "" : "s");
}
