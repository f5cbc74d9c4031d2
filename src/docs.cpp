#include "docs.hpp"

static constexpr usize INDENT = 2;

Docs Docs::file(std::filesystem::path path, Docs symbols, Docs defines, Docs macros) {
    auto docs = Docs{ .kind = DocsKind::FILE, .path = std::move(path) };
    docs.children.push_back(std::move(symbols));
    docs.children.push_back(std::move(defines));
    docs.children.push_back(std::move(macros));
    return docs;
}

Docs Docs::paragraphs(std::vector<Docs> items) {
    return Docs{ .kind = DocsKind::PARAGRAPHS, .children = std::move(items) };
}

Docs Docs::list(std::vector<Docs> items) {
    return Docs{ .kind = DocsKind::LIST, .children = std::move(items) };
}

Docs Docs::table(std::vector<Docs> header, std::vector<std::vector<Docs>> rows) {
    return Docs{ .kind = DocsKind::TABLE, .children = std::move(header), .rows = std::move(rows) };
}

Docs Docs::macro(std::string name, usize arg_count) {
    return Docs{ .kind = DocsKind::MACRO, .text = std::move(name), .arg_count = arg_count };
}

Docs Docs::define(std::string name) {
    return Docs{ .kind = DocsKind::DEFINE, .text = std::move(name) };
}

Docs Docs::inline_code(std::string code) {
    return Docs{ .kind = DocsKind::INLINE_CODE, .text = std::move(code) };
}

Docs Docs::plain_text(std::string text) {
    return Docs{ .kind = DocsKind::TEXT, .text = std::move(text) };
}

Docs Docs::cell_lines(std::vector<Docs> lines) {
    return Docs{ .kind = DocsKind::CELL_LINES, .children = std::move(lines) };
}

Docs Docs::indent(Docs inner) {
    auto docs = Docs{ .kind = DocsKind::INDENT };
    docs.children.push_back(std::move(inner));
    return docs;
}

Docs Docs::resolve_file(std::filesystem::path path) {
    return Docs{ .kind = DocsKind::RESOLVE_FILE, .path = std::move(path) };
}

Docs Docs::concat(std::vector<Docs> items) {
    return Docs{ .kind = DocsKind::CONCAT, .children = std::move(items) };
}

bool Docs::is_empty() const {
    switch (kind) {
        case DocsKind::PARAGRAPHS:
        case DocsKind::LIST:
        case DocsKind::CELL_LINES:
        case DocsKind::CONCAT:
            return children.empty();
        case DocsKind::TABLE:
            return rows.empty();
        default:
            return false;
    }
}

namespace {
    // Indentation is tracked in nesting levels and emitted as non-breaking
    // spaces, which is the only indentation that survives inside table cells.
    struct MarkdownWriter {
        const DocsFileMap &file_map;
        std::string &out;
        std::string &error;
        usize level = 0;

        bool write(const Docs &docs) {
            switch (docs.kind) {
                case DocsKind::FILE: return write_file(docs);

                case DocsKind::PARAGRAPHS:
                    for (const auto &item : docs.children) {
                        out += "- ";
                        if (!write(item)) return false;
                        out += "\n\n";
                    }
                    return true;

                case DocsKind::LIST:
                    for (const auto &item : docs.children) {
                        out += "- ";
                        if (!write(item)) return false;
                        out += '\n';
                    }
                    return true;

                case DocsKind::TABLE: return write_table(docs);

                case DocsKind::MACRO:
                    out += '`';
                    out += docs.text;
                    out += "` (";
                    out += std::to_string(docs.arg_count);
                    out += docs.arg_count == 1 ? " argument)" : " arguments)";
                    return true;

                case DocsKind::DEFINE:
                case DocsKind::INLINE_CODE:
                    out += '`';
                    out += docs.text;
                    out += '`';
                    return true;

                case DocsKind::TEXT:
                    out += docs.text;
                    return true;

                case DocsKind::CELL_LINES:
                    for (usize i = 0; i < docs.children.size(); ++i) {
                        if (i > 0) out += "<br>";
                        if (!write(docs.children[i])) return false;
                    }
                    return true;

                case DocsKind::INDENT: {
                    level += 1;
                    for (usize i = 0; i < level * INDENT; ++i) out += "&nbsp;";
                    bool ok = true;
                    for (const auto &child : docs.children) {
                        if (!(ok = write(child))) break;
                    }
                    level -= 1;
                    return ok;
                }

                case DocsKind::RESOLVE_FILE: {
                    auto it = file_map.find(docs.path);
                    if (it == file_map.end()) {
                        error = "no documentation path for referenced file '" + docs.path.string() + "'";
                        return false;
                    }
                    out += '[';
                    out += docs.path.filename().string();
                    out += "](";
                    out += it->second.generic_string();
                    out += ')';
                    return true;
                }

                case DocsKind::CONCAT:
                    for (const auto &item : docs.children) {
                        if (!write(item)) return false;
                    }
                    return true;
            }
            error = "unknown documentation node";
            return false;
        }

        bool write_file(const Docs &docs) {
            out += "<!-- This file was generated by asmdoc. -->\n";
            out += "# ";
            out += docs.path.filename().string();
            out += "\n\n";

            static constexpr const char *HEADINGS[] = { "## Symbols\n", "## Defines\n", "## Macros\n" };
            for (usize i = 0; i < docs.children.size() && i < 3; ++i) {
                const auto &section = docs.children[i];
                if (section.is_empty()) continue;

                out += HEADINGS[i];
                if (!write(section)) return false;
                out += '\n';
            }
            return true;
        }

        bool write_row(const std::vector<Docs> &cells) {
            out += '|';
            for (const auto &cell : cells) {
                out += ' ';
                if (!write(cell)) return false;
                out += " |";
            }
            out += '\n';
            return true;
        }

        bool write_table(const Docs &docs) {
            out += '\n';
            if (!write_row(docs.children)) return false;

            out += '|';
            for (usize i = 0; i < docs.children.size(); ++i) out += " --- |";
            out += '\n';

            for (const auto &row : docs.rows) {
                if (!write_row(row)) return false;
            }
            return true;
        }
    };
}

bool MarkdownBackend::render(const Docs &docs, const DocsFileMap &file_map, std::string &out, std::string &error) const {
    auto writer = MarkdownWriter{ .file_map = file_map, .out = out, .error = error };
    return writer.write(docs);
}
