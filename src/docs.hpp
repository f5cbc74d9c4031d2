#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <filesystem>

#include "types.hpp"

enum class DocsKind : u8 {
    FILE,
    PARAGRAPHS,
    LIST,
    TABLE,
    MACRO,
    DEFINE,
    INLINE_CODE,
    TEXT,
    CELL_LINES,
    INDENT,       // one nesting level, used for sub-labels inside a cell
    RESOLVE_FILE, // link to the documentation of another source file
    CONCAT,
};

// Backend-agnostic documentation tree. Children are owned by value.
//
// Field use per kind:
// - FILE: path, children = { symbols, defines, macros }
// - TABLE: children = header cells, rows
// - MACRO: text = name, arg_count
// - DEFINE, INLINE_CODE, TEXT: text
// - RESOLVE_FILE: path of the referenced source file
// - PARAGRAPHS, LIST, CELL_LINES, CONCAT: children
// - INDENT: children = { indented node }
struct Docs {
    DocsKind kind;
    std::string text;
    std::filesystem::path path;
    usize arg_count = 0;
    std::vector<Docs> children;
    std::vector<std::vector<Docs>> rows;

    static Docs file(std::filesystem::path path, Docs symbols, Docs defines, Docs macros);
    static Docs paragraphs(std::vector<Docs> items);
    static Docs list(std::vector<Docs> items);
    static Docs table(std::vector<Docs> header, std::vector<std::vector<Docs>> rows);
    static Docs macro(std::string name, usize arg_count);
    static Docs define(std::string name);
    static Docs inline_code(std::string code);
    static Docs plain_text(std::string text);
    static Docs cell_lines(std::vector<Docs> lines);
    static Docs indent(Docs inner);
    static Docs resolve_file(std::filesystem::path path);
    static Docs concat(std::vector<Docs> items);

    // Leaves and files are never empty; tables are empty without rows.
    bool is_empty() const;
};

// Source file -> path (relative to the output directory) of its documentation.
// Every file referenced by a tree must have an entry.
using DocsFileMap = std::map<std::filesystem::path, std::filesystem::path>;

class Backend {
public:
    virtual ~Backend() = default;

    // Appends the rendering of `docs` to `out`. On failure `error` says why and
    // `out` holds a partial rendering.
    virtual bool render(const Docs &docs, const DocsFileMap &file_map, std::string &out, std::string &error) const = 0;

    // Extension for generated files, without the dot.
    virtual std::string_view extension() const = 0;
};

class MarkdownBackend final : public Backend {
public:
    bool render(const Docs &docs, const DocsFileMap &file_map, std::string &out, std::string &error) const override;

    std::string_view extension() const override { return "md"; }
};
