#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <utility>

#include "tsl/robin_set.h"

#include "types.hpp"
#include "tokens.hpp"

// Declared in memory-placement order; the resolver scans sections in this order.
enum class AssemblySection : u8 {
    TEXT,
    DATA,
    BSS,
    RO_DATA,
};

std::string_view section_name(AssemblySection section);

enum class ItemType : u8 {
    LABEL,
    MACRO_CALL,
};

struct AssemblyItem {
    ItemType type;
    std::string name;

    // Macro calls only. Arguments are not decoded yet; `raw_tail` keeps the
    // tokens that followed the call on its line.
    std::vector<AssemblyItem> arguments;
    std::vector<RawToken> raw_tail;

    static AssemblyItem label(std::string name) {
        return AssemblyItem{ .type = ItemType::LABEL, .name = std::move(name) };
    }

    static AssemblyItem macro_call(std::string name, std::vector<RawToken> tail) {
        return AssemblyItem{ .type = ItemType::MACRO_CALL, .name = std::move(name), .raw_tail = std::move(tail) };
    }

    bool is_label() const { return type == ItemType::LABEL; }
    // `.loop` style labels belong to the closest preceding top-level label.
    bool is_sub_label() const { return is_label() && name.starts_with('.'); }
};

struct AssemblyMacro {
    std::string name;
    usize arg_count;
    std::vector<AssemblyItem> body;  // always empty, bodies are not parsed
    std::vector<RawToken> raw_body;
};

struct AssemblyDefine {
    std::string name;
    std::vector<RawToken> raw_value;
};

// Assembly file representation optimized for documentation generation.
struct AssemblyFile {
    usize bits = 64;
    std::vector<std::string> includes;
    tsl::robin_set<std::string> globals;
    std::vector<std::string> externs;
    std::vector<AssemblyMacro> macros;
    std::vector<AssemblyDefine> defines;
    std::map<AssemblySection, std::vector<AssemblyItem>> sections;

    // Items of `section`, empty if the file never placed anything there.
    const std::vector<AssemblyItem> &items(AssemblySection section) const;

    bool is_global(std::string_view name) const;
};
