#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <optional>
#include <utility>
#include <filesystem>

#include "tsl/robin_map.h"

#include "types.hpp"
#include "assembly_file.hpp"
#include "docs.hpp"

enum class Visibility : u8 {
    GLOBAL,   // declared global and defined here
    PRIVATE,  // defined here, not declared global
    EXTERNAL, // declared extern, defined elsewhere (or nowhere)
};

std::string_view visibility_name(Visibility visibility);

struct SymbolInfo {
    Visibility visibility;
    std::optional<AssemblySection> section; // empty for externs

    bool operator==(const SymbolInfo &) const = default;
};

// Name -> SymbolInfo in first-insertion order. Assigning an existing name
// updates it in place.
class SymbolTable {
public:
    using Entry = std::pair<std::string, SymbolInfo>;

    void insert_or_assign(const std::string &name, SymbolInfo info);

    const SymbolInfo *find(std::string_view name) const;

    usize size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }

    std::vector<Entry>::const_iterator begin() const { return entries.begin(); }
    std::vector<Entry>::const_iterator end() const { return entries.end(); }

    bool operator==(const SymbolTable &other) const { return entries == other.entries; }

private:
    std::vector<Entry> entries;
    tsl::robin_map<std::string, usize> index;
};

// A global declared by more than one file. The first file (in path order) keeps it.
struct GlobalCollision {
    std::string name;
    std::filesystem::path kept;
    std::filesystem::path ignored;
};

using AssemblyFiles = std::map<std::filesystem::path, AssemblyFile>;

// Project-wide symbol resolution over a fixed set of parsed files. Resolution
// happens once in build_from() and never fails: externs without a definition
// in the project are simply left unresolved.
class AssemblyProject {
public:
    static AssemblyProject build_from(AssemblyFiles files);

    const AssemblyFiles &files() const { return files_; }

    // Global name -> file declaring it.
    const tsl::robin_map<std::string, std::filesystem::path> &global_sources() const { return global_sources_; }

    // Extern name -> file defining it, only for externs defined inside the project.
    const tsl::robin_map<std::string, std::filesystem::path> &internal_externs() const { return internal_externs_; }

    const std::map<std::filesystem::path, SymbolTable> &symbols() const { return symbols_; }

    // Symbol table of one file, nullptr for a file outside the project.
    const SymbolTable *symbols_of(const std::filesystem::path &file) const;

    // Top-level label -> its dotted sub-labels, in encounter order.
    const tsl::robin_map<std::string, std::vector<std::string>> &symbol_constituents() const { return symbol_constituents_; }

    const std::vector<std::string> &constituents_of(const std::string &label) const;

    const std::vector<GlobalCollision> &collisions() const { return collisions_; }

    // One documentation tree per file, in path order.
    std::vector<std::pair<std::filesystem::path, Docs>> generate_docs() const;

private:
    void resolve_globals();
    void resolve_externs();
    void resolve_symbols(const std::filesystem::path &path, const AssemblyFile &file);

    Docs symbols_docs(const SymbolTable &table) const;

    AssemblyFiles files_;
    tsl::robin_map<std::string, std::filesystem::path> global_sources_;
    tsl::robin_map<std::string, std::filesystem::path> internal_externs_;
    std::map<std::filesystem::path, SymbolTable> symbols_;
    tsl::robin_map<std::string, std::vector<std::string>> symbol_constituents_;
    std::vector<GlobalCollision> collisions_;
};
