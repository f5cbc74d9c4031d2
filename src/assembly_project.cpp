#include "assembly_project.hpp"

#include <algorithm>

std::string_view visibility_name(Visibility visibility) {
    switch (visibility) {
        case Visibility::GLOBAL: return "global";
        case Visibility::PRIVATE: return "private";
        case Visibility::EXTERNAL: return "external";
        default: return "{??}";
    }
}

void SymbolTable::insert_or_assign(const std::string &name, SymbolInfo info) {
    if (auto it = index.find(name); it != index.end()) {
        entries[it->second].second = info;
        return;
    }
    index.insert({ name, entries.size() });
    entries.emplace_back(name, info);
}

const SymbolInfo *SymbolTable::find(std::string_view name) const {
    if (auto it = index.find(std::string{ name }); it != index.end()) {
        return &entries[it->second].second;
    }
    return nullptr;
}

AssemblyProject AssemblyProject::build_from(AssemblyFiles files) {
    auto project = AssemblyProject{};
    project.files_ = std::move(files);

    project.resolve_globals();
    project.resolve_externs();
    for (const auto &[path, file] : project.files_) {
        project.resolve_symbols(path, file);
    }
    return project;
}

// Files are visited in path order, so the first declaration of a global wins
// no matter how the caller discovered the files.
void AssemblyProject::resolve_globals() {
    for (const auto &[path, file] : files_) {
        // robin_set iteration order is unspecified; sort for stable collision reports.
        auto names = std::vector<std::string>(file.globals.begin(), file.globals.end());
        std::sort(names.begin(), names.end());

        for (const auto &name : names) {
            if (auto it = global_sources_.find(name); it != global_sources_.end()) {
                collisions_.push_back(GlobalCollision{ name, it->second, path });
                continue;
            }
            global_sources_.insert({ name, path });
        }
    }
}

void AssemblyProject::resolve_externs() {
    for (const auto &[path, file] : files_) {
        for (const auto &name : file.externs) {
            if (auto it = global_sources_.find(name); it != global_sources_.end()) {
                internal_externs_.insert({ name, it->second });
            }
        }
    }
}

void AssemblyProject::resolve_symbols(const std::filesystem::path &path, const AssemblyFile &file) {
    auto &table = symbols_[path];

    for (const auto &name : file.externs) {
        table.insert_or_assign(name, SymbolInfo{ Visibility::EXTERNAL, std::nullopt });
    }

    // Most recent top-level label of this file; sub-labels attach to it.
    // A sub-label before any top-level label has no owner and is dropped.
    auto current_label = std::optional<std::string>{};

    for (const auto &[section, items] : file.sections) {
        for (const auto &item : items) {
            if (!item.is_label()) continue;

            if (item.is_sub_label()) {
                if (current_label) {
                    symbol_constituents_[*current_label].push_back(item.name);
                }
                continue;
            }

            current_label = item.name;
            const auto visibility = file.is_global(item.name) ? Visibility::GLOBAL : Visibility::PRIVATE;
            table.insert_or_assign(item.name, SymbolInfo{ visibility, section });
        }
    }
}

const SymbolTable *AssemblyProject::symbols_of(const std::filesystem::path &file) const {
    if (auto it = symbols_.find(file); it != symbols_.end()) {
        return &it->second;
    }
    return nullptr;
}

const std::vector<std::string> &AssemblyProject::constituents_of(const std::string &label) const {
    static const std::vector<std::string> NONE{};
    if (auto it = symbol_constituents_.find(label); it != symbol_constituents_.end()) {
        return it->second;
    }
    return NONE;
}

Docs AssemblyProject::symbols_docs(const SymbolTable &table) const {
    auto header = std::vector<Docs>{};
    header.push_back(Docs::plain_text("Visibility"));
    header.push_back(Docs::plain_text("Symbol"));
    header.push_back(Docs::plain_text("Section"));
    header.push_back(Docs::plain_text("Defined in"));

    auto rows = std::vector<std::vector<Docs>>{};
    for (const auto &[name, info] : table) {
        auto names = std::vector<Docs>{};
        names.push_back(Docs::inline_code(name));
        if (info.visibility != Visibility::EXTERNAL) {
            for (const auto &sub_label : constituents_of(name)) {
                names.push_back(Docs::indent(Docs::inline_code(sub_label)));
            }
        }

        auto row = std::vector<Docs>{};
        row.push_back(Docs::plain_text(std::string{ visibility_name(info.visibility) }));
        row.push_back(Docs::cell_lines(std::move(names)));
        row.push_back(Docs::plain_text(info.section ? std::string{ section_name(*info.section) } : std::string{}));

        auto source = internal_externs_.find(name);
        if (info.visibility == Visibility::EXTERNAL && source != internal_externs_.end()) {
            row.push_back(Docs::resolve_file(source->second));
        } else {
            row.push_back(Docs::plain_text(""));
        }

        rows.push_back(std::move(row));
    }

    return Docs::table(std::move(header), std::move(rows));
}

std::vector<std::pair<std::filesystem::path, Docs>> AssemblyProject::generate_docs() const {
    auto result = std::vector<std::pair<std::filesystem::path, Docs>>{};

    for (const auto &[path, file] : files_) {
        auto defines = std::vector<Docs>{};
        for (const auto &define : file.defines) {
            defines.push_back(Docs::define(define.name));
        }

        auto macros = std::vector<Docs>{};
        for (const auto &macro : file.macros) {
            macros.push_back(Docs::macro(macro.name, macro.arg_count));
        }

        const SymbolTable *table = symbols_of(path);
        auto symbols = table ? symbols_docs(*table) : Docs::table({}, {});

        result.emplace_back(path, Docs::file(path, std::move(symbols), Docs::list(std::move(defines)), Docs::list(std::move(macros))));
    }
    return result;
}
