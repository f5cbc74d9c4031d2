#include "assembly_file.hpp"

std::string_view section_name(AssemblySection section) {
    switch (section) {
        case AssemblySection::TEXT: return "text";
        case AssemblySection::DATA: return "data";
        case AssemblySection::BSS: return "bss";
        case AssemblySection::RO_DATA: return "read-only data";
        default: return "{??}";
    }
}

const std::vector<AssemblyItem> &AssemblyFile::items(AssemblySection section) const {
    static const std::vector<AssemblyItem> EMPTY{};
    if (auto it = sections.find(section); it != sections.end()) {
        return it->second;
    }
    return EMPTY;
}

bool AssemblyFile::is_global(std::string_view name) const {
    return globals.find(std::string{ name }) != globals.end();
}
