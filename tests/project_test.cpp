#include <cassert>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "parser.hpp"
#include "assembly_project.hpp"

static AssemblyFile parse_ok(std::string_view name, std::string_view src){
    AssemblyFile file; ParseError err;
    bool ok = Parser::parse<NasmSyntax>(name, src, file, err);
    if(!ok) std::cerr << "unexpected parse error: " << to_string(err) << "\n";
    assert(ok);
    return file;
}

static AssemblyFiles two_files(){
    AssemblyFiles files;
    files.emplace("src/a.asm", parse_ok("a.asm",
        "global foo\nsection .text\nfoo:\n    ret\nhelper:\n    ret\n"));
    files.emplace("src/b.asm", parse_ok("b.asm",
        "extern foo\nextern puts\nsection .text\nglobal main\nmain:\n    call foo\n"));
    return files;
}

static void test_visibility(){
    auto project = AssemblyProject::build_from(two_files());

    const SymbolTable *a = project.symbols_of("src/a.asm");
    const SymbolTable *b = project.symbols_of("src/b.asm");
    assert(a && b);

    const SymbolInfo *foo_a = a->find("foo");
    assert(foo_a && foo_a->visibility == Visibility::GLOBAL);
    assert(foo_a->section == AssemblySection::TEXT);

    const SymbolInfo *helper = a->find("helper");
    assert(helper && helper->visibility == Visibility::PRIVATE);

    const SymbolInfo *foo_b = b->find("foo");
    assert(foo_b && foo_b->visibility == Visibility::EXTERNAL);
    assert(!foo_b->section.has_value());

    assert(project.global_sources().at("foo") == "src/a.asm");
    assert(project.global_sources().at("main") == "src/b.asm");
    assert(project.internal_externs().at("foo") == "src/a.asm");

    // Externs first, then labels in encounter order.
    std::vector<std::string> order;
    for(const auto &[name, info] : *b) order.push_back(name);
    assert((order == std::vector<std::string>{ "foo", "puts", "main" }));

    assert(project.symbols_of("src/missing.asm") == nullptr);
}

static void test_unresolved_extern(){
    auto project = AssemblyProject::build_from(two_files());
    assert(project.internal_externs().find("puts") == project.internal_externs().end());
    const SymbolInfo *puts = project.symbols_of("src/b.asm")->find("puts");
    assert(puts && puts->visibility == Visibility::EXTERNAL);
}

static void test_sub_labels(){
    AssemblyFiles files;
    files.emplace("loop.asm", parse_ok("loop.asm",
        ".orphan:\nsection .text\nlabel:\n.sub1:\n    dec rcx\n.sub2:\n    jnz .sub1\nsection .data\n.table:\nother:\n"));
    auto project = AssemblyProject::build_from(std::move(files));

    const auto &subs = project.constituents_of("label");
    // .table follows label in scan order: sections are visited text before data.
    assert((subs == std::vector<std::string>{ ".sub1", ".sub2", ".table" }));
    assert(project.constituents_of("other").empty());

    const SymbolTable *table = project.symbols_of("loop.asm");
    assert(table->size() == 2);
    assert(table->find("label") && table->find("other"));
    assert(!table->find(".sub1") && !table->find(".sub2") && !table->find(".orphan"));
    assert(table->find("other")->section == AssemblySection::DATA);

    // An owner-less sub-label is not recorded anywhere.
    for(const auto &[label, names] : project.symbol_constituents()){
        for(const auto &name : names) assert(name != ".orphan");
    }
}

static void test_label_overrides_extern(){
    AssemblyFiles files;
    files.emplace("self.asm", parse_ok("self.asm", "extern thing\nextern other\nthing:\n"));
    auto project = AssemblyProject::build_from(std::move(files));
    const SymbolTable *table = project.symbols_of("self.asm");
    assert(table->size() == 2);
    assert(table->begin()->first == "thing");
    assert(table->find("thing")->visibility == Visibility::PRIVATE);
    assert(table->find("other")->visibility == Visibility::EXTERNAL);
}

static void test_global_collision_first_wins(){
    AssemblyFiles files;
    files.emplace("z.asm", parse_ok("z.asm", "global dup\ndup:\n"));
    files.emplace("m.asm", parse_ok("m.asm", "global dup\ndup:\n"));
    files.emplace("user.asm", parse_ok("user.asm", "extern dup\n"));
    auto project = AssemblyProject::build_from(std::move(files));

    assert(project.global_sources().at("dup") == "m.asm");
    assert(project.internal_externs().at("dup") == "m.asm");
    assert(project.collisions().size() == 1);
    assert(project.collisions()[0].name == "dup");
    assert(project.collisions()[0].kept == "m.asm");
    assert(project.collisions()[0].ignored == "z.asm");

    // Both definitions are still global in their own files.
    assert(project.symbols_of("z.asm")->find("dup")->visibility == Visibility::GLOBAL);
}

static void test_resolution_is_pure(){
    auto first = AssemblyProject::build_from(two_files());
    auto second = AssemblyProject::build_from(two_files());
    assert(first.global_sources() == second.global_sources());
    assert(first.internal_externs() == second.internal_externs());
    assert(first.symbols() == second.symbols());
    assert(first.symbol_constituents() == second.symbol_constituents());

    auto empty = AssemblyProject::build_from({});
    assert(empty.files().empty() && empty.symbols().empty() && empty.global_sources().empty());
}

void run_project_tests(){
    std::cout << "[project] tests...\n";
    test_visibility();
    test_unresolved_extern();
    test_sub_labels();
    test_label_overrides_extern();
    test_global_collision_first_wins();
    test_resolution_is_pure();
    std::cout << "[project] tests passed\n";
}
