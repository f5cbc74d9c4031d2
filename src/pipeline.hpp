#pragma once

#include <string_view>
#include <vector>
#include <utility>
#include <filesystem>

#include "assembly_project.hpp"
#include "diagnostics.hpp"
#include "docs.hpp"
#include "options.hpp"

// Reads and parses one file into `files`. I/O, encoding and parse errors are
// reported through `logging`; the file is left out of `files` on failure.
bool parse_source_file(Logging &logging, const std::filesystem::path &path, AssemblyFiles &files);

// Source file -> `<stem>.<backend extension>`, relative to the output directory.
DocsFileMap build_file_map(const std::vector<std::pair<std::filesystem::path, Docs>> &docs, const Backend &backend);

// Renders every tree with `backend` into `out_dir`, creating it if needed.
bool write_docs(Logging &logging, const std::vector<std::pair<std::filesystem::path, Docs>> &docs,
    const Backend &backend, const std::filesystem::path &out_dir);

// Collects, parses, resolves and documents `opts.paths`. Returns the process
// exit status: 1 if any file failed to parse (even with keep_going) or any
// page could not be written, 0 otherwise.
int run(const Options &opts);
