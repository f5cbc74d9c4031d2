#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <filesystem>

// .asm and .nasm regular files.
bool can_parse(const std::filesystem::path &path);

// Expands `paths` into the parseable files they name: files are taken as is,
// directories are walked recursively. The result is sorted and deduplicated.
// Fails (with `error` set) only when a directory cannot be read.
bool collect_sources(const std::vector<std::string_view> &paths, std::vector<std::filesystem::path> &out, std::string &error);

// Reads the whole file. A trailing newline is added when missing so the last
// statement is terminated.
bool read_file(const std::filesystem::path &path, std::string &out);

// Source files must be UTF-8 text; anything else is rejected before lexing.
bool is_valid_utf8(std::string_view text);
