#pragma once

#include <string_view>
#include <vector>

#include "types.hpp"

// Command line options

struct Options {
    std::string_view out_dir = "docs";
    std::vector<std::string_view> paths; // files or directories
    bool keep_going = false; // document the files that parsed even if others failed
    bool dry_run = false; // parse and resolve only
};

// Returns false (after printing why) when the program should stop.
bool parse_options(int argc, const char *const *argv, Options &out);

// The output path must be a directory or not exist yet.
bool validate_output_dir(std::string_view out_dir);
