#include "options.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <iomanip>
#include <filesystem>
#include <system_error>

#include "args.hpp"

static void print_version() {
    std::printf("asmdoc version 0.1.0: documentation generator for NASM projects.\n");
}

static void print_option(const char *sform, const char* lform, const char *desc) {
    std::printf("  %-4s  %-18s   %s\n", sform, lform, desc);
}

static void print_help() {
    print_version();
    std::printf("\nBasic usage:\n");
    std::printf("  asmdoc [option(s)] <file or directory>...\n\n");

    std::printf("Options:\n");
    print_option("-o", "--output", "Output directory for generated documentation. (default: docs)");
    print_option("-k", "--keep-going", "Document the files that parsed even if others failed.");
    print_option("-d", "--dry", "Parses and resolves the project without writing anything.");
    print_option("", "--help", "Shows this page.");
    print_option("-v", "--version", "Shows version information.");
}

bool parse_options(int argc, const char *const *argv, Options &out) {
    bool help = false, // --help
        version = false; // -v, --version

    auto result = Args::parser()
        .add_arg("o", "output", out.out_dir, "Error: -o/--output expects a directory")
        .add_arg("k", "keep-going", out.keep_going)
        .add_arg("d", "dry", out.dry_run)
        .add_arg("help", help)
        .add_arg("v", "version", version)
        .parse(std::size_t(argc), argv);

    if (help) {
        print_help();
        std::exit(0);
    }

    if (version) {
        print_version();
        std::exit(0);
    }

    if (!result.invalid_values.empty()) {
        for (const auto &msg : result.invalid_values) {
            std::printf("%s\n", msg.c_str());
        }
        return false;
    }

    if (!result.unrecognized_options.empty()) {
        std::printf("Warning: Ignoring unrecognized options (");
        for (const auto &opt : result.unrecognized_options) {
            std::cout << std::quoted(opt) << " ";
        }
        std::printf("\b)\n\n");
    }

    if (result.remaining_args.empty()) {
        std::printf("No input files.\n");
        return false;
    }
    out.paths = std::move(result.remaining_args);

    return validate_output_dir(out.out_dir);
}

bool validate_output_dir(std::string_view out_dir) {
    namespace fs = std::filesystem;

    std::error_code ec;
    const auto path = fs::path(out_dir);
    if (fs::exists(path, ec) && !fs::is_directory(path, ec)) {
        std::printf("Error: Output path '%.*s' exists but is not a directory.\n", (int)out_dir.length(), out_dir.data());
        return false;
    }
    return true;
}
