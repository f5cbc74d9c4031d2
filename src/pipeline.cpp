#include "pipeline.hpp"

#include <fstream>
#include <map>
#include <vector>
#include <string>
#include <system_error>

#include "parser.hpp"
#include "sources.hpp"
#include "options.hpp"

bool parse_source_file(Logging &logging, const std::filesystem::path &path, AssemblyFiles &files) {
    auto source = std::string{};
    if (!read_file(path, source)) {
        Message::error(logging).printf("Error: Could not read '%s'", path.string().c_str());
        return false;
    }

    if (!is_valid_utf8(source)) {
        Message::error(logging).printf("Error: '%s' is not valid UTF-8 text", path.string().c_str());
        return false;
    }

    const auto name = path.string();
    auto file = AssemblyFile{};
    auto error = ParseError{};
    if (!Parser::parse<NasmSyntax>(name, source, file, error)) {
        report_parse_error(logging, error, source);
        return false;
    }

    files.insert_or_assign(path, std::move(file));
    return true;
}

DocsFileMap build_file_map(const std::vector<std::pair<std::filesystem::path, Docs>> &docs, const Backend &backend) {
    auto file_map = DocsFileMap{};
    for (const auto &[path, tree] : docs) {
        auto output = path.filename();
        output.replace_extension(backend.extension());
        file_map.insert({ path, output });
    }
    return file_map;
}

bool write_docs(Logging &logging, const std::vector<std::pair<std::filesystem::path, Docs>> &docs,
        const Backend &backend, const std::filesystem::path &out_dir) {
    std::error_code ec;
    std::filesystem::create_directories(out_dir, ec);
    if (ec) {
        Message::error(logging).printf("Error: Could not create '%s': %s", out_dir.string().c_str(), ec.message().c_str());
        return false;
    }

    const auto file_map = build_file_map(docs, backend);

    // Files in different directories can share a name; the later one would
    // silently replace the earlier one's documentation.
    auto written = std::map<std::filesystem::path, std::filesystem::path>{};

    bool ok = true;
    for (const auto &[path, tree] : docs) {
        const auto &relative = file_map.at(path);
        if (auto [it, inserted] = written.insert({ relative, path }); !inserted) {
            Message::warning(logging)
                .printf("Warning: Documentation for '%s' overwrites that of '%s' (%s)",
                    path.string().c_str(), it->second.string().c_str(), relative.string().c_str());
            it->second = path;
        }

        auto text = std::string{};
        auto error = std::string{};
        if (!backend.render(tree, file_map, text, error)) {
            Message::error(logging).printf("Error: Could not render documentation for '%s': %s",
                path.string().c_str(), error.c_str());
            ok = false;
            continue;
        }

        const auto output_path = out_dir / relative;
        std::ofstream stream(output_path, std::ios::out | std::ios::binary | std::ios::trunc);
        stream.write(text.data(), std::streamsize(text.size()));
        if (!stream) {
            Message::error(logging).printf("Error: Could not write '%s'", output_path.string().c_str());
            ok = false;
        }
    }
    return ok;
}

int run(const Options &opts) {
    auto logging = Logging{};

    auto sources = std::vector<std::filesystem::path>{};
    auto error = std::string{};
    if (!collect_sources(opts.paths, sources, error)) {
        Message::error(logging).printf("Error: %s", error.c_str());
        return 1;
    }

    if (sources.empty()) {
        Message::warning(logging).printf("Warning: No .asm or .nasm files found.");
    }

    // Every file is parsed even after a failure so all errors are shown at once.
    auto files = AssemblyFiles{};
    bool parse_failed = false;
    for (const auto &path : sources) {
        if (!parse_source_file(logging, path, files)) parse_failed = true;
    }

    if (parse_failed && !opts.keep_going) {
        report_summary(logging);
        return 1;
    }

    auto project = AssemblyProject::build_from(std::move(files));
    report_collisions(logging, project);

    if (opts.dry_run) {
        Message::misc().printf("Dry run finished (%zu file(s) resolved)", project.files().size());
        report_summary(logging);
        return parse_failed ? 1 : 0;
    }

    const auto backend = MarkdownBackend{};
    const bool written = write_docs(logging, project.generate_docs(), backend, std::filesystem::path(opts.out_dir));

    report_summary(logging);
    return written && !parse_failed ? 0 : 1;
}
