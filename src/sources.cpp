#include "sources.hpp"

#include <fstream>
#include <algorithm>
#include <system_error>

bool can_parse(const std::filesystem::path &path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) return false;

    const auto ext = path.extension();
    return ext == ".asm" || ext == ".nasm";
}

bool collect_sources(const std::vector<std::string_view> &paths, std::vector<std::filesystem::path> &out, std::string &error) {
    namespace fs = std::filesystem;

    for (auto arg : paths) {
        const auto path = fs::path(arg);
        if (can_parse(path)) {
            out.push_back(path);
            continue;
        }

        std::error_code ec;
        if (!fs::is_directory(path, ec)) continue;

        auto it = fs::recursive_directory_iterator(path, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (can_parse(it->path())) out.push_back(it->path());
        }
        if (ec) {
            error = "cannot read directory '" + path.string() + "': " + ec.message();
            return false;
        }
    }

    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return true;
}

bool read_file(const std::filesystem::path &path, std::string &out) {
    std::ifstream stream(path, std::ios::in | std::ios::binary);
    if (!stream) return false;

    stream.seekg(0, std::ios::end);
    const auto size = stream.tellg();
    if (size < 0) return false;

    auto buf = std::string();
    buf.resize(std::size_t(size));
    stream.seekg(0, std::ios::beg);
    stream.read(buf.data(), std::streamsize(buf.size()));
    if (!stream) return false;

    if (!buf.empty() && buf.back() != '\n') buf += '\n';
    out = std::move(buf);
    return true;
}

bool is_valid_utf8(std::string_view text) {
    std::size_t i = 0;
    while (i < text.length()) {
        const auto c = static_cast<unsigned char>(text[i]);

        std::size_t len = 0;
        if (c < 0x80) len = 1;
        else if ((c & 0xE0) == 0xC0 && c >= 0xC2) len = 2;
        else if ((c & 0xF0) == 0xE0) len = 3;
        else if ((c & 0xF8) == 0xF0 && c <= 0xF4) len = 4;
        else return false;

        if (i + len > text.length()) return false;
        for (std::size_t j = 1; j < len; ++j) {
            if ((static_cast<unsigned char>(text[i + j]) & 0xC0) != 0x80) return false;
        }

        // Overlong three/four byte forms, surrogates and code points past U+10FFFF.
        if (len == 3) {
            const auto c1 = static_cast<unsigned char>(text[i + 1]);
            if ((c == 0xE0 && c1 < 0xA0) || (c == 0xED && c1 >= 0xA0)) return false;
        } else if (len == 4) {
            const auto c1 = static_cast<unsigned char>(text[i + 1]);
            if ((c == 0xF0 && c1 < 0x90) || (c == 0xF4 && c1 >= 0x90)) return false;
        }

        i += len;
    }
    return true;
}
