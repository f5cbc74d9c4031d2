#pragma once

#include <optional>
#include <vector>
#include <string>
#include <string_view>
#include <cstring> // std::strlen()
#include <stdexcept> // std::invalid_argument
#include <cctype>
#include <type_traits> // std::is_same_v

#include "tsl/robin_map.h"

#include "types.hpp"

namespace Detail {
    inline bool equals_lowercase(std::string_view lhs, std::string_view rhs) {
        if (lhs.length() != rhs.length()) return false;

        for (std::size_t i = 0; i < lhs.length(); ++i) {
            if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i]))) return false;
        }
        return true;
    }
}

namespace ArgParsers {
    template<typename T>
    bool parse_to(std::string_view string, T *out);

    template<>
    inline bool parse_to<bool>(std::string_view string, bool *out) {
        using namespace Detail;

        if (string == "0" || equals_lowercase(string, "false")) {
            *out = false;
            return true;
        }

        if (string == "1" || equals_lowercase(string, "true")) {
            *out = true;
            return true;
        }

        return false;
    }

    template<>
    inline bool parse_to<std::string_view>(std::string_view string, std::string_view *out) {
        if (string.empty()) return false;
        *out = string;
        return true;
    }
}

// Minimal getopt replacement. Supports `-o value`, `-o=value`, `--long value`,
// `--long=value`, clustered short flags (`-kd`) and `--` to end option parsing.
class Args {
    using CallbackFn = bool(void*, std::string_view);
    struct Arg {
        void *out_ptr;
        bool is_flag;
        std::optional<std::string_view> error_msg;
        CallbackFn *callback;
    };
public:
    struct ParseResult {
        std::vector<std::string_view> remaining_args;
        std::vector<std::string_view> unrecognized_options;
        std::vector<std::string> invalid_values; // one message per rejected value
    };

    static Args parser() {
        return Args();
    }

    template<typename T>
    Args &add_arg(std::string_view short_form, std::string_view long_form, T &out, std::optional<std::string_view> error_msg) {
        if (short_form.empty() && long_form.empty()) {
            throw std::invalid_argument("can't have both short and long forms of an argument empty");
        }

        auto arg = Arg {
            .out_ptr = &out,
            .is_flag = std::is_same_v<T, bool>,
            .error_msg = error_msg,
            .callback = [](void *raw_out_ptr, std::string_view val) {
                return ArgParsers::parse_to(val, static_cast<T*>(raw_out_ptr));
            }
        };

        if (!short_form.empty()) arg_map.insert({ std::string{ short_form }, arg });
        if (!long_form.empty()) arg_map.insert({ std::string{ long_form }, arg });

        return *this;
    }

    template<typename T>
    Args &add_arg(std::string_view short_form, std::string_view long_form, T &out) {
        return add_arg(short_form, long_form, out, std::nullopt);
    }

    template<typename T>
    Args &add_arg(std::string_view long_form, T &out) {
        return add_arg("", long_form, out, std::nullopt);
    }

    ParseResult parse(std::size_t argc, const char *const *argv) {
        auto result = ParseResult{};

        // Skip 0 (application name)
        for (std::size_t i = 1; i < argc; ++i) {
            const auto input = to_str_view(argv[i]);

            if (input == "--") {
                // rest are positional args and not parsed
                for (std::size_t j = i + 1; j < argc; ++j) {
                    result.remaining_args.push_back(to_str_view(argv[j]));
                }
                break;
            }

            auto next = i + 1 < argc ? std::optional{ to_str_view(argv[i + 1]) } : std::nullopt;
            const bool had_next = next.has_value();

            parse_input(input, next, result);

            // The value was consumed by an option
            if (had_next && !next) i += 1;
        }

        return result;
    }

private:
    static std::string_view to_str_view(const char *c_str) {
        if (!c_str) return {};
        return std::string_view(c_str, std::strlen(c_str));
    }

    void parse_input(std::string_view input, std::optional<std::string_view> &next, ParseResult &result) {
        if (!input.starts_with("-") || input == "-") {
            result.remaining_args.push_back(input);
            return;
        }
        input = input.substr(1);

        if (input.starts_with("-")) {
            // --flag, --option, --option="docs", --option docs
            parse_option(input.substr(1), next, result);
        } else {
            // -k, -o docs, -o=docs, -kd
            parse_short_options(input, next, result);
        }
    }

    void parse_short_options(std::string_view option, std::optional<std::string_view> &next, ParseResult &result) {
        const bool is_known = arg_map.find(std::string{ option.substr(0, option.find_first_of('=')) }) != arg_map.end();
        if (is_known || option.length() == 1 || option.find_first_of('=') != option.npos) {
            parse_option(option, next, result);
            return;
        }

        // Every letter can be a flag, so check all
        for (std::size_t i = 0; i < option.length(); ++i) {
            auto none = std::optional<std::string_view>{};
            parse_option(option.substr(i, 1), none, result);
        }
    }

    void parse_option(std::string_view option, std::optional<std::string_view> &next, ParseResult &result) {
        auto value = std::string_view{};
        bool has_value = false;
        if (const auto idx = option.find_first_of('='); idx != option.npos) {
            value = option.substr(idx + 1);
            option = option.substr(0, idx);
            has_value = true;
        }

        auto it = arg_map.find(std::string{ option });
        if (it == arg_map.end()) {
            result.unrecognized_options.push_back(option);
            return;
        }

        const Arg &mapping = it->second;
        if (!has_value) {
            if (mapping.is_flag) value = "1";
            else if (next.has_value()) {
                value = next.value();
                next.reset();
            }
        }

        if (!(mapping.callback)(mapping.out_ptr, value)) {
            if (mapping.error_msg) {
                result.invalid_values.push_back(std::string{ mapping.error_msg.value() });
            } else {
                result.invalid_values.push_back(
                    "Failed to parse value \"" + std::string{ value } + "\" for option \"" + std::string{ option } + "\"");
            }
        }
    }

    tsl::robin_map<std::string, Arg> arg_map;
};
