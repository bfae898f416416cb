/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "json2msgp.h"
#include "utils/fs_utils.h"
#include "utils/hash_utils.h"
#include "utils/log.h"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

struct Settings {
    std::optional<fs::path> output;
    std::optional<fs::path> hints_path;
    j2m::TypeHints cli_hints;
    bool strict = false;
    bool digest = false;
    bool debug = false;
};

static void print_usage() {
    J2M_LOG_INFO(
        "Usage:\n" \
        "    json2msgp <file-or-dir|-> [-o <path|->] [--hints <file>] [--hint <key>=<tag>[,<tag>...]]\n" \
        "              [--strict] [--digest] [--debug]\n\n" \
        "Options:\n" \
        "    First argument must be a .json file, a directory or - for stdin\n" \
        "    -o            output file (or directory when converting a directory), - for stdout\n" \
        "    --hints       JSON file with numeric type hints, e.g. {\"Fee\": [\"int64\"]}\n" \
        "    --hint        single hint; an empty key applies to unnamed array elements\n" \
        "    --strict      fail when a hinted number does not fit its type\n" \
        "    --digest      logs the blake3 digest of each output\n" \
        "    --debug       enables extra logging\n"
    );
    J2M_LOG_INFO("[INFO] <name>_hints.json next to an input is loaded automatically.");
    J2M_LOG_INFO(
        "[INFO] Tags: byte int8 int16 int32 int64 int uint8 uint16 uint32 uint64 uint float32 float64"
    );
}

static bool parse_hint_arg(std::string_view arg, j2m::TypeHints& hints) {
    const auto eq = arg.find('=');
    if (eq == std::string_view::npos) {
        return false;
    }
    const std::string key(arg.substr(0, eq));
    std::string_view rest = arg.substr(eq + 1);
    std::vector<std::string> tags;
    while (!rest.empty()) {
        const auto comma = rest.find(',');
        const auto tag = rest.substr(0, comma);
        if (tag.empty()) {
            return false;
        }
        tags.emplace_back(tag);
        if (comma == std::string_view::npos) {
            break;
        }
        rest = rest.substr(comma + 1);
        if (rest.empty()) {
            return false;
        }
    }
    if (tags.empty()) {
        return false;
    }
    hints[key] = std::move(tags);
    return true;
}

static j2m::TypeHints resolve_hints(const fs::path& input, const Settings& settings) {
    j2m::TypeHints hints;
    if (!input.empty()) {
        const fs::path sidecar = j2m::fs_utils::hints_path_for(input);
        if (fs::exists(sidecar)) {
            hints = j2m::Json2Msgp::LoadTypeHints(sidecar);
            if (settings.debug) {
                J2M_LOG_INFO("Hints: %s (%zu keys)", sidecar.string().c_str(), hints.size());
            }
        }
    }
    if (settings.hints_path.has_value()) {
        j2m::msgp::merge_type_hints(hints, j2m::Json2Msgp::LoadTypeHints(*settings.hints_path));
    }
    j2m::msgp::merge_type_hints(hints, settings.cli_hints);
    return hints;
}

static void log_digest(const std::string& what, const std::vector<std::uint8_t>& bytes) {
    const auto digest = j2m::hash_utils::blake3_hash32(bytes);
    J2M_LOG_INFO("blake3 %s: %s", what.c_str(), j2m::hash_utils::to_hex(digest).c_str());
}

static bool process_stream(const Settings& settings) {
    try {
        const auto hints = resolve_hints({}, settings);
        j2m::ConvertOptions opt{};
        opt.strict_hints = settings.strict;
        opt.debug = settings.debug;

        std::ostringstream buffer(std::ios::binary);
        j2m::Json2Msgp::ConvertStream(std::cin, buffer, hints, opt, "<stdin>");
        const std::string out = buffer.str();
        const std::vector<std::uint8_t> bytes(out.begin(), out.end());

        if (settings.output.has_value() && settings.output->string() != "-") {
            j2m::fs_utils::write_file(*settings.output, bytes);
            J2M_LOG_INFO("Wrote: %s", settings.output->string().c_str());
        } else {
            std::cout.write(out.data(), static_cast<std::streamsize>(out.size()));
            std::cout.flush();
            if (!std::cout) {
                throw j2m::IoError("failed writing to stdout");
            }
        }
        if (settings.digest) {
            log_digest("<stdin>", bytes);
        }
    } catch (const std::exception& e) {
        J2M_LOG_ERROR("Failed: <stdin> (%s)", e.what());
        return false;
    }
    return true;
}

static bool process_file(const fs::path& path, const fs::path& out_path, const Settings& settings) {
    try {
        const auto t0 = std::chrono::steady_clock::now();
        const auto hints = resolve_hints(path, settings);
        const auto text = j2m::fs_utils::read_text_file(path);
        if (text.empty()) {
            throw std::runtime_error("JSON file is empty: " + path.string());
        }
        const auto doc = j2m::Json2Msgp::ParseJson(text);

        j2m::ConvertOptions opt{};
        opt.strict_hints = settings.strict;
        opt.debug = settings.debug;
        const auto bytes = j2m::Json2Msgp::Convert(doc, hints, opt);
        const auto t1 = std::chrono::steady_clock::now();

        if (out_path.string() == "-") {
            std::cout.write(
                reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size())
            );
            std::cout.flush();
            if (!std::cout) {
                throw j2m::IoError("failed writing to stdout");
            }
        } else {
            j2m::fs_utils::write_file(out_path, bytes);
            J2M_LOG_INFO("Wrote: %s", out_path.string().c_str());
        }

        if (settings.debug) {
            J2M_LOG_INFO(
                "Converted %s: json=%zu msgp=%zu total=%lldms", path.string().c_str(), text.size(),
                bytes.size(),
                static_cast<long long>(
                    std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count()
                )
            );
        }
        if (settings.digest) {
            log_digest(path.string(), bytes);
        }
    } catch (const std::exception& e) {
        J2M_LOG_ERROR("Failed: %s (%s)", path.string().c_str(), e.what());
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 2;
    }

    const std::string_view first_arg = argv[1];
    if (first_arg.size() > 1 && first_arg[0] == '-') {
        J2M_LOG_ERROR("First argument must be a file, a folder or -.");
        print_usage();
        return 2;
    }
    const fs::path input = fs::path(std::string(first_arg));
    Settings settings;
    for (int i = 2; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (arg == "--strict") {
            settings.strict = true;
            continue;
        }
        if (arg == "--digest") {
            settings.digest = true;
            continue;
        }
        if (arg == "--debug") {
            settings.debug = true;
            continue;
        }
        if (arg == "-o" || arg == "--hints" || arg == "--hint") {
            if (i + 1 >= argc) {
                J2M_LOG_ERROR("Missing value for %s", std::string(arg).c_str());
                return 2;
            }
            const std::string_view value = argv[++i];
            if (arg == "-o") {
                settings.output = fs::path(std::string(value));
            } else if (arg == "--hints") {
                settings.hints_path = fs::path(std::string(value));
            } else if (!parse_hint_arg(value, settings.cli_hints)) {
                J2M_LOG_ERROR("Invalid --hint value: %s", std::string(value).c_str());
                return 2;
            }
            continue;
        }
        J2M_LOG_ERROR("Unknown option: %s", std::string(arg).c_str());
        return 2;
    }

    const bool to_stdout = settings.output.has_value() && settings.output->string() == "-";
    if (first_arg == "-" || to_stdout) {
        j2m::log::info_to_stderr();
    }

    if (first_arg == "-") {
        return process_stream(settings) ? 0 : 1;
    }

    if (!fs::exists(input)) {
        J2M_LOG_ERROR("Input does not exist: %s", input.string().c_str());
        return 2;
    }

    const fs::path out_root = j2m::fs_utils::executable_dir() / "output" / "msgp";

    if (fs::is_directory(input)) {
        if (to_stdout) {
            J2M_LOG_ERROR("-o - cannot be used with a directory input");
            return 2;
        }
        const fs::path out_dir = settings.output.value_or(out_root);
        j2m::fs_utils::ensure_dir(out_dir);
        int failed = 0;
        for (const auto& p : j2m::fs_utils::collect_inputs(input)) {
            const fs::path rel = p.lexically_relative(input);
            fs::path out_path = out_dir / rel;
            out_path.replace_extension(".msgp");
            if (!process_file(p, out_path, settings)) {
                failed++;
            }
        }
        return failed == 0 ? 0 : 1;
    }

    fs::path out_path = settings.output.value_or(out_root / input.filename());
    if (!settings.output.has_value()) {
        out_path.replace_extension(".msgp");
    }
    return process_file(input, out_path, settings) ? 0 : 1;
}
