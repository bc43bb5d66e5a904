/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "tagnorm.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

struct Settings {
    std::optional<fs::path> input_path;
    std::optional<fs::path> output_path;
    bool utc = false;
    std::size_t max_depth = 512;
    bool debug = false;
};

static void print_usage() {
    TAGNORM_LOG_STATUS(
        "Usage:\n" \
        "    tagnorm [<file>] [--output <file>] [--utc] [--max-depth <n>] [--debug]\n\n" \
        "Options:\n" \
        "    <file>           reads the tagged document from a file instead of stdin\n" \
        "    --output <file>  writes the normalized JSON to a file instead of stdout\n" \
        "    --utc            converts YYYY-MM-DDTHH:MM:SSZ timestamps as UTC instead of local time\n" \
        "    --max-depth <n>  omits L/M values nested deeper than <n> levels (default 512)\n" \
        "    --debug          enables extra logging\n"
    );
}

static std::optional<std::size_t> parse_size(std::string_view s) {
    if (s.empty()) {
        return std::nullopt;
    }
    std::size_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        const auto digit = static_cast<std::size_t>(c - '0');
        if (v > (std::numeric_limits<std::size_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        v = v * 10 + digit;
    }
    return v;
}

static std::string read_input(const Settings& settings) {
    if (settings.input_path.has_value()) {
        return tagnorm::fs_utils::read_text_file(*settings.input_path);
    }
    return tagnorm::fs_utils::read_stream(std::cin);
}

int main(int argc, char** argv) {
    const auto t0 = std::chrono::steady_clock::now();

    Settings settings;
    for (int i = 1; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        }
        if (arg == "--utc") {
            settings.utc = true;
            continue;
        }
        if (arg == "--debug") {
            settings.debug = true;
            continue;
        }
        if (arg == "--output") {
            if (i + 1 >= argc) {
                TAGNORM_LOG_ERROR("Missing value for --output");
                return 2;
            }
            settings.output_path = fs::path(argv[++i]);
            continue;
        }
        if (arg == "--max-depth") {
            if (i + 1 >= argc) {
                TAGNORM_LOG_ERROR("Missing value for --max-depth");
                return 2;
            }
            const auto depth = parse_size(argv[++i]);
            if (!depth.has_value()) {
                TAGNORM_LOG_ERROR("Invalid value for --max-depth: %s", argv[i]);
                return 2;
            }
            settings.max_depth = *depth;
            continue;
        }
        if (!arg.empty() && arg[0] == '-') {
            TAGNORM_LOG_ERROR("Unknown option: %s", std::string(arg).c_str());
            print_usage();
            return 2;
        }
        if (settings.input_path.has_value()) {
            TAGNORM_LOG_ERROR("Only one input file may be given.");
            return 2;
        }
        settings.input_path = fs::path(std::string(arg));
    }
    tagnorm::log::set_debug(settings.debug);

    std::string text;
    try {
        text = read_input(settings);
    } catch (const std::exception& e) {
        TAGNORM_LOG_ERROR("%s", e.what());
        return 2;
    }
    TAGNORM_LOG_DEBUG("Read %zu bytes", text.size());

    tagnorm::NormalizeOptions opt{};
    opt.decode.time_zone =
        settings.utc ? tagnorm::decode::TimeZoneMode::Utc : tagnorm::decode::TimeZoneMode::Local;
    opt.decode.max_depth = settings.max_depth;

    tagnorm::NormalizeResult res;
    try {
        res = tagnorm::TagNormalizer::NormalizeText(text, opt);
    } catch (const tagnorm::InputError& e) {
        TAGNORM_LOG_STATUS("Invalid JSON input.");
        TAGNORM_LOG_DEBUG("%s", e.what());
        return 1;
    } catch (const tagnorm::decode::DocumentError& e) {
        TAGNORM_LOG_STATUS("Invalid JSON input.");
        TAGNORM_LOG_DEBUG("%s", e.what());
        return 1;
    }
    TAGNORM_LOG_DEBUG("Surviving top-level fields: %zu", res.field_count);

    try {
        if (settings.output_path.has_value()) {
            tagnorm::fs_utils::write_text_file(*settings.output_path, res.text + "\n");
            TAGNORM_LOG_DEBUG("Wrote: %s", settings.output_path->string().c_str());
        } else {
            TAGNORM_LOG_INFO("%s", res.text.c_str());
        }
    } catch (const std::exception& e) {
        TAGNORM_LOG_ERROR("%s", e.what());
        return 2;
    }

    const auto t1 = std::chrono::steady_clock::now();
    const double seconds = std::chrono::duration<double>(t1 - t0).count();
    TAGNORM_LOG_STATUS("\nProcessing Time: %.6f seconds", seconds);
    return 0;
}
