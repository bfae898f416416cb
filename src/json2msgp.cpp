/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "json2msgp.h"

#include "msgp/msgp_context.h"
#include "msgp/msgp_encoder.h"
#include "msgp/msgp_writer.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <array>
#include <chrono>
#include <cstddef>
#include <istream>
#include <ostream>
#include <string>

namespace j2m {

static void normalize_numbers(nlohmann::json& j) {
    if (j.is_number_unsigned()) {
        j = static_cast<double>(j.get<std::uint64_t>());
    } else if (j.is_number_integer()) {
        j = static_cast<double>(j.get<std::int64_t>());
    } else if (j.is_object() || j.is_array()) {
        for (auto& el : j) {
            normalize_numbers(el);
        }
    }
}

static std::string read_all(std::istream& in) {
    std::string text;
    std::array<char, 64 * 1024> chunk{};
    while (in.read(chunk.data(), static_cast<std::streamsize>(chunk.size())) || in.gcount() > 0) {
        text.append(chunk.data(), static_cast<std::size_t>(in.gcount()));
    }
    if (in.bad()) {
        throw IoError("ConvertStream: failed reading input");
    }
    return text;
}

static long long elapsed_ms(
    std::chrono::steady_clock::time_point from,
    std::chrono::steady_clock::time_point to
) {
    return static_cast<long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count()
    );
}

std::vector<std::uint8_t>
Json2Msgp::Convert(const nlohmann::json& value, const TypeHints& hints, const ConvertOptions& opt) {
    msgp::MsgpWriter out;
    const msgp::EncodeEnv env{hints, msgp::EncodeOptions{opt.strict_hints}};
    msgp::encode_value(out, value, msgp::ConvertContext{}, env);
    return out.take();
}

std::vector<std::uint8_t>
Json2Msgp::Convert(const nlohmann::json* value, const TypeHints& hints, const ConvertOptions& opt) {
    if (value == nullptr) {
        msgp::MsgpWriter out(1);
        out.write_nil();
        return out.take();
    }
    return Convert(*value, hints, opt);
}

nlohmann::json Json2Msgp::ParseJson(std::string_view text) {
    using parse_event_t = nlohmann::json::parse_event_t;
    const nlohmann::json::parser_callback_t limit_depth =
        [](int depth, parse_event_t event, nlohmann::json&) {
            if ((event == parse_event_t::object_start || event == parse_event_t::array_start) &&
                static_cast<std::size_t>(depth) >= msgp::kMaxNestingDepth) {
                throw ParseError("unmarshalling JSON: exceeded max depth");
            }
            return true;
        };

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text.begin(), text.end(), limit_depth);
    } catch (const nlohmann::json::exception& e) {
        throw ParseError(std::string("unmarshalling JSON: ") + e.what());
    }
    normalize_numbers(j);
    return j;
}

void Json2Msgp::ConvertStream(
    std::istream& in,
    std::ostream& out,
    const TypeHints& hints,
    const ConvertOptions& opt,
    std::string_view label
) {
    const auto t0 = std::chrono::steady_clock::now();
    const std::string text = read_all(in);
    const auto t1 = std::chrono::steady_clock::now();
    const auto doc = ParseJson(text);
    const auto t2 = std::chrono::steady_clock::now();
    const auto bytes = Convert(doc, hints, opt);
    const auto t3 = std::chrono::steady_clock::now();

    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
        throw IoError("ConvertStream: failed writing output");
    }

    if (opt.debug) {
        const std::string name = label.empty() ? std::string("<stream>") : std::string(label);
        J2M_LOG_INFO(
            "Converted %s: json=%zu msgp=%zu read=%lldms parse=%lldms encode=%lldms",
            name.c_str(), text.size(), bytes.size(), elapsed_ms(t0, t1), elapsed_ms(t1, t2),
            elapsed_ms(t2, t3)
        );
    }
}

TypeHints Json2Msgp::LoadTypeHints(const std::filesystem::path& path) {
    const auto text = fs_utils::read_text_file(path);
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        throw ParseError("type hints " + path.string() + ": " + e.what());
    }
    return msgp::type_hints_from_json(j);
}

}  // namespace j2m
