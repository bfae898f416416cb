/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "json2msgp.h"
#include "msgp/msgp_context.h"
#include "test_bytes.h"
#include "utils/fs_utils.h"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <sstream>
#include <string>

using j2m::Json2Msgp;
using j2m::TypeHints;
using j2m::test::data_dir;
using j2m::test::from_hex;

namespace fs = std::filesystem;

namespace {
std::string run_stream(const std::string& input, const TypeHints& hints = {}) {
    std::istringstream in(input);
    std::ostringstream out(std::ios::binary);
    Json2Msgp::ConvertStream(in, out, hints);
    return out.str();
}

std::vector<std::uint8_t> as_bytes(const std::string& s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}
}  // namespace

// ============================================================================
// Recorded system-variable vectors
// ============================================================================

class RecordedVectorTest : public ::testing::TestWithParam<const char*> {};

TEST_P(RecordedVectorTest, MatchesRecordedBytes) {
    const std::string name = GetParam();
    const fs::path input = data_dir() / (name + ".json");
    const fs::path expected = data_dir() / (name + ".msgp.hex");

    TypeHints hints;
    const fs::path sidecar = j2m::fs_utils::hints_path_for(input);
    if (fs::exists(sidecar)) {
        hints = Json2Msgp::LoadTypeHints(sidecar);
    }

    const auto got = run_stream(j2m::fs_utils::read_text_file(input), hints);
    EXPECT_EQ(as_bytes(got), from_hex(j2m::fs_utils::read_text_file(expected)));
}

INSTANTIATE_TEST_SUITE_P(
    SystemVariables,
    RecordedVectorTest,
    ::testing::Values(
        "AccountAttributes",
        "CommandValidatorChangeAddress",
        "DefaultRecourseDuration",
        "EAIFeeTable",
        "LockedRateTable",
        "MinDurationBetweenNodeRewardNominations",
        "MinNodeRegistrationStakeAmount",
        "NodeGoodnessFunction",
        "NodeRewardNominationTimeout",
        "NominateNodeRewardAddress",
        "ReleaseFromEndowmentAddress",
        "TransactionFeeScript",
        "UnlockedRateTable",
        "svi"
    )
);

// ============================================================================
// Stream behaviour
// ============================================================================

TEST(ConvertStreamTest, SimpleDocuments) {
    EXPECT_EQ(as_bytes(run_stream(R"("foo")")), from_hex("a3 66 6f 6f"));
    EXPECT_EQ(as_bytes(run_stream("  [1, 2]\n")), from_hex("92 01 02"));
    EXPECT_EQ(as_bytes(run_stream("null")), from_hex("c0"));
}

TEST(ConvertStreamTest, IsDeterministic) {
    const std::string text = j2m::fs_utils::read_text_file(data_dir() / "svi.json");
    const TypeHints hints = Json2Msgp::LoadTypeHints(data_dir() / "svi_hints.json");
    EXPECT_EQ(run_stream(text, hints), run_stream(text, hints));
}

TEST(ConvertStreamTest, NothingWrittenOnParseError) {
    std::istringstream in("{\"a\": [1, 2");
    std::ostringstream out;
    EXPECT_THROW(Json2Msgp::ConvertStream(in, out), j2m::ParseError);
    EXPECT_TRUE(out.str().empty());
}

TEST(ConvertStreamTest, NothingWrittenOnEncodeError) {
    std::istringstream in(R"({"a": "fine", "b": [1, 2, 3.25]})");
    std::ostringstream out;
    EXPECT_THROW(Json2Msgp::ConvertStream(in, out), j2m::UnsupportedNumericValue);
    EXPECT_TRUE(out.str().empty());

    std::istringstream in2(R"({"a": 1})");
    const TypeHints hints{{"a", {"bignum"}}};
    EXPECT_THROW(Json2Msgp::ConvertStream(in2, out, hints), j2m::UnsupportedTypeHint);
    EXPECT_TRUE(out.str().empty());
}

TEST(ConvertStreamTest, DeeplyNestedInputIsRejected) {
    const std::string text = std::string(100000, '[') + std::string(100000, ']');
    std::istringstream in(text);
    std::ostringstream out;
    try {
        Json2Msgp::ConvertStream(in, out);
        FAIL() << "expected ParseError";
    } catch (const j2m::ParseError& e) {
        EXPECT_NE(std::string(e.what()).find("exceeded max depth"), std::string::npos);
    }
    EXPECT_TRUE(out.str().empty());
}

TEST(ConvertStreamTest, NestingLimitIsInclusive) {
    const std::size_t limit = j2m::msgp::kMaxNestingDepth;
    const std::string at_limit = std::string(limit, '[') + std::string(limit, ']');
    const std::string output = run_stream(at_limit);
    ASSERT_EQ(output.size(), limit);
    EXPECT_EQ(static_cast<std::uint8_t>(output.back()), 0x90);

    const std::string past_limit = std::string(limit + 1, '[') + std::string(limit + 1, ']');
    EXPECT_THROW(run_stream(past_limit), j2m::ParseError);
    const std::string nested_objects = std::string(limit, '[') + "{\"a\":{}}" + std::string(limit, ']');
    EXPECT_THROW(run_stream(nested_objects), j2m::ParseError);
}

TEST(ConvertStreamTest, FailedInputStream) {
    std::istringstream in("[1]");
    in.setstate(std::ios::badbit);
    std::ostringstream out;
    EXPECT_THROW(Json2Msgp::ConvertStream(in, out), j2m::IoError);
    EXPECT_TRUE(out.str().empty());
}

TEST(ConvertStreamTest, FailedOutputStream) {
    std::istringstream in("[1]");
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    EXPECT_THROW(Json2Msgp::ConvertStream(in, out), j2m::IoError);
}

TEST(ConvertStreamTest, HintsFromFile) {
    const TypeHints hints = Json2Msgp::LoadTypeHints(data_dir() / "LockedRateTable_hints.json");
    ASSERT_EQ(hints.size(), 1u);
    const auto& seq = hints.at("");
    ASSERT_EQ(seq.size(), 2u);
    EXPECT_EQ(seq[0], "int64");
    EXPECT_EQ(seq[1], "uint64");
}

TEST(ConvertStreamTest, HintsFileErrors) {
    EXPECT_THROW(Json2Msgp::LoadTypeHints(data_dir() / "does_not_exist.json"), std::runtime_error);
    // A conversion input is not a valid hint table.
    EXPECT_THROW(Json2Msgp::LoadTypeHints(data_dir() / "EAIFeeTable.json"), j2m::ConvertError);
}
