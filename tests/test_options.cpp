/**
 * test_options.cpp - Tests for backpressure option validation
 */

#include <gtest/gtest.h>
#include <rowstream/options.hpp>
#include <rowstream/row_stream.hpp>
#include <string>

using rowstream::json;
using rowstream::RowStream;
using rowstream::RowStreamOptions;
using rowstream::validation_error;

namespace {

RowStreamOptions counts(std::optional<int> pause, std::optional<int> resume) {
    RowStreamOptions opts;
    opts.pause_count = pause;
    opts.resume_count = resume;
    return opts;
}

std::string validation_message(const RowStreamOptions& opts) {
    try {
        rowstream::validate_options(opts);
    } catch (const validation_error& e) {
        return e.what();
    }
    return "";
}

} // namespace

TEST(OptionsTest, NoOptionsDisablesBackpressure) {
    auto bp = rowstream::validate_options(RowStreamOptions{});
    EXPECT_FALSE(bp.can_pause);
}

TEST(OptionsTest, RequiresPauseCountWithResumeCount) {
    EXPECT_EQ(validation_message(counts(std::nullopt, 10)),
              "pause_count must be provided with resume_count");
}

TEST(OptionsTest, PauseCountMustBeGreaterThanOne) {
    for (int n : {-232, 0, 1}) {
        EXPECT_EQ(validation_message(counts(n, std::nullopt)),
                  "pause_count must be greater than 1") << n;
    }
}

TEST(OptionsTest, DerivesResumeCountAsHalf) {
    for (int n = 2; n <= 101; ++n) {
        auto bp = rowstream::validate_options(counts(n, std::nullopt));
        EXPECT_TRUE(bp.can_pause);
        EXPECT_EQ(bp.pause_count, n);
        EXPECT_EQ(bp.resume_count, n / 2) << n;
        EXPECT_GE(bp.resume_count, 0);
        EXPECT_LT(bp.resume_count, bp.pause_count);
    }
}

TEST(OptionsTest, ResumeCountMustBeLessThanPauseCount) {
    for (int rc : {20, 11, 10}) {
        EXPECT_EQ(validation_message(counts(10, rc)),
                  "resume_count must be less than pause_count") << rc;
    }
}

TEST(OptionsTest, ResumeCountCannotBeNegative) {
    EXPECT_EQ(validation_message(counts(10, -1)), "resume_count cannot be negative");
}

TEST(OptionsTest, ResumeCountMayBeZero) {
    auto bp = rowstream::validate_options(counts(10, 0));
    EXPECT_EQ(bp.resume_count, 0);
}

TEST(OptionsTest, ConstructorValidates) {
    EXPECT_THROW(RowStream rows(counts(1, std::nullopt)), validation_error);
    EXPECT_THROW(RowStream rows(counts(5, 5)), validation_error);
    EXPECT_NO_THROW(RowStream rows(counts(5, 3)));
}

TEST(OptionsTest, FromJson) {
    auto opts = RowStreamOptions::from_json(json{{"pause_count", 8}, {"resume_count", 2}});
    EXPECT_EQ(opts.pause_count, 8);
    EXPECT_EQ(opts.resume_count, 2);
    EXPECT_EQ(opts.canceler, nullptr);
}

TEST(OptionsTest, FromJsonMissingKeysStayUnset) {
    auto opts = RowStreamOptions::from_json(json{{"pause_count", nullptr}});
    EXPECT_FALSE(opts.pause_count.has_value());
    EXPECT_FALSE(opts.resume_count.has_value());

    auto empty = RowStreamOptions::from_json(json());
    EXPECT_FALSE(empty.pause_count.has_value());
}

TEST(OptionsTest, FromJsonRejectsBadTypes) {
    EXPECT_THROW(RowStreamOptions::from_json(json{{"pause_count", "ten"}}), validation_error);
    EXPECT_THROW(RowStreamOptions::from_json(json{{"resume_count", 1.5}}), validation_error);
    EXPECT_THROW(RowStreamOptions::from_json(json::array()), validation_error);
}

TEST(OptionsTest, FromJsonRejectsCountsBeyondInt) {
    EXPECT_THROW(RowStreamOptions::from_json(json{{"pause_count", 4294967298LL}}), validation_error);
    EXPECT_THROW(RowStreamOptions::from_json(json{{"pause_count", 4294967298ULL}}), validation_error);
    EXPECT_THROW(RowStreamOptions::from_json(json{{"resume_count", -4294967296LL}}), validation_error);

    auto opts = RowStreamOptions::from_json(json{{"pause_count", 2147483647LL}});
    EXPECT_EQ(opts.pause_count, 2147483647);
}
