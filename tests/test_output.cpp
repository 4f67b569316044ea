/*
 * Output classification tests - Code Runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <code-runner/exec/output.hpp>
#include <string>

using namespace coderunner;

static ProcessOutcome outcome(std::string out, std::string err, std::optional<int> code) {
    ProcessOutcome o;
    o.stdout_data = std::move(out);
    o.stderr_data = std::move(err);
    o.status.code = code;
    o.status.success = code && *code == 0;
    o.duration = std::chrono::nanoseconds(1234);
    return o;
}

TEST(Utf8Validate, AcceptsValidText) {
    EXPECT_FALSE(validate_utf8("").has_value());
    EXPECT_FALSE(validate_utf8("plain ascii").has_value());
    EXPECT_FALSE(validate_utf8("h\xC3\xA9llo \xE2\x82\xAC \xF0\x9F\x98\x80").has_value());
    EXPECT_FALSE(validate_utf8("\xF4\x8F\xBF\xBF").has_value()); // U+10FFFF
}

TEST(Utf8Validate, InvalidLeadByte) {
    auto e = validate_utf8("ab\xFF" "cd");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->valid_up_to, 2u);
    EXPECT_EQ(e->error_len, 1u);
    EXPECT_EQ(e->to_string(), "invalid utf-8 sequence of 1 bytes from index 2");
}

TEST(Utf8Validate, OverlongAndSurrogateRejected) {
    auto overlong = validate_utf8("\xC0\x80");
    ASSERT_TRUE(overlong.has_value());
    EXPECT_EQ(overlong->error_len, 1u);

    auto overlong3 = validate_utf8("\xE0\x80\x80");
    ASSERT_TRUE(overlong3.has_value());
    EXPECT_EQ(overlong3->valid_up_to, 0u);

    auto surrogate = validate_utf8("x\xED\xA0\x80");
    ASSERT_TRUE(surrogate.has_value());
    EXPECT_EQ(surrogate->valid_up_to, 1u);
    EXPECT_EQ(surrogate->error_len, 1u);

    EXPECT_TRUE(validate_utf8("\xF4\x90\x80\x80").has_value()); // above U+10FFFF
}

TEST(Utf8Validate, BadContinuationLength) {
    auto e = validate_utf8("\xE2\x82x");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->valid_up_to, 0u);
    EXPECT_EQ(e->error_len, 2u);
}

TEST(Utf8Validate, TruncatedSequence) {
    auto e = validate_utf8("ok\xE2\x82");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->valid_up_to, 2u);
    EXPECT_FALSE(e->error_len.has_value());
    EXPECT_EQ(e->to_string(), "incomplete utf-8 byte sequence from index 2");
}

TEST(Classify, SuccessKeepsTextAndDuration) {
    auto r = classify(outcome("hi\n", "warn\n", 0));
    ASSERT_TRUE(std::holds_alternative<SuccessOutput>(r));
    auto &s = std::get<SuccessOutput>(r);
    EXPECT_EQ(s.stdout_text, "hi\n");
    EXPECT_EQ(s.stderr_text, "warn\n");
    EXPECT_EQ(s.duration.count(), 1234);
}

TEST(Classify, NonZeroExitIsExitFailure) {
    auto r = classify(outcome("partial", "boom", 3));
    ASSERT_TRUE(std::holds_alternative<OutputError>(r));
    auto &e = std::get<OutputError>(r);
    EXPECT_EQ(e.kind, OutputErrorKind::ExitFailure);
    EXPECT_EQ(e.output.exit_code, 3);
    EXPECT_EQ(e.output.stdout_text, "partial");
    EXPECT_EQ(e.to_string(), "Exited with non-zero exit code. code: 3, stdout: partial, stderr: boom");
}

TEST(Classify, SignalHasNoCode) {
    auto r = classify(outcome("", "", std::nullopt));
    ASSERT_TRUE(std::holds_alternative<OutputError>(r));
    auto &e = std::get<OutputError>(r);
    EXPECT_FALSE(e.output.exit_code.has_value());
    EXPECT_EQ(e.output.to_string(), "");
}

TEST(Classify, InvalidStdoutCheckedBeforeExitStatus) {
    auto r = classify(outcome("\xFF", "", 1));
    ASSERT_TRUE(std::holds_alternative<OutputError>(r));
    auto &e = std::get<OutputError>(r);
    EXPECT_EQ(e.kind, OutputErrorKind::ReadStdout);
    EXPECT_EQ(e.to_string(), "Failed to read stdout. invalid utf-8 sequence of 1 bytes from index 0");
}

TEST(Classify, InvalidStderr) {
    auto r = classify(outcome("fine", "\xC3", 0));
    ASSERT_TRUE(std::holds_alternative<OutputError>(r));
    EXPECT_EQ(std::get<OutputError>(r).kind, OutputErrorKind::ReadStderr);
}

TEST(ErrorOutputText, EmptyPartsOmitted) {
    ErrorOutput only_code{"", "", 1};
    EXPECT_EQ(only_code.to_string(), "code: 1");
    ErrorOutput code_err{"", "oops", 2};
    EXPECT_EQ(code_err.to_string(), "code: 2, stderr: oops");
}
