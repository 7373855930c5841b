/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging and sensitive information masking
 */

#include <gtest/gtest.h>

#include <edgefirst/sync/core/logging.h>

#include <string>
#include <vector>

namespace edgefirst::sync::test {

// =============================================================================
// Masking Config Tests
// =============================================================================

class MaskingConfigTest : public ::testing::Test {};

TEST_F(MaskingConfigTest, DefaultConfig) {
    masking_config config;

    EXPECT_TRUE(config.mask_url_queries);
    EXPECT_TRUE(config.mask_tokens);
    EXPECT_FALSE(config.mask_paths);
    EXPECT_EQ(config.mask_char, '*');
    EXPECT_EQ(config.visible_chars, 4u);
}

TEST_F(MaskingConfigTest, AllMaskedConfig) {
    auto config = masking_config::all_masked();

    EXPECT_TRUE(config.mask_url_queries);
    EXPECT_TRUE(config.mask_tokens);
    EXPECT_TRUE(config.mask_paths);
}

TEST_F(MaskingConfigTest, NoneConfig) {
    auto config = masking_config::none();

    EXPECT_FALSE(config.mask_url_queries);
    EXPECT_FALSE(config.mask_tokens);
    EXPECT_FALSE(config.mask_paths);
}

// =============================================================================
// Sensitive Info Masker Tests
// =============================================================================

class SensitiveInfoMaskerTest : public ::testing::Test {};

TEST_F(SensitiveInfoMaskerTest, MasksPresignedQuery) {
    sensitive_info_masker masker;

    auto masked = masker.mask_url("https://bucket.s3.amazonaws.com/a/b?X-Amz-Signature=abc");

    EXPECT_EQ(masked, "https://bucket.s3.amazonaws.com/a/b?***");
}

TEST_F(SensitiveInfoMaskerTest, UrlWithoutQueryUnchanged) {
    sensitive_info_masker masker;
    EXPECT_EQ(masker.mask_url("https://edgefirst.studio/api"), "https://edgefirst.studio/api");
}

TEST_F(SensitiveInfoMaskerTest, MasksUrlsInsideText) {
    sensitive_info_masker masker;

    auto masked = masker.mask("PUT https://storage.test/part?sig=secret failed");

    EXPECT_EQ(masked.find("secret"), std::string::npos);
    EXPECT_NE(masked.find("https://storage.test/part?***"), std::string::npos);
    EXPECT_NE(masked.find("failed"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, MasksBearerToken) {
    sensitive_info_masker masker;

    auto masked = masker.mask("Authorization: Bearer abcdefghijkl");

    EXPECT_NE(masked.find("Bearer abcd********"), std::string::npos);
    EXPECT_EQ(masked.find("efghijkl"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, MaskPathKeepsFileName) {
    sensitive_info_masker masker(masking_config::all_masked());

    auto masked = masker.mask_path("/home/user/data/file.bin");

    EXPECT_NE(masked.find("/file.bin"), std::string::npos);
    EXPECT_EQ(masked.find("/home/"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, NoneLeavesEverything) {
    sensitive_info_masker masker(masking_config::none());
    std::string input = "Bearer abcdefghijkl https://x.test/a?sig=1";

    EXPECT_EQ(masker.mask(input), input);
}

TEST_F(SensitiveInfoMaskerTest, EmptyInput) {
    sensitive_info_masker masker(masking_config::all_masked());

    EXPECT_EQ(masker.mask(""), "");
    EXPECT_EQ(masker.mask_path(""), "");
    EXPECT_EQ(masker.mask_url(""), "");
}

// =============================================================================
// Transfer Log Context Tests
// =============================================================================

class TransferLogContextTest : public ::testing::Test {};

TEST_F(TransferLogContextTest, EmptyContextToJson) {
    transfer_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST_F(TransferLogContextTest, FieldsToJson) {
    transfer_log_context ctx;
    ctx.remote_key = "snapshots/1/data.bin";
    ctx.total_bytes = 1024;
    ctx.part_index = 3;
    ctx.attempt = 2;
    ctx.http_status = 503;

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\"remote_key\":\"snapshots/1/data.bin\""), std::string::npos);
    EXPECT_NE(json.find("\"total_bytes\":1024"), std::string::npos);
    EXPECT_NE(json.find("\"part_index\":3"), std::string::npos);
    EXPECT_NE(json.find("\"attempt\":2"), std::string::npos);
    EXPECT_NE(json.find("\"http_status\":503"), std::string::npos);
}

TEST_F(TransferLogContextTest, UrlMaskedWithMasker) {
    transfer_log_context ctx;
    ctx.url = "https://storage.test/o?sig=secret";
    sensitive_info_masker masker;

    auto json = ctx.to_json_with_masking(&masker);

    EXPECT_EQ(json.find("secret"), std::string::npos);
}

TEST_F(TransferLogContextTest, EscapesStrings) {
    transfer_log_context ctx;
    ctx.error_message = "line1\n\"quoted\"";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("line1\\n\\\"quoted\\\""), std::string::npos);
}

// =============================================================================
// Log Entry Builder Tests
// =============================================================================

class LogEntryBuilderTest : public ::testing::Test {};

TEST_F(LogEntryBuilderTest, BuildsEntry) {
    auto entry = log_entry_builder()
        .with_level(log_level::warn)
        .with_category(log_category::retry)
        .with_message("Retrying")
        .with_part(1, 4)
        .with_attempt(2)
        .build();

    EXPECT_EQ(entry.level, log_level::warn);
    EXPECT_EQ(entry.category, std::string(log_category::retry));
    EXPECT_EQ(entry.message, "Retrying");
    ASSERT_TRUE(entry.context.has_value());
    ASSERT_TRUE(entry.context->total_parts.has_value());
    EXPECT_EQ(*entry.context->total_parts, 4u);
}

TEST_F(LogEntryBuilderTest, JsonContainsFlattenedContext) {
    auto json = log_entry_builder()
        .with_level(log_level::info)
        .with_category(log_category::session)
        .with_message("done")
        .with_remote_key("k")
        .build_json();

    EXPECT_NE(json.find("\"level\":\"INFO\""), std::string::npos);
    EXPECT_NE(json.find("\"category\":\"edgefirst_sync.session\""), std::string::npos);
    EXPECT_NE(json.find("\"remote_key\":\"k\""), std::string::npos);
    EXPECT_NE(json.find("\"timestamp\":\""), std::string::npos);
}

// =============================================================================
// Logger Tests
// =============================================================================

class SyncLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_level_ = get_logger().get_level();
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_json_callback(nullptr);
        get_logger().set_level(previous_level_);
        get_logger().set_masking_config(masking_config{});
    }

    log_level previous_level_ = log_level::info;
};

TEST_F(SyncLoggerTest, LevelFilter) {
    get_logger().set_level(log_level::warn);

    EXPECT_FALSE(get_logger().is_enabled(log_level::info));
    EXPECT_TRUE(get_logger().is_enabled(log_level::warn));
    EXPECT_TRUE(get_logger().is_enabled(log_level::error));
}

TEST_F(SyncLoggerTest, CallbackReceivesMaskedMessage) {
    std::vector<std::string> messages;
    get_logger().set_level(log_level::trace);
    get_logger().set_callback(
        [&](log_level, std::string_view, std::string_view message, const transfer_log_context*) {
            messages.emplace_back(message);
        });

    EDGEFIRST_LOG_INFO(log_category::transfer, "GET https://storage.test/x?sig=secret");

    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].find("secret"), std::string::npos);
}

TEST_F(SyncLoggerTest, FilteredRecordsSkipCallback) {
    int calls = 0;
    get_logger().set_level(log_level::error);
    get_logger().set_callback(
        [&](log_level, std::string_view, std::string_view, const transfer_log_context*) {
            ++calls;
        });

    EDGEFIRST_LOG_DEBUG(log_category::pool, "not shown");
    EDGEFIRST_LOG_ERROR(log_category::pool, "shown");

    EXPECT_EQ(calls, 1);
}

TEST_F(SyncLoggerTest, JsonCallbackCarriesContext) {
    std::string json;
    get_logger().set_level(log_level::trace);
    get_logger().set_json_callback(
        [&](const structured_log_entry&, const std::string& rendered) { json = rendered; });

    transfer_log_context ctx;
    ctx.remote_key = "a/b.bin";
    ctx.part_index = 7;
    EDGEFIRST_LOG_WARN_CTX(log_category::retry, "retrying", ctx);

    EXPECT_NE(json.find("\"remote_key\":\"a/b.bin\""), std::string::npos);
    EXPECT_NE(json.find("\"part_index\":7"), std::string::npos);
    EXPECT_NE(json.find("\"source\""), std::string::npos);
}

}  // namespace edgefirst::sync::test
