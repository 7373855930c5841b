/**
 * @file test_error_scenarios.cpp
 * @brief Failure handling of the transfer engine
 *
 * This file contains tests for:
 * - Missing ETag and exhausted retries aborting the multipart upload
 * - Transient failures recovered by retry
 * - Cancellation
 * - Bad server responses and unsafe download keys
 */

#include "test_fixtures.h"

#include <chrono>
#include <thread>

namespace edgefirst::sync::test {

using namespace std::chrono_literals;

class ErrorScenarioTest : public EngineFixture {};

TEST_F(ErrorScenarioTest, MissingEtagAbortsUpload) {
    store_->omit_etag(true);
    auto path = create_test_file("data.bin", 250);

    auto uploaded = engine_->upload(path, "data.bin");

    ASSERT_FALSE(uploaded.has_value());
    EXPECT_EQ(uploaded.error().code, error_code::invalid_etag);
    EXPECT_EQ(endpoint_->aborted().size(), 1u);
    EXPECT_TRUE(endpoint_->completed().empty());
    EXPECT_FALSE(store_->object("data.bin").has_value());
}

TEST_F(ErrorScenarioTest, TransientFailureRecovered) {
    store_->fail_next("/upload/upload-1/2", 503, 2);
    store_->drop_next("/upload/upload-1/3", 1);
    auto path = create_test_file("data.bin", 250);

    auto uploaded = engine_->upload(path, "data.bin");

    ASSERT_TRUE(uploaded.has_value()) << uploaded.error().describe();
    EXPECT_TRUE(endpoint_->aborted().empty());
    EXPECT_EQ(store_->object("data.bin"), std::optional<std::vector<uint8_t>>(make_bytes(250)));
}

TEST_F(ErrorScenarioTest, ExhaustedRetriesAbortUpload) {
    store_->fail_next("/upload/upload-1/1", 500, 100);
    auto path = create_test_file("data.bin", 250);

    auto uploaded = engine_->upload(path, "data.bin");

    ASSERT_FALSE(uploaded.has_value());
    EXPECT_EQ(uploaded.error().code, error_code::max_retries_exceeded);
    EXPECT_EQ(uploaded.error().http_status, std::optional<int>(500));
    EXPECT_EQ(uploaded.error().attempts, config_.object_storage_max_retries + 1);
    EXPECT_EQ(endpoint_->aborted(), std::vector<std::string>{"upload-1"});
}

TEST_F(ErrorScenarioTest, NonRetryableStatusFailsImmediately) {
    store_->fail_next("/upload/upload-1/1", 400, 100);
    auto path = create_test_file("data.bin", 50);

    auto uploaded = engine_->upload(path, "data.bin");

    ASSERT_FALSE(uploaded.has_value());
    EXPECT_EQ(uploaded.error().code, error_code::http_status_error);
    EXPECT_EQ(uploaded.error().attempts, 1u);
}

TEST_F(ErrorScenarioTest, CancellationStopsUpload) {
    store_->set_latency(20ms);
    auto path = create_test_file("data.bin", 3000);
    cancellation_token token;

    std::thread canceller([token]() mutable {
        std::this_thread::sleep_for(30ms);
        token.cancel();
    });
    auto uploaded = engine_->upload(path, "data.bin", 0, nullptr, token);
    canceller.join();

    ASSERT_FALSE(uploaded.has_value());
    EXPECT_EQ(uploaded.error().code, error_code::transfer_cancelled);
    EXPECT_EQ(endpoint_->aborted().size(), 1u);
    EXPECT_LT(store_->request_count(), 30u);
}

TEST_F(ErrorScenarioTest, TooFewUploadUrls) {
    endpoint_->issue_too_few_urls(true);
    auto path = create_test_file("data.bin", 250);

    auto uploaded = engine_->upload(path, "data.bin");

    ASSERT_FALSE(uploaded.has_value());
    EXPECT_EQ(uploaded.error().code, error_code::invalid_response);
    EXPECT_EQ(endpoint_->aborted().size(), 1u);
    EXPECT_EQ(store_->request_count(), 0u);
}

TEST_F(ErrorScenarioTest, CreateFailurePropagates) {
    endpoint_->fail_create(error{error_code::forbidden, "no write access"});
    auto path = create_test_file("data.bin", 10);

    auto uploaded = engine_->upload(path, "data.bin");

    ASSERT_FALSE(uploaded.has_value());
    EXPECT_EQ(uploaded.error().code, error_code::forbidden);
    EXPECT_TRUE(endpoint_->aborted().empty());
}

TEST_F(ErrorScenarioTest, CompleteFailureAborts) {
    endpoint_->fail_complete(error{error_code::rpc_error, "complete rejected"});
    auto path = create_test_file("data.bin", 150);

    auto uploaded = engine_->upload(path, "data.bin");

    ASSERT_FALSE(uploaded.has_value());
    EXPECT_EQ(uploaded.error().code, error_code::rpc_error);
    EXPECT_EQ(endpoint_->aborted().size(), 1u);
}

TEST_F(ErrorScenarioTest, DownloadMissingKey) {
    auto downloaded = engine_->download("absent.bin", download_dir_ / "absent.bin");

    ASSERT_FALSE(downloaded.has_value());
    EXPECT_EQ(downloaded.error().code, error_code::remote_object_not_found);
}

TEST_F(ErrorScenarioTest, DownloadAllRejectsUnsafeKeys) {
    store_->put_object("ok.bin", make_bytes(20));
    endpoint_->add_download_url("../escape.bin", fake_object_store::object_url("ok.bin"));
    endpoint_->add_download_url("/abs.bin", fake_object_store::object_url("ok.bin"));

    auto downloaded = engine_->download_all(download_dir_);

    ASSERT_TRUE(downloaded.has_value());
    EXPECT_EQ(downloaded.value().completed, std::vector<std::string>{"ok.bin"});
    ASSERT_EQ(downloaded.value().failed.size(), 2u);
    for (const auto& [key, err] : downloaded.value().failed) {
        EXPECT_EQ(err.code, error_code::invalid_argument) << key;
    }
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "escape.bin"));
}

TEST_F(ErrorScenarioTest, DownloadTransportFailureRetried) {
    store_->put_object("r.bin", make_bytes(120));
    store_->drop_next("/objects/r.bin", 2);

    auto dest = download_dir_ / "r.bin";
    auto downloaded = engine_->download("r.bin", dest);

    ASSERT_TRUE(downloaded.has_value()) << downloaded.error().describe();
    EXPECT_EQ(read_file(dest), make_bytes(120));
}

TEST_F(ErrorScenarioTest, InvalidConfigurationRejectedByBuilder) {
    auto config = config_;
    config.part_size = 0;

    auto built = transfer_engine::builder()
                     .with_config(config)
                     .with_http_client(store_)
                     .with_endpoint(endpoint_)
                     .build();

    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, error_code::invalid_configuration);
}

}  // namespace edgefirst::sync::test
