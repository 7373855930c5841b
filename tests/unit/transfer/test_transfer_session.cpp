/**
 * @file test_transfer_session.cpp
 * @brief Unit tests for the single-transfer state machine
 */

#include <gtest/gtest.h>

#include <edgefirst/sync/transfer/transfer_session.h>

#include "../../integration/test_fixtures.h"

#include <chrono>
#include <stdexcept>

namespace edgefirst::sync::test {

using namespace std::chrono_literals;

namespace {

/// Object store whose part requests throw for one URL or Range
class throwing_store : public http_client_interface {
public:
    throwing_store(std::shared_ptr<fake_object_store> store, std::string url_needle,
                   std::string range = {})
        : store_(std::move(store)), url_needle_(std::move(url_needle)), range_(std::move(range)) {}

    auto get(const std::string& url, const header_map& headers)
        -> result<http_response> override {
        auto it = headers.find("Range");
        if (!range_.empty() && it != headers.end() && it->second == range_) {
            throw std::runtime_error("range read exploded");
        }
        return store_->get(url, headers);
    }

    auto post(const std::string& url, const std::string& body, const header_map& headers)
        -> result<http_response> override {
        return store_->post(url, body, headers);
    }

    auto put(const std::string& url, const std::vector<uint8_t>& body,
             const header_map& headers) -> result<http_response> override {
        if (!url_needle_.empty() && url.find(url_needle_) != std::string::npos) {
            throw std::runtime_error("part upload exploded");
        }
        return store_->put(url, body, headers);
    }

    auto head(const std::string& url, const header_map& headers)
        -> result<http_response> override {
        return store_->head(url, headers);
    }

private:
    std::shared_ptr<fake_object_store> store_;
    std::string url_needle_;
    std::string range_;
};

}  // namespace

class TransferSessionTest : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        store_ = std::make_shared<fake_object_store>();
        endpoint_ = std::make_shared<fake_multipart_endpoint>(store_);
        config_.part_size = 100;
        config_.max_retries = 2;
        config_.object_storage_max_retries = 2;
        config_.initial_backoff = 1ms;
        config_.max_backoff = 2ms;
        pool_ = std::make_shared<transfer_worker_pool>(2);
    }

    auto deps() -> session_dependencies {
        return session_dependencies{store_, endpoint_, pool_, config_};
    }

    std::shared_ptr<fake_object_store> store_;
    std::shared_ptr<fake_multipart_endpoint> endpoint_;
    std::shared_ptr<transfer_worker_pool> pool_;
    sync_config config_;
};

TEST_F(TransferSessionTest, StateNames) {
    EXPECT_STREQ(to_string(session_state::planning), "planning");
    EXPECT_STREQ(to_string(session_state::finalizing), "finalizing");
    EXPECT_TRUE(is_terminal(session_state::completed));
    EXPECT_TRUE(is_terminal(session_state::failed));
    EXPECT_FALSE(is_terminal(session_state::transferring));
}

TEST_F(TransferSessionTest, UploadCompletes) {
    auto path = create_test_file("data.bin", 250);
    auto progress = std::make_shared<progress_channel>(64);
    transfer_session session(deps(), make_upload_task(path, "data.bin", 100), progress);

    EXPECT_EQ(session.state(), session_state::planning);
    auto outcome = session.run();

    ASSERT_TRUE(outcome.has_value()) << outcome.error().describe();
    EXPECT_EQ(session.state(), session_state::completed);

    auto task = session.task();
    EXPECT_EQ(task.status, transfer_status::completed);
    EXPECT_EQ(task.total_size, 250u);
    ASSERT_EQ(task.parts.size(), 3u);
    for (const auto& p : task.parts) {
        EXPECT_EQ(p.status, part_status::done);
        ASSERT_TRUE(p.completion_token.has_value());
        EXPECT_EQ(*p.completion_token,
                  "etag-" + std::to_string(p.length) + "-" + std::to_string(p.index + 1));
    }

    auto stored = store_->object("data.bin");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, make_bytes(250));

    auto final_progress = session.progress();
    EXPECT_EQ(final_progress.bytes_done, 250u);
    EXPECT_EQ(final_progress.parts_done, 3u);
    auto updates = progress->drain();
    ASSERT_FALSE(updates.empty());
    EXPECT_EQ(updates.back().bytes_done, 250u);
}

TEST_F(TransferSessionTest, UploadSendsContentLength) {
    auto path = create_test_file("data.bin", 150);
    transfer_session session(deps(), make_upload_task(path, "data.bin", 100));

    ASSERT_TRUE(session.run().has_value());

    std::size_t puts = 0;
    for (const auto& request : store_->requests()) {
        if (request.method != "PUT") continue;
        ++puts;
        EXPECT_EQ(request.headers.at("Content-Length"), std::to_string(request.body.size()));
    }
    EXPECT_EQ(puts, 2u);
}

TEST_F(TransferSessionTest, RunTwiceRejected) {
    auto path = create_test_file("data.bin", 10);
    transfer_session session(deps(), make_upload_task(path, "data.bin", 100));

    ASSERT_TRUE(session.run().has_value());
    auto again = session.run();

    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::session_already_run);
    EXPECT_EQ(session.state(), session_state::completed);
}

TEST_F(TransferSessionTest, MissingDependencies) {
    session_dependencies incomplete{store_, nullptr, pool_, config_};
    transfer_session session(incomplete, make_upload_task(test_dir_ / "x", "x", 100));

    auto outcome = session.run();

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::invalid_configuration);
    EXPECT_EQ(session.state(), session_state::failed);
}

TEST_F(TransferSessionTest, UploadMissingFile) {
    transfer_session session(deps(), make_upload_task(test_dir_ / "absent.bin", "absent", 100));

    auto outcome = session.run();

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::file_not_found);
    EXPECT_TRUE(endpoint_->aborted().empty());
}

TEST_F(TransferSessionTest, UploadPartFailureAborts) {
    auto path = create_test_file("data.bin", 250);
    store_->fail_next("/upload/upload-1/2", 500, 10);
    transfer_session session(deps(), make_upload_task(path, "data.bin", 100));

    auto outcome = session.run();

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::max_retries_exceeded);
    ASSERT_TRUE(outcome.error().part_index.has_value());
    EXPECT_EQ(*outcome.error().part_index, 1u);
    EXPECT_EQ(session.state(), session_state::failed);
    ASSERT_TRUE(session.task().failure.has_value());
    EXPECT_EQ(endpoint_->aborted(), std::vector<std::string>{"upload-1"});
    EXPECT_TRUE(endpoint_->completed().empty());
}

TEST_F(TransferSessionTest, CancelledBeforeStart) {
    auto path = create_test_file("data.bin", 250);
    cancellation_token token;
    token.cancel();
    transfer_session session(deps(), make_upload_task(path, "data.bin", 100), nullptr, token);

    auto outcome = session.run();

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::transfer_cancelled);
    EXPECT_EQ(store_->request_count(), 0u);
}

TEST_F(TransferSessionTest, DownloadWritesFile) {
    auto data = make_bytes(230, 7);
    store_->put_object("remote.bin", data);
    auto dest = download_dir_ / "nested" / "remote.bin";
    transfer_session session(deps(), make_download_task("remote.bin", dest, 100));

    auto outcome = session.run();

    ASSERT_TRUE(outcome.has_value()) << outcome.error().describe();
    EXPECT_EQ(read_file(dest), data);
    EXPECT_FALSE(std::filesystem::exists(dest.string() + ".part"));
    EXPECT_EQ(session.task().parts.size(), 3u);
}

TEST_F(TransferSessionTest, DownloadProbeUsesSingleByteRange) {
    store_->put_object("remote.bin", make_bytes(50));
    transfer_session session(deps(), make_download_task("remote.bin", download_dir_ / "r", 100));

    ASSERT_TRUE(session.run().has_value());

    auto requests = store_->requests();
    ASSERT_GE(requests.size(), 2u);
    EXPECT_EQ(requests[0].headers.at("Range"), "bytes=0-0");
    EXPECT_EQ(requests[1].headers.at("Range"), "bytes=0-49");
}

TEST_F(TransferSessionTest, DownloadEmptyObject) {
    store_->put_object("empty.bin", {});
    auto dest = download_dir_ / "empty.bin";
    transfer_session session(deps(), make_download_task("empty.bin", dest, 100));

    auto outcome = session.run();

    ASSERT_TRUE(outcome.has_value()) << outcome.error().describe();
    ASSERT_TRUE(std::filesystem::exists(dest));
    EXPECT_EQ(std::filesystem::file_size(dest), 0u);
}

TEST_F(TransferSessionTest, DownloadUnknownKey) {
    transfer_session session(deps(), make_download_task("nope.bin", download_dir_ / "nope", 100));

    auto outcome = session.run();

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::remote_object_not_found);
}

TEST_F(TransferSessionTest, DownloadProbeFailureLeavesNoFiles) {
    store_->put_object("remote.bin", make_bytes(250));
    store_->fail_next("/objects/remote.bin", 404, 1);
    auto dest = download_dir_ / "remote.bin";
    transfer_session session(deps(), make_download_task("remote.bin", dest, 100));

    auto outcome = session.run();

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::http_status_error);
    EXPECT_FALSE(std::filesystem::exists(dest));
    EXPECT_FALSE(std::filesystem::exists(dest.string() + ".part"));
}

TEST_F(TransferSessionTest, UploadPartThatThrowsBecomesInternalError) {
    auto path = create_test_file("data.bin", 250);
    auto dependencies = deps();
    dependencies.http = std::make_shared<throwing_store>(store_, "/upload/upload-1/2");
    transfer_session session(dependencies, make_upload_task(path, "data.bin", 100));

    auto outcome = session.run();

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::internal_error);
    EXPECT_NE(outcome.error().message.find("part upload exploded"), std::string::npos);
    ASSERT_TRUE(outcome.error().part_index.has_value());
    EXPECT_EQ(*outcome.error().part_index, 1u);
    EXPECT_EQ(session.state(), session_state::failed);
    EXPECT_EQ(endpoint_->aborted(), std::vector<std::string>{"upload-1"});
    EXPECT_TRUE(endpoint_->completed().empty());
}

TEST_F(TransferSessionTest, DownloadPartThatThrowsBecomesInternalError) {
    store_->put_object("remote.bin", make_bytes(250));
    auto dest = download_dir_ / "remote.bin";
    auto dependencies = deps();
    dependencies.http = std::make_shared<throwing_store>(store_, "", "bytes=100-199");
    transfer_session session(dependencies, make_download_task("remote.bin", dest, 100));

    auto outcome = session.run();

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::internal_error);
    ASSERT_TRUE(outcome.error().part_index.has_value());
    EXPECT_EQ(*outcome.error().part_index, 1u);
    EXPECT_EQ(session.state(), session_state::failed);
    EXPECT_FALSE(std::filesystem::exists(dest));
    EXPECT_FALSE(std::filesystem::exists(dest.string() + ".part"));
}

}  // namespace edgefirst::sync::test
