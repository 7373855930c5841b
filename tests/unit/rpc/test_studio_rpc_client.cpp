/**
 * @file test_studio_rpc_client.cpp
 * @brief Unit tests for the platform JSON-RPC client
 */

#include <gtest/gtest.h>

#include <edgefirst/sync/rpc/json_utils.h>
#include <edgefirst/sync/rpc/studio_rpc_client.h>

#include "../../fakes/fake_http_client.h"

#include <chrono>

namespace edgefirst::sync::test {

using namespace std::chrono_literals;

class StudioRpcClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        http_ = std::make_shared<scripted_http_client>();
        config_.server_url = "https://test.edgefirst.studio";
        config_.token = "secret-token";
        config_.initial_backoff = 1ms;
        config_.max_backoff = 2ms;
        client_ = std::make_unique<studio_rpc_client>(http_, config_, nullptr);
    }

    static auto rpc_result(const std::string& result) -> std::string {
        return R"({"jsonrpc":"2.0","id":0,"result":)" + result + "}";
    }

    auto last_body() const -> std::string {
        auto requests = http_->requests();
        return requests.empty() ? std::string() : requests.back().body;
    }

    std::shared_ptr<scripted_http_client> http_;
    sync_config config_;
    std::unique_ptr<studio_rpc_client> client_;
};

TEST_F(StudioRpcClientTest, Call_EnvelopeAndHeaders) {
    http_->push_status(200, rpc_result("{}"));

    auto result = client_->call("snapshots.list", "{\"a\":1}");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), "{}");

    auto requests = http_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, "POST");
    EXPECT_EQ(requests[0].url, "https://test.edgefirst.studio/api");
    EXPECT_EQ(requests[0].headers.at("Authorization"), "Bearer secret-token");
    EXPECT_EQ(requests[0].headers.at("Content-Type"), "application/json");
    EXPECT_EQ(requests[0].headers.at("Accept"), "application/json");
    EXPECT_EQ(requests[0].headers.at("User-Agent"), "EdgeFirst Client");

    const auto& body = requests[0].body;
    EXPECT_EQ(json::parse_string(*json::find_member(body, "method")),
              std::string("snapshots.list"));
    EXPECT_EQ(json::parse_string(*json::find_member(body, "jsonrpc")), std::string("2.0"));
    EXPECT_EQ(json::parse_int(*json::find_member(body, "id")), 0);
    EXPECT_EQ(*json::find_member(body, "params"), "{\"a\":1}");
}

TEST_F(StudioRpcClientTest, Call_TokenProviderUsed) {
    client_ = std::make_unique<studio_rpc_client>(http_, config_, static_token("fresh"));
    http_->push_status(200, rpc_result("null"));

    ASSERT_TRUE(client_->call("m", "{}").has_value());
    EXPECT_EQ(http_->requests()[0].headers.at("Authorization"), "Bearer fresh");
}

TEST_F(StudioRpcClientTest, Call_TokenProviderFailurePropagates) {
    client_ = std::make_unique<studio_rpc_client>(
        http_, config_, []() -> result<std::string> {
            return unexpected{error{error_code::unauthorized, "expired"}};
        });

    auto result = client_->call("m", "{}");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::unauthorized);
    EXPECT_EQ(http_->request_count(), 0u);
}

TEST_F(StudioRpcClientTest, Call_RpcErrorMember) {
    http_->push_status(200, R"({"jsonrpc":"2.0","id":0,"error":{"code":-32000,"message":"no such snapshot"}})");

    auto result = client_->call("snapshots.get", "{}");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::rpc_error);
    EXPECT_NE(result.error().message.find("no such snapshot"), std::string::npos);
    EXPECT_NE(result.error().message.find("-32000"), std::string::npos);
}

TEST_F(StudioRpcClientTest, Call_MissingResult) {
    http_->push_status(200, R"({"jsonrpc":"2.0","id":0})");

    auto result = client_->call("m", "{}");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_response);
}

TEST_F(StudioRpcClientTest, Call_ForbiddenNotRetried) {
    http_->push_status(403);

    auto result = client_->call("m", "{}");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::forbidden);
    EXPECT_EQ(result.error().attempts, 1u);
    EXPECT_EQ(http_->request_count(), 1u);
}

TEST_F(StudioRpcClientTest, Call_ServerErrorRetried) {
    http_->push_status(502);
    http_->push_status(200, rpc_result("true"));

    auto result = client_->call("m", "{}");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(http_->request_count(), 2u);
}

TEST_F(StudioRpcClientTest, CreateMultipartUpload) {
    client_->set_snapshot_name("drive-01");
    http_->push_status(200, rpc_result(R"({
        "snapshot_id": 77,
        "data.bin": {"key": "data.bin", "upload_id": "u-1",
                     "urls": ["https://s3.test/1", "https://s3.test/2"]}
    })"));

    auto upload = client_->create_multipart_upload("data.bin", 150, 2);

    ASSERT_TRUE(upload.has_value()) << upload.error().describe();
    EXPECT_EQ(upload.value().key, "data.bin");
    EXPECT_EQ(upload.value().upload_id, "u-1");
    ASSERT_EQ(upload.value().urls.size(), 2u);
    EXPECT_EQ(upload.value().urls[1], "https://s3.test/2");
    EXPECT_EQ(client_->snapshot_id(), std::optional<int64_t>(77));

    auto params = json::find_member(last_body(), "params");
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ(json::parse_string(*json::find_member(*params, "snapshot_name")),
              std::string("drive-01"));
    EXPECT_EQ(json::parse_string_array(*json::find_member(*params, "keys")),
              std::vector<std::string>{"data.bin"});
    EXPECT_EQ(json::trim(*json::find_member(*params, "file_sizes")), "[150]");
}

TEST_F(StudioRpcClientTest, CreateMultipartUpload_MissingKey) {
    http_->push_status(200, rpc_result(R"({"snapshot_id": 1})"));

    auto upload = client_->create_multipart_upload("data.bin", 10, 1);

    ASSERT_FALSE(upload.has_value());
    EXPECT_EQ(upload.error().code, error_code::invalid_response);
}

TEST_F(StudioRpcClientTest, CompleteMultipartUpload_PartNumbersOneBased) {
    http_->push_status(200, rpc_result("{}"));
    multipart_upload upload{"data.bin", "u-1", {}};

    auto done = client_->complete_multipart_upload(
        upload, {completed_part{0, "e0"}, completed_part{1, "e1"}, completed_part{2, "e2"}});

    ASSERT_TRUE(done.has_value());
    auto params = *json::find_member(last_body(), "params");
    auto list = json::array_elements(*json::find_member(params, "etag_list"));
    ASSERT_TRUE(list.has_value());
    ASSERT_EQ(list->size(), 3u);
    for (std::size_t i = 0; i < list->size(); ++i) {
        EXPECT_EQ(json::parse_string(*json::find_member((*list)[i], "ETag")),
                  "e" + std::to_string(i));
        EXPECT_EQ(json::parse_int(*json::find_member((*list)[i], "PartNumber")),
                  static_cast<int64_t>(i + 1));
    }
    EXPECT_EQ(json::parse_string(*json::find_member(params, "upload_id")), std::string("u-1"));
}

TEST_F(StudioRpcClientTest, AbortMultipartUpload_FailureMapped) {
    http_->push_status(404);
    multipart_upload upload{"data.bin", "u-1", {}};

    auto aborted = client_->abort_multipart_upload(upload);

    ASSERT_FALSE(aborted.has_value());
    EXPECT_EQ(aborted.error().code, error_code::multipart_abort_failed);
}

TEST_F(StudioRpcClientTest, CreateDownloadUrls) {
    client_->set_snapshot_id(12);
    http_->push_status(200, rpc_result(R"({"a.bin": "https://s3.test/a", "dir/b.bin": "https://s3.test/b"})"));

    auto urls = client_->create_download_urls();

    ASSERT_TRUE(urls.has_value());
    ASSERT_EQ(urls.value().size(), 2u);
    EXPECT_EQ(urls.value().at("dir/b.bin"), "https://s3.test/b");
    auto params = *json::find_member(last_body(), "params");
    EXPECT_EQ(json::parse_int(*json::find_member(params, "snapshot_id")), 12);
}

TEST_F(StudioRpcClientTest, CreateDownloadUrls_RequiresSnapshotId) {
    auto urls = client_->create_download_urls();

    ASSERT_FALSE(urls.has_value());
    EXPECT_EQ(urls.error().code, error_code::invalid_argument);
    EXPECT_EQ(http_->request_count(), 0u);
}

}  // namespace edgefirst::sync::test
