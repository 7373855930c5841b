/**
 * @file test_upload_download.cpp
 * @brief End-to-end multipart upload and download through the engine
 *
 * This file contains tests for:
 * - Multipart upload with completion tokens in part order
 * - Ranged download back to disk
 * - Batch upload and batch download of a snapshot
 */

#include "test_fixtures.h"

#include <algorithm>

namespace edgefirst::sync::test {

class UploadDownloadTest : public EngineFixture {};

TEST_F(UploadDownloadTest, UploadSplitsIntoParts) {
    auto path = create_test_file("frames.bin", 250);

    auto uploaded = engine_->upload(path, "frames.bin");

    ASSERT_TRUE(uploaded.has_value()) << uploaded.error().describe();

    auto completions = endpoint_->completed();
    ASSERT_EQ(completions.size(), 1u);
    const auto& parts = completions[0];
    ASSERT_EQ(parts.size(), 3u);
    for (std::size_t i = 0; i < parts.size(); ++i) {
        EXPECT_EQ(parts[i].index, i);
    }
    EXPECT_EQ(parts[0].etag, "etag-100-1");
    EXPECT_EQ(parts[1].etag, "etag-100-2");
    EXPECT_EQ(parts[2].etag, "etag-50-3");

    EXPECT_EQ(store_->object("frames.bin"), std::optional<std::vector<uint8_t>>(make_bytes(250)));
}

TEST_F(UploadDownloadTest, UploadPartSizeOverride) {
    auto path = create_test_file("frames.bin", 250);

    ASSERT_TRUE(engine_->upload(path, "frames.bin", 50).has_value());

    ASSERT_EQ(endpoint_->completed().size(), 1u);
    EXPECT_EQ(endpoint_->completed()[0].size(), 5u);
}

TEST_F(UploadDownloadTest, UploadEmptyFile) {
    auto path = create_test_file("empty.bin", 0);

    auto uploaded = engine_->upload(path, "empty.bin");

    ASSERT_TRUE(uploaded.has_value()) << uploaded.error().describe();
    ASSERT_EQ(endpoint_->completed().size(), 1u);
    EXPECT_EQ(endpoint_->completed()[0].size(), 1u);
    EXPECT_EQ(store_->object("empty.bin"), std::optional<std::vector<uint8_t>>(std::vector<uint8_t>{}));
}

TEST_F(UploadDownloadTest, DownloadRoundTrip) {
    auto data = make_bytes(1234, 99);
    auto path = write_file("source.bin", data);
    ASSERT_TRUE(engine_->upload(path, "dir/source.bin").has_value());

    auto dest = download_dir_ / "copy.bin";
    auto progress = std::make_shared<progress_channel>(256);
    auto downloaded = engine_->download("dir/source.bin", dest, progress);

    ASSERT_TRUE(downloaded.has_value()) << downloaded.error().describe();
    EXPECT_EQ(read_file(dest), data);

    auto updates = progress->drain();
    ASSERT_FALSE(updates.empty());
    EXPECT_EQ(updates.back().bytes_done, 1234u);
    EXPECT_EQ(updates.back().parts_total, 13u);
    EXPECT_DOUBLE_EQ(updates.back().percentage(), 100.0);
}

TEST_F(UploadDownloadTest, DownloadOverwritesExistingFile) {
    store_->put_object("a.bin", make_bytes(10, 1));
    auto dest = write_file("existing.bin", make_bytes(500, 2));

    ASSERT_TRUE(engine_->download("a.bin", dest).has_value());

    EXPECT_EQ(read_file(dest), make_bytes(10, 1));
}

TEST_F(UploadDownloadTest, UploadAllThenDownloadAll) {
    std::vector<upload_request> requests;
    for (int i = 0; i < 5; ++i) {
        auto name = "file" + std::to_string(i) + ".bin";
        auto path = write_file(name, make_bytes(static_cast<std::size_t>(40 * i + 30),
                                                static_cast<uint32_t>(i)));
        requests.push_back(upload_request{path, "seq/" + name, std::nullopt});
    }

    auto uploaded = engine_->upload_all(requests);
    ASSERT_TRUE(uploaded.has_value());
    EXPECT_TRUE(uploaded.value().ok());
    EXPECT_EQ(uploaded.value().completed.size(), 5u);

    auto progress = std::make_shared<progress_channel>(64);
    auto downloaded = engine_->download_all(download_dir_, progress);

    ASSERT_TRUE(downloaded.has_value());
    EXPECT_TRUE(downloaded.value().ok());
    EXPECT_EQ(downloaded.value().completed.size(), 5u);
    EXPECT_EQ(endpoint_->download_url_calls(), 1);

    for (int i = 0; i < 5; ++i) {
        auto dest = download_dir_ / "seq" / ("file" + std::to_string(i) + ".bin");
        EXPECT_EQ(read_file(dest), make_bytes(static_cast<std::size_t>(40 * i + 30),
                                              static_cast<uint32_t>(i)));
    }

    auto updates = progress->drain();
    ASSERT_EQ(updates.size(), 5u);
    EXPECT_EQ(updates.back().parts_done, 5u);
    EXPECT_EQ(updates.back().parts_total, 5u);
}

TEST_F(UploadDownloadTest, UploadAllReportsPerFileFailures) {
    auto good = create_test_file("good.bin", 20);
    std::vector<upload_request> requests{
        {good, "good.bin", std::nullopt},
        {test_dir_ / "missing.bin", "missing.bin", std::nullopt},
    };

    auto uploaded = engine_->upload_all(requests);

    ASSERT_TRUE(uploaded.has_value());
    EXPECT_FALSE(uploaded.value().ok());
    EXPECT_EQ(uploaded.value().completed, std::vector<std::string>{"good.bin"});
    ASSERT_EQ(uploaded.value().failed.size(), 1u);
    EXPECT_EQ(uploaded.value().failed[0].first, "missing.bin");
    EXPECT_EQ(uploaded.value().failed[0].second.code, error_code::file_not_found);
}

}  // namespace edgefirst::sync::test
