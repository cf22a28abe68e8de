#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "partvault/transfer/upload_manager.hpp"
#include "../support/in_memory_transport.hpp"
#include <filesystem>
#include <fstream>

using namespace partvault::transfer;
using namespace partvault::storage;
using partvault::core::ErrorCode;
using partvault::testing::InMemoryTransport;
using partvault::testing::MockPartTransport;
using partvault::testing::RecordingSleeper;
using partvault::testing::SimulatedCrash;
using partvault::transport::TransportErrorKind;
using partvault::transport::TransportResult;
using partvault::transport::UploadedPart;
using namespace std::chrono_literals;
using ::testing::_;

class UploadManagerTest : public ::testing::Test {
protected:
    static constexpr std::uint64_t CHUNK = 1024;

    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "partvault_upload_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);

        store_ = std::make_shared<ProgressStore>(ProgressStore::path_for_owner(test_dir_ / "data", "7"));

        options_.chunk_size = CHUNK;
        options_.inter_part_delay = 1000ms;
        options_.retry = RetryPolicy::fixed_delay(10, 5000ms);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    std::filesystem::path create_file(const std::string& name, size_t size) {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);
        for (size_t i = 0; i < size; ++i) {
            file.put(static_cast<char>((i * 31 + 7) % 251));
        }
        return path;
    }

    UploadManager make_manager() {
        return UploadManager(store_, transport_.factory(), options_, sleeper_.sleeper());
    }

    TransferResult upload(const std::filesystem::path& source, const CancellationToken* cancel = nullptr) {
        auto manager = make_manager();
        return manager.upload(credentials_, "-100999", source, cancel);
    }

    static std::vector<std::string> part_names(const std::string& filename, std::uint32_t first, std::uint32_t end) {
        std::vector<std::string> names;
        for (auto i = first; i < end; ++i) {
            names.push_back(ChunkManager::get_part_name(filename, i));
        }
        return names;
    }

    std::filesystem::path test_dir_;
    std::shared_ptr<ProgressStore> store_;
    InMemoryTransport transport_;
    RecordingSleeper sleeper_;
    UploadOptions options_;
    partvault::transport::TransportCredentials credentials_{"TOKEN", "api.telegram.org"};
};

TEST_F(UploadManagerTest, UploadsEveryPartInOrder) {
    auto source = create_file("report.pdf", 3 * CHUNK + 1);

    auto result = upload(source);

    ASSERT_TRUE(result.success()) << result.describe();
    EXPECT_EQ(result.parts_transferred, 4u);
    EXPECT_EQ(transport_.stored_names(), part_names("report.pdf", 0, 4));
    EXPECT_EQ(transport_.chats(), std::vector<std::string>(4, "-100999"));

    auto manifest = store_->load("report.pdf");
    ASSERT_TRUE(manifest.has_value());
    EXPECT_TRUE(manifest->is_complete());
    EXPECT_EQ(manifest->file_size_bytes, 3 * CHUNK + 1);
    EXPECT_EQ(manifest->chunk_size, CHUNK);
    for (const auto& part : manifest->parts) {
        EXPECT_EQ(part.content_hash.size(), 64u);
    }

    EXPECT_FALSE(std::filesystem::exists(ChunkManager::get_parts_directory(source)));
}

TEST_F(UploadManagerTest, WaitsBetweenParts) {
    auto source = create_file("a.bin", 3 * CHUNK);

    ASSERT_TRUE(upload(source).success());

    EXPECT_EQ(sleeper_.sleeps(), (std::vector<std::chrono::milliseconds>{1000ms, 1000ms}));
}

TEST_F(UploadManagerTest, MissingSourceFails) {
    auto result = upload(test_dir_ / "missing.bin");

    EXPECT_EQ(result.status, TransferStatus::FAILED);
    EXPECT_EQ(result.reason, ErrorCode::NOT_FOUND);
    EXPECT_TRUE(transport_.put_attempts().empty());
}

TEST_F(UploadManagerTest, EmptyFileIsNoOp) {
    auto source = create_file("empty.txt", 0);

    auto result = upload(source);

    EXPECT_TRUE(result.success());
    EXPECT_EQ(result.parts_transferred, 0u);
    EXPECT_TRUE(transport_.put_attempts().empty());
    EXPECT_FALSE(store_->load("empty.txt").has_value());
}

TEST_F(UploadManagerTest, ResumesFromRecordedPrefix) {
    auto source = create_file("big.iso", 5 * CHUNK);

    TransferManifest recorded("big.iso", 5 * CHUNK, CHUNK);
    recorded.parts.push_back(RemotePart{11, "earlier-0", ""});
    recorded.parts.push_back(RemotePart{12, "earlier-1", ""});
    ASSERT_TRUE(store_->save(recorded));

    auto result = upload(source);

    ASSERT_TRUE(result.success()) << result.describe();
    EXPECT_EQ(result.parts_transferred, 3u);
    EXPECT_EQ(transport_.stored_names(), part_names("big.iso", 2, 5));

    auto manifest = store_->load("big.iso");
    ASSERT_TRUE(manifest->is_complete());
    EXPECT_EQ(manifest->parts[0].locator_id, "earlier-0");
    EXPECT_EQ(manifest->parts[1].locator_id, "earlier-1");
}

TEST_F(UploadManagerTest, ResumeKeepsRecordedChunkSize) {
    auto source = create_file("odd.bin", 5 * CHUNK);

    TransferManifest recorded("odd.bin", 5 * CHUNK, 2 * CHUNK);
    recorded.parts.push_back(RemotePart{1, "earlier-0", ""});
    ASSERT_TRUE(store_->save(recorded));

    ASSERT_TRUE(upload(source).success());

    auto manifest = store_->load("odd.bin");
    EXPECT_EQ(manifest->chunk_size, 2 * CHUNK);
    EXPECT_EQ(manifest->total_parts, 3u);
    EXPECT_EQ(transport_.stored_names(), part_names("odd.bin", 1, 3));
}

TEST_F(UploadManagerTest, ChangedSizeStartsOver) {
    auto source = create_file("grown.log", 4 * CHUNK);

    TransferManifest recorded("grown.log", 3 * CHUNK, CHUNK);
    recorded.parts.push_back(RemotePart{1, "stale", ""});
    ASSERT_TRUE(store_->save(recorded));

    ASSERT_TRUE(upload(source).success());

    EXPECT_EQ(transport_.stored_names(), part_names("grown.log", 0, 4));
    auto manifest = store_->load("grown.log");
    EXPECT_EQ(manifest->file_size_bytes, 4 * CHUNK);
    EXPECT_NE(manifest->parts[0].locator_id, "stale");
}

TEST_F(UploadManagerTest, RecordWithInconsistentPartCountStartsOver) {
    auto source = create_file("odd.dat", 4 * CHUNK);

    TransferManifest recorded("odd.dat", 4 * CHUNK, CHUNK);
    recorded.total_parts = 6;
    recorded.parts.push_back(RemotePart{1, "stale-0", ""});
    recorded.parts.push_back(RemotePart{2, "stale-1", ""});
    ASSERT_TRUE(store_->save(recorded));

    ASSERT_TRUE(upload(source).success());

    EXPECT_EQ(transport_.stored_names(), part_names("odd.dat", 0, 4));
    auto manifest = store_->load("odd.dat");
    ASSERT_TRUE(manifest.has_value());
    EXPECT_EQ(manifest->total_parts, 4u);
    EXPECT_TRUE(manifest->is_complete());
    EXPECT_NE(manifest->parts[0].locator_id, "stale-0");
}

TEST_F(UploadManagerTest, ExistingPartsDirectoryIsLeftUntouched) {
    auto source = create_file("album.zip", 2 * CHUNK + 5);
    auto user_dir = ChunkManager::get_parts_directory(source);
    std::filesystem::create_directories(user_dir);
    std::ofstream(user_dir / "keep.txt") << "mine";

    ASSERT_TRUE(upload(source).success());

    EXPECT_EQ(transport_.stored_names(), part_names("album.zip", 0, 3));
    EXPECT_TRUE(std::filesystem::exists(user_dir / "keep.txt"));
    EXPECT_EQ(std::filesystem::file_size(user_dir / "keep.txt"), 4u);
    EXPECT_FALSE(std::filesystem::exists(user_dir.string() + ".1"));
}

TEST_F(UploadManagerTest, CompleteRecordIsReplacedByFreshUpload) {
    auto source = create_file("again.bin", 2 * CHUNK);

    TransferManifest recorded("again.bin", 2 * CHUNK, CHUNK);
    recorded.parts.push_back(RemotePart{1, "old-0", ""});
    recorded.parts.push_back(RemotePart{2, "old-1", ""});
    ASSERT_TRUE(store_->save(recorded));

    ASSERT_TRUE(upload(source).success());

    EXPECT_EQ(transport_.stored_names().size(), 2u);
    EXPECT_NE(store_->load("again.bin")->parts[0].locator_id, "old-0");
}

TEST_F(UploadManagerTest, RateLimitWaitsRetryAfter) {
    auto source = create_file("a.bin", 2 * CHUNK);
    transport_.fail_next_puts(TransportResult::rate_limited(7s));

    auto result = upload(source);

    ASSERT_TRUE(result.success());
    EXPECT_EQ(transport_.put_attempts().size(), 3u);
    EXPECT_EQ(sleeper_.sleeps().front(), 7000ms);
}

TEST_F(UploadManagerTest, TransientFailuresRetryWithFixedDelay) {
    auto source = create_file("a.bin", CHUNK);
    transport_.fail_next_puts(TransportResult(TransportErrorKind::TRANSIENT, "HTTP 502"), 3);

    ASSERT_TRUE(upload(source).success());

    EXPECT_EQ(sleeper_.sleeps(), (std::vector<std::chrono::milliseconds>{5000ms, 5000ms, 5000ms}));
}

TEST_F(UploadManagerTest, PermanentFailureAbortsWithoutRetry) {
    auto source = create_file("a.bin", 2 * CHUNK);
    transport_.fail_next_puts(TransportResult(TransportErrorKind::PERMANENT, "Bad Request: chat not found"));

    auto result = upload(source);

    EXPECT_EQ(result.status, TransferStatus::FAILED);
    EXPECT_EQ(result.reason, ErrorCode::PERMANENT_TRANSPORT_ERROR);
    EXPECT_EQ(transport_.put_attempts().size(), 1u);
    EXPECT_FALSE(store_->load("a.bin").has_value());
    EXPECT_FALSE(std::filesystem::exists(ChunkManager::get_parts_directory(source)));
}

TEST_F(UploadManagerTest, ExhaustedRetriesKeepRecordedPrefix) {
    auto source = create_file("flaky.bin", 3 * CHUNK);
    options_.retry = RetryPolicy::fixed_delay(3, 10ms);

    auto mock = std::make_shared<MockPartTransport>();
    EXPECT_CALL(*mock, put_part("-100999", _, ChunkManager::get_part_name("flaky.bin", 0), _))
        .WillOnce(::testing::Invoke([](const std::string&, const std::filesystem::path&, const std::string&, UploadedPart& up) {
            up.message_id = 1;
            up.locator_id = "ok-0";
            return TransportResult();
        }));
    EXPECT_CALL(*mock, put_part("-100999", _, ChunkManager::get_part_name("flaky.bin", 1), _))
        .Times(3)
        .WillRepeatedly(::testing::Return(TransportResult(TransportErrorKind::TRANSIENT, "HTTP 502")));

    UploadManager manager(store_, [mock](const auto&) { return mock; }, options_, sleeper_.sleeper());
    auto result = manager.upload(credentials_, "-100999", source);

    EXPECT_EQ(result.status, TransferStatus::FAILED);
    EXPECT_EQ(result.reason, ErrorCode::TRANSIENT_TRANSPORT_ERROR);
    EXPECT_EQ(result.parts_transferred, 1u);

    auto manifest = store_->load("flaky.bin");
    ASSERT_TRUE(manifest.has_value());
    EXPECT_EQ(manifest->recorded_parts(), 1u);
    EXPECT_TRUE(manifest->is_resumable());
}

TEST_F(UploadManagerTest, ManifestSavedBeforeNextPart) {
    auto source = create_file("durable.bin", 4 * CHUNK);
    auto store = store_;
    std::uint32_t expected_recorded = 0;

    auto mock = std::make_shared<MockPartTransport>();
    EXPECT_CALL(*mock, put_part(_, _, _, _))
        .Times(4)
        .WillRepeatedly(::testing::Invoke([&](const std::string&, const std::filesystem::path&, const std::string&, UploadedPart& up) {
            auto manifest = store->load("durable.bin");
            EXPECT_EQ(manifest ? manifest->recorded_parts() : 0u, expected_recorded);
            up.message_id = ++expected_recorded;
            up.locator_id = "L" + std::to_string(expected_recorded);
            return TransportResult();
        }));

    UploadManager manager(store_, [mock](const auto&) { return mock; }, options_, sleeper_.sleeper());
    EXPECT_TRUE(manager.upload(credentials_, "-100999", source).success());
}

TEST_F(UploadManagerTest, CrashBeforeSaveRetransportsThatPart) {
    auto source = create_file("crash.bin", 4 * CHUNK);
    transport_.crash_after_puts(2);

    EXPECT_THROW(upload(source), SimulatedCrash);

    auto manifest = store_->load("crash.bin");
    ASSERT_TRUE(manifest.has_value());
    EXPECT_EQ(manifest->recorded_parts(), 1u);
    auto first_locator = manifest->parts[0].locator_id;
    EXPECT_FALSE(std::filesystem::exists(ChunkManager::get_parts_directory(source)));

    ASSERT_TRUE(upload(source).success());

    auto names = transport_.stored_names();
    ASSERT_EQ(names.size(), 5u);
    EXPECT_EQ(names[1], ChunkManager::get_part_name("crash.bin", 1));
    EXPECT_EQ(names[2], ChunkManager::get_part_name("crash.bin", 1));

    manifest = store_->load("crash.bin");
    EXPECT_TRUE(manifest->is_complete());
    EXPECT_EQ(manifest->parts[0].locator_id, first_locator);
}

TEST_F(UploadManagerTest, CancelledBetweenParts) {
    auto source = create_file("stop.bin", 3 * CHUNK);
    CancellationToken token;

    auto manager = make_manager();
    manager.set_progress_callback([&token](std::uint32_t done, std::uint32_t) {
        if (done == 1) {
            token.cancel();
        }
    });

    auto result = manager.upload(credentials_, "-100999", source, &token);

    EXPECT_TRUE(result.is_cancelled());
    EXPECT_EQ(result.parts_transferred, 1u);
    EXPECT_EQ(store_->load("stop.bin")->recorded_parts(), 1u);
    EXPECT_FALSE(std::filesystem::exists(ChunkManager::get_parts_directory(source)));
}

TEST_F(UploadManagerTest, ProgressCallbackCountsRecordedParts) {
    auto source = create_file("p.bin", 3 * CHUNK);
    std::vector<std::pair<std::uint32_t, std::uint32_t>> reports;

    auto manager = make_manager();
    manager.set_progress_callback([&reports](std::uint32_t done, std::uint32_t total) {
        reports.emplace_back(done, total);
    });

    ASSERT_TRUE(manager.upload(credentials_, "-100999", source).success());
    EXPECT_EQ(reports, (std::vector<std::pair<std::uint32_t, std::uint32_t>>{{1, 3}, {2, 3}, {3, 3}}));
}
