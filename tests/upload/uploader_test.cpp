#include "archup/events/components.hpp"
#include "archup/events/event_bus.hpp"
#include "archup/upload/uploader.hpp"

#include "support/fake_remote_store.hpp"

#include <gtest/gtest.h>

#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using archup::ErrorKind;
using archup::UploadConfig;
using archup::events::EventBus;
using archup::events::MetricsComponent;
using archup::hash::TreeHasher;
using archup::hash::to_hex;
using archup::test_support::FakeRemoteStore;
using archup::test_support::make_bytes;
using archup::upload::ArchiveUploader;
using archup::upload::ByteSource;
using archup::upload::MemorySource;
using archup::upload::SessionDescriptor;
using archup::upload::SharedSource;
using archup::upload::kMiB;

namespace {

/// Reports a large size without backing memory; reads yield zeros.
class ZeroSource : public ByteSource {
public:
    explicit ZeroSource(std::uint64_t size) : size_(size) {}

    std::uint64_t size() const override { return size_; }

    archup::Result<void> seek(std::uint64_t offset) override {
        position_ = offset;
        return archup::Ok();
    }

    archup::Result<std::size_t> read(std::uint8_t* buffer, std::size_t count) override {
        const auto n = static_cast<std::size_t>(std::min<std::uint64_t>(count, size_ - position_));
        std::memset(buffer, 0, n);
        position_ += n;
        return archup::Ok(n);
    }

private:
    std::uint64_t size_;
    std::uint64_t position_ = 0;
};

UploadConfig make_config(std::uint64_t part_size_mb = 1) {
    UploadConfig config;
    config.vault_name = "vault";
    config.description = "nightly backup";
    config.part_size_mb = part_size_mb;
    config.concurrency = 3;
    config.max_attempts = 3;
    return config;
}

std::string checksum_of(const std::vector<std::uint8_t>& bytes, std::uint64_t start, std::uint64_t end) {
    std::vector<std::uint8_t> chunk(bytes.begin() + static_cast<std::ptrdiff_t>(start),
                                    bytes.begin() + static_cast<std::ptrdiff_t>(end + 1));
    return to_hex(TreeHasher::part_digest(chunk));
}

} // namespace

TEST(ArchiveUploaderTest, FreshUploadCommitsWholeObject) {
    FakeRemoteStore store;
    EventBus bus;
    MetricsComponent metrics(bus);
    const auto bytes = make_bytes(3 * kMiB + 7);
    SharedSource source(std::make_unique<MemorySource>(bytes));

    ArchiveUploader uploader(store, bus, make_config());
    std::vector<SessionDescriptor> announced;
    uploader.set_session_listener([&](const SessionDescriptor& d) { announced.push_back(d); });

    auto outcome = uploader.upload(source);
    ASSERT_TRUE(outcome.is_ok()) << outcome.error().describe();

    const auto& result = outcome.value();
    EXPECT_FALSE(result.single_request);
    EXPECT_EQ(result.parts_uploaded, 4u);
    EXPECT_EQ(result.parts_verified, 0u);
    EXPECT_EQ(result.root_digest, TreeHasher::part_digest(bytes));
    EXPECT_EQ(result.receipt.checksum, to_hex(result.root_digest));
    EXPECT_TRUE(store.completed(result.session.session_id));

    ASSERT_EQ(announced.size(), 1u);
    EXPECT_EQ(announced[0].session_id, result.session.session_id);
    EXPECT_EQ(announced[0].part_size, kMiB);
    EXPECT_EQ(announced[0].total_size, bytes.size());

    const auto session = store.session(result.session.session_id);
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->description, "nightly backup");
    EXPECT_EQ(metrics.get_stats().sessions_completed.load(), 1u);
}

TEST(ArchiveUploaderTest, SmallObjectUsesSingleRequest) {
    FakeRemoteStore store;
    EventBus bus;
    const auto bytes = make_bytes(1000);
    SharedSource source(std::make_unique<MemorySource>(bytes));

    ArchiveUploader uploader(store, bus, make_config());
    auto outcome = uploader.upload(source);
    ASSERT_TRUE(outcome.is_ok()) << outcome.error().describe();

    EXPECT_TRUE(outcome.value().single_request);
    EXPECT_TRUE(outcome.value().session.session_id.empty());
    EXPECT_EQ(outcome.value().root_digest, TreeHasher::leaf_digest(bytes));
    EXPECT_EQ(store.whole_calls(), 1);
    EXPECT_TRUE(store.list_sessions("vault").value().empty());
}

TEST(ArchiveUploaderTest, SingleRequestChecksumMismatchIsIntegrityViolation) {
    FakeRemoteStore store;
    EventBus bus;
    store.override_root_checksum(std::string(64, '1'));
    SharedSource source(std::make_unique<MemorySource>(make_bytes(100)));

    ArchiveUploader uploader(store, bus, make_config());
    auto outcome = uploader.upload(source);
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().kind, ErrorKind::IntegrityViolation);
}

TEST(ArchiveUploaderTest, ResumeSkipsVerifiedPartsAndReplacesStaleOnes) {
    FakeRemoteStore store;
    EventBus bus;
    MetricsComponent metrics(bus);
    const auto bytes = make_bytes(3 * kMiB + 99);
    const auto session_id = store.add_session(kMiB);
    store.seed_part(session_id, 0, kMiB - 1, checksum_of(bytes, 0, kMiB - 1));
    store.seed_part(session_id, kMiB, 2 * kMiB - 1, std::string(64, 'e'));
    store.seed_part(session_id, 2 * kMiB, 3 * kMiB - 1, checksum_of(bytes, 2 * kMiB, 3 * kMiB - 1));
    SharedSource source(std::make_unique<MemorySource>(bytes));

    // Configured part size differs; the session's own part size wins
    ArchiveUploader uploader(store, bus, make_config(8));
    auto outcome = uploader.upload(source, session_id);
    ASSERT_TRUE(outcome.is_ok()) << outcome.error().describe();

    const auto& result = outcome.value();
    EXPECT_EQ(result.session.session_id, session_id);
    EXPECT_EQ(result.session.part_size, kMiB);
    EXPECT_EQ(result.parts_verified, 2u);
    EXPECT_EQ(result.parts_uploaded, 2u);
    EXPECT_EQ(store.upload_calls(0), 0);
    EXPECT_EQ(store.upload_calls(kMiB), 1);
    EXPECT_EQ(store.upload_calls(2 * kMiB), 0);
    EXPECT_EQ(store.upload_calls(3 * kMiB), 1);
    EXPECT_EQ(result.root_digest, TreeHasher::part_digest(bytes));
    EXPECT_EQ(metrics.get_stats().parts_verified.load(), 2u);
}

TEST(ArchiveUploaderTest, ResumeDrainsEveryListingPage) {
    FakeRemoteStore store;
    EventBus bus;
    store.set_page_size(2);
    const auto bytes = make_bytes(5 * kMiB);
    const auto session_id = store.add_session(kMiB);
    for (std::uint64_t i = 0; i < 5; ++i) {
        store.seed_part(session_id, i * kMiB, (i + 1) * kMiB - 1, checksum_of(bytes, i * kMiB, (i + 1) * kMiB - 1));
    }
    SharedSource source(std::make_unique<MemorySource>(bytes));

    ArchiveUploader uploader(store, bus, make_config());
    auto outcome = uploader.upload(source, session_id);
    ASSERT_TRUE(outcome.is_ok()) << outcome.error().describe();

    EXPECT_EQ(store.list_calls(), 3);
    EXPECT_EQ(outcome.value().parts_verified, 5u);
    EXPECT_EQ(outcome.value().parts_uploaded, 0u);
    EXPECT_EQ(store.total_upload_calls(), 0);
    EXPECT_TRUE(store.completed(session_id));
}

TEST(ArchiveUploaderTest, ResumeOfUnknownSessionIsNotFound) {
    FakeRemoteStore store;
    EventBus bus;
    SharedSource source(std::make_unique<MemorySource>(make_bytes(2 * kMiB)));

    ArchiveUploader uploader(store, bus, make_config());
    auto outcome = uploader.upload(source, std::string("missing"));
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().kind, ErrorKind::NotFound);
    ASSERT_TRUE(outcome.error().resume.has_value());
    EXPECT_EQ(outcome.error().resume->session_id, "missing");
}

TEST(ArchiveUploaderTest, FailedPartLeavesSessionResumable) {
    FakeRemoteStore store;
    EventBus bus;
    MetricsComponent metrics(bus);
    store.fail_part(kMiB, 100);
    SharedSource source(std::make_unique<MemorySource>(make_bytes(2 * kMiB)));

    ArchiveUploader uploader(store, bus, make_config());
    auto outcome = uploader.upload(source);
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().kind, ErrorKind::UploadFailed);
    ASSERT_TRUE(outcome.error().resume.has_value());

    const auto session_id = outcome.error().resume->session_id;
    EXPECT_FALSE(session_id.empty());
    EXPECT_FALSE(store.completed(session_id));
    EXPECT_EQ(store.upload_calls(kMiB), 3);
    EXPECT_EQ(metrics.get_stats().sessions_abandoned.load(), 1u);
}

TEST(ArchiveUploaderTest, DisallowedPartSizeAdjustmentFailsBeforeCreatingSession) {
    FakeRemoteStore store;
    EventBus bus;
    SharedSource source(std::make_unique<ZeroSource>(20000 * kMiB));

    auto config = make_config(1);
    config.allow_part_size_adjustment = false;
    ArchiveUploader uploader(store, bus, config);

    auto outcome = uploader.upload(source);
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().kind, ErrorKind::InvalidConfig);
    EXPECT_TRUE(store.list_sessions("vault").value().empty());
}

TEST(ArchiveUploaderTest, InvalidConfigMakesNoRemoteCalls) {
    FakeRemoteStore store;
    EventBus bus;
    SharedSource source(std::make_unique<MemorySource>(make_bytes(2 * kMiB)));

    auto config = make_config(3);
    ArchiveUploader uploader(store, bus, config);
    auto outcome = uploader.upload(source);
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().kind, ErrorKind::InvalidConfig);
    EXPECT_TRUE(store.list_sessions("vault").value().empty());
    EXPECT_EQ(store.whole_calls(), 0);
}
