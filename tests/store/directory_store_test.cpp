#include "archup/events/event_bus.hpp"
#include "archup/hash/tree_hash.hpp"
#include "archup/store/directory_store.hpp"
#include "archup/upload/uploader.hpp"

#include "support/fake_remote_store.hpp"

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <memory>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using archup::ErrorKind;
using archup::hash::TreeHasher;
using archup::hash::to_hex;
using archup::store::DirectoryStore;
using archup::test_support::make_bytes;
using archup::upload::ByteRange;
using archup::upload::kMiB;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    fs::path dir = fs::temp_directory_path() / ("archup_store_test_" + std::to_string(counter.fetch_add(1)));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::vector<std::uint8_t> read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
}

std::vector<std::uint8_t> slice(const std::vector<std::uint8_t>& bytes, std::uint64_t start, std::uint64_t end) {
    return std::vector<std::uint8_t>(bytes.begin() + static_cast<std::ptrdiff_t>(start),
                                     bytes.begin() + static_cast<std::ptrdiff_t>(end + 1));
}

class DirectoryStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir();
        store_ = std::make_unique<DirectoryStore>(root_, 2);
        ASSERT_TRUE(store_->create_vault("vault").is_ok());
    }

    void TearDown() override {
        store_.reset();
        fs::remove_all(root_);
    }

    std::string send_part(const std::string& session_id,
                          const std::vector<std::uint8_t>& bytes,
                          std::uint64_t start,
                          std::uint64_t end) {
        auto res = store_->upload_part("vault", session_id, ByteRange{start, end, bytes.size()}, slice(bytes, start, end));
        EXPECT_TRUE(res.is_ok()) << res.error().describe();
        return res.is_ok() ? res.value() : std::string{};
    }

    fs::path root_;
    std::unique_ptr<DirectoryStore> store_;
};

} // namespace

TEST_F(DirectoryStoreTest, MultipartUploadAssemblesArchive) {
    const auto bytes = make_bytes(2 * kMiB + 300);
    auto session = store_->create_session("vault", "test archive", kMiB);
    ASSERT_TRUE(session.is_ok());
    const auto& id = session.value();

    // Out of order on purpose
    send_part(id, bytes, 2 * kMiB, bytes.size() - 1);
    const auto checksum = send_part(id, bytes, 0, kMiB - 1);
    send_part(id, bytes, kMiB, 2 * kMiB - 1);
    EXPECT_EQ(checksum, to_hex(TreeHasher::part_digest(slice(bytes, 0, kMiB - 1))));

    const auto root = to_hex(TreeHasher::part_digest(bytes));
    auto receipt = store_->complete_session("vault", id, bytes.size(), root);
    ASSERT_TRUE(receipt.is_ok()) << receipt.error().describe();

    EXPECT_EQ(receipt.value().checksum, root);
    EXPECT_EQ(receipt.value().location, "/vault/archives/" + receipt.value().archive_id);
    EXPECT_EQ(read_file(store_->archive_path("vault", receipt.value().archive_id)), bytes);
    EXPECT_TRUE(fs::exists(root_ / "vault" / "archives" / (receipt.value().archive_id + ".json")));
    EXPECT_TRUE(store_->list_sessions("vault").value().empty());
}

TEST_F(DirectoryStoreTest, ListsPartsInPages) {
    const auto bytes = make_bytes(5 * kMiB);
    const auto id = store_->create_session("vault", "", kMiB).value();
    for (std::uint64_t i = 0; i < 5; ++i) {
        send_part(id, bytes, i * kMiB, (i + 1) * kMiB - 1);
    }

    std::vector<archup::upload::RemotePart> all;
    std::optional<std::string> marker;
    int pages = 0;
    do {
        auto page = store_->list_session_parts("vault", id, marker);
        ASSERT_TRUE(page.is_ok());
        EXPECT_EQ(page.value().part_size, kMiB);
        all.insert(all.end(), page.value().parts.begin(), page.value().parts.end());
        marker = page.value().next_marker;
        ++pages;
    } while (marker.has_value());

    EXPECT_EQ(pages, 3);
    ASSERT_EQ(all.size(), 5u);
    for (std::size_t i = 0; i < all.size(); ++i) {
        EXPECT_EQ(all[i].start, i * kMiB);
    }

    auto bad_marker = store_->list_session_parts("vault", id, std::string("x1"));
    ASSERT_TRUE(bad_marker.is_error());
    EXPECT_EQ(bad_marker.error().kind, ErrorKind::Transport);
}

TEST_F(DirectoryStoreTest, RejectsMalformedParts) {
    const auto bytes = make_bytes(3 * kMiB);
    const auto id = store_->create_session("vault", "", kMiB).value();

    // Not aligned to the part size
    auto misaligned = store_->upload_part("vault", id, ByteRange{10, kMiB + 9, bytes.size()}, slice(bytes, 10, kMiB + 9));
    ASSERT_TRUE(misaligned.is_error());
    EXPECT_EQ(misaligned.error().kind, ErrorKind::Transport);

    // Short part that is not the last one
    auto short_part = store_->upload_part("vault", id, ByteRange{0, 99, bytes.size()}, slice(bytes, 0, 99));
    EXPECT_TRUE(short_part.is_error());

    // Body length disagrees with the range
    auto mismatch = store_->upload_part("vault", id, ByteRange{0, kMiB - 1, bytes.size()}, slice(bytes, 0, 99));
    EXPECT_TRUE(mismatch.is_error());
}

TEST_F(DirectoryStoreTest, CompletionRequiresEveryPartAndMatchingRoot) {
    const auto bytes = make_bytes(3 * kMiB);
    const auto id = store_->create_session("vault", "", kMiB).value();
    send_part(id, bytes, 0, kMiB - 1);
    send_part(id, bytes, 2 * kMiB, 3 * kMiB - 1);

    const auto root = to_hex(TreeHasher::part_digest(bytes));
    auto incomplete = store_->complete_session("vault", id, bytes.size(), root);
    ASSERT_TRUE(incomplete.is_error());
    EXPECT_EQ(incomplete.error().kind, ErrorKind::Transport);

    send_part(id, bytes, kMiB, 2 * kMiB - 1);
    auto wrong_root = store_->complete_session("vault", id, bytes.size(), std::string(64, '0'));
    ASSERT_TRUE(wrong_root.is_error());

    // The session survives failed completions
    EXPECT_EQ(store_->list_sessions("vault").value().size(), 1u);
    EXPECT_TRUE(store_->complete_session("vault", id, bytes.size(), root).is_ok());
}

TEST_F(DirectoryStoreTest, ReuploadReplacesPart) {
    const auto bytes = make_bytes(2 * kMiB);
    const auto other = make_bytes(2 * kMiB, 99);
    const auto id = store_->create_session("vault", "", kMiB).value();

    send_part(id, other, 0, kMiB - 1);
    send_part(id, bytes, 0, kMiB - 1);
    send_part(id, bytes, kMiB, 2 * kMiB - 1);

    auto listing = store_->list_session_parts("vault", id, std::nullopt);
    ASSERT_TRUE(listing.is_ok());
    EXPECT_EQ(listing.value().parts.size(), 2u);

    auto receipt = store_->complete_session("vault", id, bytes.size(), to_hex(TreeHasher::part_digest(bytes)));
    ASSERT_TRUE(receipt.is_ok());
    EXPECT_EQ(read_file(store_->archive_path("vault", receipt.value().archive_id)), bytes);
}

TEST_F(DirectoryStoreTest, WholeObjectUpload) {
    const auto bytes = make_bytes(1234);
    auto receipt = store_->upload_whole("vault", "small", bytes);
    ASSERT_TRUE(receipt.is_ok());
    EXPECT_EQ(receipt.value().checksum, to_hex(TreeHasher::leaf_digest(bytes)));
    EXPECT_EQ(read_file(store_->archive_path("vault", receipt.value().archive_id)), bytes);
}

TEST_F(DirectoryStoreTest, FailedWholePublishLeavesNoTemporaryBody) {
    constexpr std::uint64_t kSeed = 7;
    DirectoryStore seeded(root_, 2, kSeed);

    // upload_whole draws one id for its temp file, then one for the archive
    std::mt19937_64 rng(kSeed);
    rng.discard(2);
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << rng() << std::setw(16) << rng();
    const auto blocked = root_ / "vault" / "archives" / oss.str();
    fs::create_directories(blocked / "occupied");

    auto receipt = seeded.upload_whole("vault", "small", make_bytes(100));
    ASSERT_TRUE(receipt.is_error());
    EXPECT_EQ(receipt.error().kind, ErrorKind::Transport);

    for (const auto& entry : fs::directory_iterator(root_ / "vault" / "uploads")) {
        ADD_FAILURE() << "left behind " << entry.path();
    }
}

TEST_F(DirectoryStoreTest, InventoryListsCommittedArchives) {
    const auto small = make_bytes(1234);
    const auto large = make_bytes(kMiB + 10, 3);
    auto first = store_->upload_whole("vault", "small", small);
    ASSERT_TRUE(first.is_ok());

    const auto id = store_->create_session("vault", "large", kMiB).value();
    send_part(id, large, 0, kMiB - 1);
    send_part(id, large, kMiB, large.size() - 1);
    auto second = store_->complete_session("vault", id, large.size(), to_hex(TreeHasher::part_digest(large)));
    ASSERT_TRUE(second.is_ok()) << second.error().describe();

    auto archives = store_->list_archives("vault");
    ASSERT_TRUE(archives.is_ok());
    ASSERT_EQ(archives.value().size(), 2u);
    for (const auto& archive : archives.value()) {
        if (archive.archive_id == first.value().archive_id) {
            EXPECT_EQ(archive.description, "small");
            EXPECT_EQ(archive.size, small.size());
            EXPECT_EQ(archive.checksum, first.value().checksum);
        } else {
            EXPECT_EQ(archive.archive_id, second.value().archive_id);
            EXPECT_EQ(archive.description, "large");
            EXPECT_EQ(archive.size, large.size());
            EXPECT_EQ(archive.checksum, second.value().checksum);
        }
        EXPECT_FALSE(archive.created_at.empty());
    }

    const auto inventory = nlohmann::json::parse(archup::store::inventory_json("vault", archives.value()));
    EXPECT_EQ(inventory.at("VaultName"), "vault");
    ASSERT_EQ(inventory.at("ArchiveList").size(), 2u);
    EXPECT_EQ(inventory.at("ArchiveList")[0].at("ArchiveId"), archives.value()[0].archive_id);
    EXPECT_EQ(inventory.at("ArchiveList")[0].at("SHA256TreeHash"), archives.value()[0].checksum);
    EXPECT_EQ(inventory.at("ArchiveList")[0].at("Size").get<std::uint64_t>(), archives.value()[0].size);

    EXPECT_EQ(store_->list_archives("nope").error().kind, ErrorKind::NotFound);
}

TEST_F(DirectoryStoreTest, DeleteArchiveRemovesDataAndMetadata) {
    auto receipt = store_->upload_whole("vault", "doomed", make_bytes(64));
    ASSERT_TRUE(receipt.is_ok());
    const auto& archive_id = receipt.value().archive_id;

    ASSERT_TRUE(store_->delete_archive("vault", archive_id).is_ok());
    EXPECT_FALSE(fs::exists(store_->archive_path("vault", archive_id)));
    EXPECT_FALSE(fs::exists(root_ / "vault" / "archives" / (archive_id + ".json")));
    EXPECT_TRUE(store_->list_archives("vault").value().empty());

    EXPECT_EQ(store_->delete_archive("vault", archive_id).error().kind, ErrorKind::NotFound);
    EXPECT_EQ(store_->delete_archive("vault", "../vault").error().kind, ErrorKind::NotFound);
}

TEST_F(DirectoryStoreTest, RetrieveArchiveCopiesAndVerifiesTreeHash) {
    const auto bytes = make_bytes(2 * kMiB + 77);
    const auto id = store_->create_session("vault", "retrieved", kMiB).value();
    send_part(id, bytes, 0, kMiB - 1);
    send_part(id, bytes, kMiB, 2 * kMiB - 1);
    send_part(id, bytes, 2 * kMiB, bytes.size() - 1);
    auto receipt = store_->complete_session("vault", id, bytes.size(), to_hex(TreeHasher::part_digest(bytes)));
    ASSERT_TRUE(receipt.is_ok());

    const auto out = root_ / "restored.bin";
    auto info = store_->retrieve_archive("vault", receipt.value().archive_id, out);
    ASSERT_TRUE(info.is_ok()) << info.error().describe();
    EXPECT_EQ(info.value().description, "retrieved");
    EXPECT_EQ(info.value().size, bytes.size());
    EXPECT_EQ(read_file(out), bytes);

    auto again = store_->retrieve_archive("vault", receipt.value().archive_id, out);
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().kind, ErrorKind::Io);
    EXPECT_EQ(read_file(out), bytes);

    EXPECT_EQ(store_->retrieve_archive("vault", "feedface", root_ / "none.bin").error().kind, ErrorKind::NotFound);
}

TEST_F(DirectoryStoreTest, RetrieveRejectsTamperedArchive) {
    auto bytes = make_bytes(3000);
    auto receipt = store_->upload_whole("vault", "tampered", bytes);
    ASSERT_TRUE(receipt.is_ok());

    bytes[10] ^= 0xff;
    {
        std::ofstream output(store_->archive_path("vault", receipt.value().archive_id),
                             std::ios::binary | std::ios::trunc);
        output.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }

    const auto out = root_ / "tampered.bin";
    auto info = store_->retrieve_archive("vault", receipt.value().archive_id, out);
    ASSERT_TRUE(info.is_error());
    EXPECT_EQ(info.error().kind, ErrorKind::IntegrityViolation);
    EXPECT_FALSE(fs::exists(out));
}

TEST_F(DirectoryStoreTest, UnknownVaultAndSessionAreNotFound) {
    EXPECT_EQ(store_->create_session("nope", "", kMiB).error().kind, ErrorKind::NotFound);
    EXPECT_EQ(store_->list_sessions("nope").error().kind, ErrorKind::NotFound);
    EXPECT_EQ(store_->list_session_parts("vault", "missing", std::nullopt).error().kind, ErrorKind::NotFound);
    EXPECT_EQ(store_->abort_session("vault", "../vault").error().kind, ErrorKind::NotFound);
}

TEST_F(DirectoryStoreTest, AbortRemovesSession) {
    auto first = store_->create_session("vault", "first", kMiB);
    auto second = store_->create_session("vault", "second", 2 * kMiB);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_NE(first.value(), second.value());

    auto sessions = store_->list_sessions("vault");
    ASSERT_TRUE(sessions.is_ok());
    EXPECT_EQ(sessions.value().size(), 2u);

    ASSERT_TRUE(store_->abort_session("vault", first.value()).is_ok());
    EXPECT_EQ(store_->abort_session("vault", first.value()).error().kind, ErrorKind::NotFound);

    sessions = store_->list_sessions("vault");
    ASSERT_EQ(sessions.value().size(), 1u);
    EXPECT_EQ(sessions.value()[0].description, "second");
    EXPECT_EQ(sessions.value()[0].part_size, 2 * kMiB);
}

TEST_F(DirectoryStoreTest, UploaderResumesPartialSessionEndToEnd) {
    const auto bytes = make_bytes(4 * kMiB + 17);
    const auto id = store_->create_session("vault", "resumed", kMiB).value();
    send_part(id, bytes, 0, kMiB - 1);
    send_part(id, bytes, 3 * kMiB, 4 * kMiB - 1);

    archup::UploadConfig config;
    config.vault_name = "vault";
    config.part_size_mb = 1;
    config.concurrency = 4;

    archup::events::EventBus bus;
    archup::upload::ArchiveUploader uploader(*store_, bus, config);
    archup::upload::SharedSource source(std::make_unique<archup::upload::MemorySource>(bytes));

    auto outcome = uploader.upload(source, id);
    ASSERT_TRUE(outcome.is_ok()) << outcome.error().describe();
    EXPECT_EQ(outcome.value().parts_verified, 2u);
    EXPECT_EQ(outcome.value().parts_uploaded, 3u);
    EXPECT_EQ(outcome.value().receipt.checksum, to_hex(TreeHasher::part_digest(bytes)));
    EXPECT_EQ(read_file(store_->archive_path("vault", outcome.value().receipt.archive_id)), bytes);
}

TEST_F(DirectoryStoreTest, UploaderFreshConcurrentUpload) {
    const auto bytes = make_bytes(6 * kMiB + 5);

    archup::UploadConfig config;
    config.vault_name = "vault";
    config.part_size_mb = 2;
    config.concurrency = 8;

    archup::events::EventBus bus;
    archup::upload::ArchiveUploader uploader(*store_, bus, config);
    archup::upload::SharedSource source(std::make_unique<archup::upload::MemorySource>(bytes));

    auto outcome = uploader.upload(source);
    ASSERT_TRUE(outcome.is_ok()) << outcome.error().describe();
    EXPECT_EQ(outcome.value().parts_uploaded, 4u);
    EXPECT_EQ(to_hex(outcome.value().root_digest), to_hex(TreeHasher::part_digest(bytes)));
    EXPECT_EQ(read_file(store_->archive_path("vault", outcome.value().receipt.archive_id)), bytes);
}
