#pragma once

#include "archup/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <vector>

namespace archup::upload {

/**
 * @brief Seekable byte stream of known length
 *
 * Implementations keep a single read cursor and are not thread-safe;
 * concurrent users go through SharedSource.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    [[nodiscard]] virtual std::uint64_t size() const = 0;

    virtual archup::Result<void> seek(std::uint64_t offset) = 0;

    /// Reads up to count bytes at the cursor; returns the number read (0 at end).
    virtual archup::Result<std::size_t> read(std::uint8_t* buffer, std::size_t count) = 0;
};

class FileSource : public ByteSource {
public:
    static archup::Result<std::unique_ptr<FileSource>> open(const std::filesystem::path& path);

    [[nodiscard]] std::uint64_t size() const override { return size_; }
    archup::Result<void> seek(std::uint64_t offset) override;
    archup::Result<std::size_t> read(std::uint8_t* buffer, std::size_t count) override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    FileSource(std::filesystem::path path, std::ifstream stream, std::uint64_t size);

    std::filesystem::path path_;
    std::ifstream stream_;
    std::uint64_t size_;
};

class MemorySource : public ByteSource {
public:
    explicit MemorySource(std::vector<std::uint8_t> data);

    [[nodiscard]] std::uint64_t size() const override { return data_.size(); }
    archup::Result<void> seek(std::uint64_t offset) override;
    archup::Result<std::size_t> read(std::uint8_t* buffer, std::size_t count) override;

private:
    std::vector<std::uint8_t> data_;
    std::uint64_t position_ = 0;
};

/**
 * @brief Owns a ByteSource and serializes seek+read on it
 *
 * Only the read of a range holds the lock. Callers hash and upload the
 * returned buffer without it.
 */
class SharedSource {
public:
    explicit SharedSource(std::unique_ptr<ByteSource> source);

    SharedSource(const SharedSource&) = delete;
    SharedSource& operator=(const SharedSource&) = delete;

    [[nodiscard]] std::uint64_t size() const { return size_; }

    /// Reads exactly length bytes at offset; a short read is an Io error.
    archup::Result<std::vector<std::uint8_t>> read_range(std::uint64_t offset, std::size_t length);

private:
    std::unique_ptr<ByteSource> source_;
    std::uint64_t size_;
    std::mutex mutex_;
};

} // namespace archup::upload
