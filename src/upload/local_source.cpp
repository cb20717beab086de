#include "archup/upload/local_source.hpp"

#include <algorithm>
#include <cstring>
#include <system_error>

namespace archup::upload {
namespace fs = std::filesystem;

archup::Result<std::unique_ptr<FileSource>> FileSource::open(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return archup::Err<std::unique_ptr<FileSource>>(
            archup::Error(ErrorKind::Io, "Not a regular file: " + path.string()));
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return archup::Err<std::unique_ptr<FileSource>>(
            archup::Error(ErrorKind::Io, "Failed to stat " + path.string() + ": " + ec.message()));
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return archup::Err<std::unique_ptr<FileSource>>(
            archup::Error(ErrorKind::Io, "Failed to open source file: " + path.string()));
    }
    return archup::Ok(std::unique_ptr<FileSource>(new FileSource(path, std::move(stream), size)));
}

FileSource::FileSource(fs::path path, std::ifstream stream, std::uint64_t size)
    : path_(std::move(path)), stream_(std::move(stream)), size_(size) {}

archup::Result<void> FileSource::seek(std::uint64_t offset) {
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset));
    if (!stream_) {
        return archup::Err<void>(archup::Error(
            ErrorKind::Io, "Failed to seek to " + std::to_string(offset) + " in " + path_.string()));
    }
    return archup::Ok();
}

archup::Result<std::size_t> FileSource::read(std::uint8_t* buffer, std::size_t count) {
    stream_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(count));
    if (stream_.bad()) {
        return archup::Err<std::size_t>(archup::Error(ErrorKind::Io, "Failed to read " + path_.string()));
    }
    return archup::Ok(static_cast<std::size_t>(stream_.gcount()));
}

MemorySource::MemorySource(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

archup::Result<void> MemorySource::seek(std::uint64_t offset) {
    if (offset > data_.size()) {
        return archup::Err<void>(archup::Error(ErrorKind::Io, "Seek past end of buffer"));
    }
    position_ = offset;
    return archup::Ok();
}

archup::Result<std::size_t> MemorySource::read(std::uint8_t* buffer, std::size_t count) {
    const auto available = static_cast<std::size_t>(data_.size() - position_);
    const std::size_t n = std::min(count, available);
    if (n > 0) {
        std::memcpy(buffer, data_.data() + position_, n);
    }
    position_ += n;
    return archup::Ok(n);
}

SharedSource::SharedSource(std::unique_ptr<ByteSource> source)
    : source_(std::move(source)), size_(source_->size()) {}

archup::Result<std::vector<std::uint8_t>> SharedSource::read_range(std::uint64_t offset, std::size_t length) {
    std::vector<std::uint8_t> buffer(length);

    std::lock_guard lock(mutex_);
    if (auto res = source_->seek(offset); res.is_error()) {
        return archup::Err<std::vector<std::uint8_t>>(res.error());
    }

    std::size_t filled = 0;
    while (filled < length) {
        auto read = source_->read(buffer.data() + filled, length - filled);
        if (read.is_error()) {
            return archup::Err<std::vector<std::uint8_t>>(read.error());
        }
        if (read.value() == 0) {
            break;
        }
        filled += read.value();
    }

    if (filled != length) {
        return archup::Err<std::vector<std::uint8_t>>(archup::Error(
            ErrorKind::Io, "Short read at offset " + std::to_string(offset) + ": wanted " +
                               std::to_string(length) + " bytes, got " + std::to_string(filled)));
    }
    return archup::Ok(std::move(buffer));
}

} // namespace archup::upload
