#include "archup/hash/tree_hash.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

namespace archup::hash {
namespace {

struct MdContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

using MdContext = std::unique_ptr<EVP_MD_CTX, MdContextDeleter>;

Digest sha256(const std::uint8_t* first, std::size_t first_size,
              const std::uint8_t* second = nullptr, std::size_t second_size = 0) {
    MdContext context(EVP_MD_CTX_new());
    if (!context) {
        throw std::runtime_error("Failed to create OpenSSL digest context");
    }
    if (EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA-256 digest");
    }
    if (first_size > 0 && EVP_DigestUpdate(context.get(), first, first_size) != 1) {
        throw std::runtime_error("Failed to update SHA-256 digest");
    }
    if (second_size > 0 && EVP_DigestUpdate(context.get(), second, second_size) != 1) {
        throw std::runtime_error("Failed to update SHA-256 digest");
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_length = 0;
    if (EVP_DigestFinal_ex(context.get(), md, &md_length) != 1 || md_length != kDigestSize) {
        throw std::runtime_error("Failed to finalize SHA-256 digest");
    }

    Digest digest{};
    std::copy(md, md + kDigestSize, digest.begin());
    return digest;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

Digest TreeHasher::leaf_digest(const std::uint8_t* data, std::size_t size) {
    return sha256(data, size);
}

Digest TreeHasher::leaf_digest(const std::vector<std::uint8_t>& bytes) {
    return sha256(bytes.data(), bytes.size());
}

Digest TreeHasher::part_digest(const std::uint8_t* data, std::size_t size, std::size_t part_size_bound) {
    const std::size_t upper_bound = std::min(size, part_size_bound);

    std::vector<Digest> leaves;
    leaves.reserve(upper_bound / kLeafSize + 1);
    for (std::size_t offset = 0; offset < upper_bound; offset += kLeafSize) {
        const std::size_t length = std::min(kLeafSize, upper_bound - offset);
        leaves.push_back(sha256(data + offset, length));
    }
    return fold(std::move(leaves));
}

Digest TreeHasher::part_digest(const std::vector<std::uint8_t>& bytes, std::size_t part_size_bound) {
    return part_digest(bytes.data(), bytes.size(), part_size_bound);
}

Digest TreeHasher::root_digest(const std::vector<Digest>& part_digests) {
    return fold(part_digests);
}

Digest TreeHasher::combine(const Digest& left, const Digest& right) {
    return sha256(left.data(), left.size(), right.data(), right.size());
}

Digest TreeHasher::fold(std::vector<Digest> level) {
    if (level.empty()) {
        return sha256(nullptr, 0);
    }

    while (level.size() > 1) {
        std::vector<Digest> parent;
        parent.reserve((level.size() + 1) / 2);
        for (std::size_t i = 0; i < level.size(); i += 2) {
            if (i + 1 < level.size()) {
                parent.push_back(combine(level[i], level[i + 1]));
            } else {
                parent.push_back(level[i]);
            }
        }
        level = std::move(parent);
    }
    return level.front();
}

std::string to_hex(const Digest& digest) {
    static constexpr char kAlphabet[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(digest.size() * 2);
    for (std::uint8_t byte : digest) {
        hex.push_back(kAlphabet[byte >> 4]);
        hex.push_back(kAlphabet[byte & 0x0f]);
    }
    return hex;
}

std::optional<Digest> from_hex(std::string_view hex) {
    if (hex.size() != kDigestSize * 2) {
        return std::nullopt;
    }
    Digest digest{};
    for (std::size_t i = 0; i < kDigestSize; ++i) {
        const int high = hex_value(hex[2 * i]);
        const int low = hex_value(hex[2 * i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        digest[i] = static_cast<std::uint8_t>((high << 4) | low);
    }
    return digest;
}

bool matches_hex(const Digest& digest, std::string_view hex) {
    const auto decoded = from_hex(hex);
    return decoded.has_value() && *decoded == digest;
}

} // namespace archup::hash
