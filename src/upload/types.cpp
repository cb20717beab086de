#include "archup/upload/types.hpp"

namespace archup::upload {

std::string ByteRange::to_header() const {
    return "bytes " + std::to_string(start) + "-" + std::to_string(end) + "/" + std::to_string(total);
}

const char* to_string(PartState state) noexcept {
    switch (state) {
        case PartState::Pending: return "Pending";
        case PartState::Verified: return "Verified";
        case PartState::Uploaded: return "Uploaded";
        case PartState::Failed: return "Failed";
    }
    return "Unknown";
}

} // namespace archup::upload
