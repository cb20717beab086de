#pragma once

#include "archup/core/result.hpp"
#include "archup/upload/types.hpp"

#include <filesystem>

namespace archup::upload {

/// Default descriptor location for a source file: "<file>.archup-session.json".
std::filesystem::path descriptor_path_for(const std::filesystem::path& source);

archup::Result<void> save_descriptor(const std::filesystem::path& path, const SessionDescriptor& descriptor);

archup::Result<SessionDescriptor> load_descriptor(const std::filesystem::path& path);

} // namespace archup::upload
