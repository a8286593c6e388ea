#pragma once

#include <cstddef>
#include <filesystem>
#include <span>
#include <system_error>

namespace sluice::core {

/**
 * Write data to target so that after return either the old content or the complete new
 * content is visible, never a prefix: temp file in the same directory, fsync, rename,
 * fsync of the parent directory. Returns the first OS error encountered.
 */
std::error_code writeFileAtomically(const std::filesystem::path& target,
                                    std::span<const std::byte> data);

std::error_code fsyncFile(const std::filesystem::path& p);
std::error_code fsyncDir(const std::filesystem::path& dir);

} // namespace sluice::core
