#pragma once

#include "upsync/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace upsync {

/**
 * @brief Replace @p path with @p contents so readers see old or new, never half
 *
 * Writes a sibling temp file, fsyncs it, renames it over the target and
 * fsyncs the parent directory so the rename itself is durable.
 */
Result<void> write_file_atomic(const std::filesystem::path& path, const std::string& contents);

Result<std::string> read_file(const std::filesystem::path& path);

/// 64-bit FNV-1a rendered as 16 lowercase hex digits
std::string fnv1a_hex(const std::string& text);

} // namespace upsync
