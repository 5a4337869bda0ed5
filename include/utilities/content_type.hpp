#ifndef ARLOADER_CONTENT_TYPE_HPP
#define ARLOADER_CONTENT_TYPE_HPP

#include <filesystem>
#include <optional>
#include <string>

#include "digest.hpp"

namespace arloader {

inline constexpr const char *OCTET_STREAM = "application/octet-stream";
inline constexpr const char *MANIFEST_CONTENT_TYPE =
    "application/x.arweave-manifest+json";

/// MIME type for a known file extension, or nullopt.
std::optional<std::string> mimeFromPath(const std::filesystem::path &path);

/**
 * @brief Detects a MIME type from leading magic bytes.
 * @return The detected type, or application/octet-stream.
 */
std::string sniffContentType(ByteView data);

} // namespace arloader

#endif // ARLOADER_CONTENT_TYPE_HPP
