#ifndef ARLOADER_PATH_CHUNKER_HPP
#define ARLOADER_PATH_CHUNKER_HPP

#include <cstdint>
#include <filesystem>
#include <utility>
#include <vector>

namespace arloader {

/// Group of files packed into one bundle, with their combined size.
struct PathsChunk {
  std::vector<std::filesystem::path> paths;
  uint64_t dataSize{0};
};

/**
 * @brief Greedy first-fit grouping of sized paths in iteration order.
 *
 * A path that would push the current group past @p limit starts a new
 * group. A single file larger than @p limit gets a group of its own.
 */
std::vector<PathsChunk>
chunkPathsBySize(const std::vector<std::pair<std::filesystem::path, uint64_t>> &sized,
                 uint64_t limit);

/**
 * @brief Groups files using their on-disk sizes.
 * @throws Error(Io) when a size cannot be read.
 */
std::vector<PathsChunk>
chunkFilePaths(const std::vector<std::filesystem::path> &paths, uint64_t limit);

} // namespace arloader

#endif // ARLOADER_PATH_CHUNKER_HPP
