#include "upload/path_chunker.hpp"
#include "utilities/errors.hpp"

namespace arloader {

std::vector<PathsChunk> chunkPathsBySize(
    const std::vector<std::pair<std::filesystem::path, uint64_t>> &sized,
    uint64_t limit) {
  std::vector<PathsChunk> chunks;
  PathsChunk current;
  for (const auto &[path, size] : sized) {
    if (!current.paths.empty() && current.dataSize + size > limit) {
      chunks.push_back(std::move(current));
      current = PathsChunk{};
    }
    current.paths.push_back(path);
    current.dataSize += size;
  }
  if (!current.paths.empty())
    chunks.push_back(std::move(current));
  return chunks;
}

std::vector<PathsChunk>
chunkFilePaths(const std::vector<std::filesystem::path> &paths, uint64_t limit) {
  std::vector<std::pair<std::filesystem::path, uint64_t>> sized;
  sized.reserve(paths.size());
  for (const auto &path : paths) {
    std::error_code ec;
    uint64_t size = std::filesystem::file_size(path, ec);
    if (ec)
      throwError(ErrorKind::Io, path.string() + ": " + ec.message());
    sized.emplace_back(path, size);
  }
  return chunkPathsBySize(sized, limit);
}

} // namespace arloader
