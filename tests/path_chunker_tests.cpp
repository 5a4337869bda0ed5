#include "gtest/gtest.h"
#include "upload/path_chunker.hpp"
#include "utilities/errors.hpp"
#include <filesystem>
#include <fstream>

using namespace arloader;
namespace fs = std::filesystem;

TEST(PathChunker, GreedyGroupsInOrder) {
  auto chunks = chunkPathsBySize({{"a", 40}, {"b", 40}, {"c", 30}, {"d", 10}, {"e", 5}}, 100);
  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].paths, (std::vector<fs::path>{"a", "b"}));
  EXPECT_EQ(chunks[0].dataSize, 80u);
  EXPECT_EQ(chunks[1].paths, (std::vector<fs::path>{"c", "d", "e"}));
  EXPECT_EQ(chunks[1].dataSize, 45u);
}

TEST(PathChunker, ExactFitStaysTogether) {
  auto chunks = chunkPathsBySize({{"a", 60}, {"b", 40}, {"c", 1}}, 100);
  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].dataSize, 100u);
  EXPECT_EQ(chunks[1].paths, (std::vector<fs::path>{"c"}));
}

TEST(PathChunker, OversizedFileGetsOwnGroup) {
  auto chunks = chunkPathsBySize({{"small", 10}, {"huge", 500}, {"tail", 10}}, 100);
  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[1].paths, (std::vector<fs::path>{"huge"}));
  EXPECT_EQ(chunks[1].dataSize, 500u);
}

TEST(PathChunker, EveryPathAppearsOnce) {
  std::vector<std::pair<fs::path, uint64_t>> sized;
  for (int i = 0; i < 50; ++i)
    sized.emplace_back("f" + std::to_string(i), static_cast<uint64_t>((i * 37) % 90 + 1));
  auto chunks = chunkPathsBySize(sized, 200);

  size_t index = 0;
  for (const auto &chunk : chunks) {
    ASSERT_FALSE(chunk.paths.empty());
    uint64_t total = 0;
    for (const auto &path : chunk.paths) {
      ASSERT_LT(index, sized.size());
      EXPECT_EQ(path, sized[index].first);
      total += sized[index].second;
      ++index;
    }
    EXPECT_EQ(chunk.dataSize, total);
    EXPECT_LE(chunk.dataSize, 200u);
  }
  EXPECT_EQ(index, sized.size());
}

TEST(PathChunker, EmptyInput) {
  EXPECT_TRUE(chunkPathsBySize({}, 100).empty());
}

TEST(PathChunker, UsesFileSizes) {
  fs::path dir = fs::temp_directory_path() / "arloader_path_chunker";
  fs::remove_all(dir);
  fs::create_directories(dir);
  std::ofstream(dir / "one") << std::string(70, 'x');
  std::ofstream(dir / "two") << std::string(50, 'y');

  auto chunks = chunkFilePaths({dir / "one", dir / "two"}, 100);
  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].dataSize, 70u);
  EXPECT_EQ(chunks[1].dataSize, 50u);

  EXPECT_THROW(chunkFilePaths({dir / "missing"}, 100), Error);
  fs::remove_all(dir);
}
