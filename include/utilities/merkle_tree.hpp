#ifndef ARLOADER_MERKLE_TREE_HPP
#define ARLOADER_MERKLE_TREE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "utilities/digest.hpp"

namespace arloader {

inline constexpr uint64_t MAX_CHUNK_SIZE = 256 * 1024;
inline constexpr uint64_t MIN_CHUNK_SIZE = 32 * 1024;
inline constexpr size_t NOTE_SIZE = 32;
inline constexpr size_t BRANCH_RECORD_SIZE = 3 * NOTE_SIZE;
inline constexpr size_t LEAF_RECORD_SIZE = 2 * NOTE_SIZE;

/// A view of one chunk inside the buffer that owns the data.
struct Chunk {
  ByteView data;
  uint64_t minOffset{0};
  uint64_t maxOffset{0};
};

/**
 * @brief Node of the content-addressing tree.
 *
 * Leaves carry the chunk's data hash; branches carry both children. Nodes
 * are immutable once built and shared between the leaf list and the tree.
 */
struct MerkleNode {
  Sha256Digest id{};
  std::optional<Sha256Digest> dataHash; ///< set on leaves only
  uint64_t minOffset{0};
  uint64_t maxOffset{0};
  std::shared_ptr<const MerkleNode> left;
  std::shared_ptr<const MerkleNode> right;

  bool isLeaf() const { return dataHash.has_value(); }
};

using NodePtr = std::shared_ptr<const MerkleNode>;

struct Proof {
  uint64_t offset{0};
  Bytes proof;
};

class MerkleTree {
public:
  /**
   * @brief Chunk boundaries [min, max) for an input of @p size bytes.
   *
   * Pieces are MAX_CHUNK_SIZE long; a short trailing piece below
   * MIN_CHUNK_SIZE is rebalanced with its predecessor, and an input ending
   * exactly on a MAX_CHUNK_SIZE boundary gets a trailing empty piece.
   */
  static std::vector<std::pair<uint64_t, uint64_t>> chunkBoundaries(uint64_t size);

  /**
   * @brief Hashes every chunk of @p data into a leaf.
   * @param threads Number of hashing threads; 0 picks hardware concurrency.
   */
  static std::vector<NodePtr> generateLeaves(ByteView data, size_t threads = 1);

  /// Folds leaves pairwise into a single root. An odd last node ascends as is.
  static NodePtr generateDataRoot(std::vector<NodePtr> nodes);

  /**
   * @brief Emits one proof per non-empty leaf in offset order.
   *
   * The empty leaf that follows an exact multiple of MAX_CHUNK_SIZE takes
   * part in the root but carries no data, so it gets no proof. An empty
   * input still yields the proof of its single leaf.
   */
  static std::vector<Proof> resolveProofs(const NodePtr &root);

  /**
   * @brief Checks @p chunk against @p rootId using @p proof.
   * @throws Error(InvalidProof) on any mismatch.
   */
  static void validateChunk(const Sha256Digest &rootId, const Chunk &chunk,
                            const Proof &proof);

  static Sha256Digest leafId(const Sha256Digest &dataHash, uint64_t maxOffset);
  static Sha256Digest branchId(const Sha256Digest &left,
                               const Sha256Digest &right, uint64_t pivot);

  /// 32-byte note: 24 zero bytes followed by @p value big-endian.
  static std::array<uint8_t, NOTE_SIZE> offsetNote(uint64_t value);
};

} // namespace arloader

#endif // ARLOADER_MERKLE_TREE_HPP
