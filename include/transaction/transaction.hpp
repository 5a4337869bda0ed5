#ifndef ARLOADER_TRANSACTION_HPP
#define ARLOADER_TRANSACTION_HPP

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "crypto/deep_hash.hpp"
#include "crypto/signer.hpp"
#include "transaction/tag.hpp"
#include "utilities/merkle_tree.hpp"

namespace arloader {

/**
 * @brief Body of one POST /chunk request.
 *
 * @c chunk views the owning transaction's data buffer and is valid only
 * while that transaction keeps its data.
 */
struct ChunkPayload {
  Bytes dataRoot;
  uint64_t dataSize{0};
  Bytes dataPath;
  uint64_t offset{0};
  ByteView chunk;

  /// {data_root, data_size, data_path, offset, chunk}; numbers as strings.
  nlohmann::json toJson() const;
};

/**
 * @brief Network transaction in format 1 or 2.
 *
 * Only format 2 is produced locally; format 1 objects fetched from the
 * network can still be deep-hashed and verified.
 */
class Transaction {
public:
  uint8_t format{2};
  Bytes id;
  Bytes lastTx;
  Bytes owner;
  std::vector<Tag> tags;
  Bytes target;
  uint64_t quantity{0};
  Bytes dataRoot;
  Bytes data;
  uint64_t dataSize{0};
  uint64_t reward{0};
  Bytes signature;

  /// Leaves posted as chunks, aligned with @c proofs.
  std::vector<NodePtr> chunks;
  std::vector<Proof> proofs;

  /**
   * @brief Builds the Merkle tree over @c data and fills dataSize, dataRoot,
   * chunks and proofs.
   * @param threads forwarded to MerkleTree::generateLeaves.
   */
  void computeDataRoot(size_t threads = 1);

  /// Deep-hash input for the signature; layout depends on @c format.
  DeepHashItem toDeepHashItem() const;

  /// Signs the deep hash with @p signer and sets owner, signature and id.
  void sign(const Signer &signer);

  bool isSigned() const { return !id.empty() && !signature.empty(); }

  /**
   * @brief Checks that id == SHA256(signature) and that the signature
   * verifies over the deep hash against owner.
   */
  bool verify() const;

  /**
   * @brief Request body for POST /tx.
   * @param includeData when false the data field is sent empty and the
   *        chunks are expected to follow.
   */
  nlohmann::json toJson(bool includeData = true) const;

  /**
   * @brief Parses a header returned by GET /tx/{id}.
   * @throws Error(Json) on missing fields, Error(Base64Decode) on bad text.
   */
  static Transaction fromJson(const nlohmann::json &j);

  /**
   * @brief Chunk @p index with its proof, ready for POST /chunk.
   * @throws Error(InvalidProof) when @p index is out of range.
   */
  ChunkPayload getChunk(size_t index) const;

  /// Drops the payload once it has been posted; header fields remain.
  void releaseData();
};

} // namespace arloader

#endif // ARLOADER_TRANSACTION_HPP
