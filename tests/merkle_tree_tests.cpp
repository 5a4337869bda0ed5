#include "utilities/encoding.hpp"
#include "utilities/errors.hpp"
#include "utilities/merkle_tree.hpp"
#include <gtest/gtest.h>
#include <random>

using namespace arloader;

namespace {

Bytes randomBytes(size_t size, uint32_t seed) {
  std::mt19937 gen(seed);
  Bytes out(size);
  for (auto &b : out)
    b = static_cast<uint8_t>(gen());
  return out;
}

Chunk chunkOf(const Bytes &data, const NodePtr &leaf) {
  return Chunk{ByteView(data).subspan(leaf->minOffset,
                                      leaf->maxOffset - leaf->minOffset),
               leaf->minOffset, leaf->maxOffset};
}

Sha256Digest rootOf(const Bytes &data) {
  return MerkleTree::generateDataRoot(MerkleTree::generateLeaves(data))->id;
}

} // namespace

TEST(MerkleTree, KnownRootForShortTail) {
  Bytes data(MAX_CHUNK_SIZE + 1, 0);
  EXPECT_EQ(b64_encode(rootOf(data)),
            "br1Vtl3TS_NGWdHmYqBh3-MxrlckoluHCZGmUZk-dJc");
}

TEST(MerkleTree, KnownRootForExactMultiple) {
  Bytes data(2 * MAX_CHUNK_SIZE, 0);
  EXPECT_EQ(b64_encode(rootOf(data)),
            "zJuJu7Dwmaj6mkfzgUIBtWC34UwdfhK6XXv_WqvC25Y");
}

TEST(MerkleTree, ShortTailIsRebalanced) {
  auto pieces = MerkleTree::chunkBoundaries(MAX_CHUNK_SIZE + 1);
  ASSERT_EQ(pieces.size(), 2u);
  EXPECT_EQ(pieces[0].first, 0u);
  EXPECT_EQ(pieces[0].second, 131073u);
  EXPECT_EQ(pieces[1].second, MAX_CHUNK_SIZE + 1);
}

TEST(MerkleTree, EmptyInputHasSingleEmptyLeaf) {
  auto leaves = MerkleTree::generateLeaves({});
  ASSERT_EQ(leaves.size(), 1u);
  EXPECT_EQ(leaves[0]->minOffset, 0u);
  EXPECT_EQ(leaves[0]->maxOffset, 0u);
  auto root = MerkleTree::generateDataRoot(leaves);
  EXPECT_EQ(root->id, leaves[0]->id);
  EXPECT_EQ(b64_encode(root->id), "x9bUbvLyiRlsOOqClNkKV0LAohFd-PfXfb_XoYosfQI");
}

TEST(MerkleTree, ChunkSizeInvariants) {
  for (uint64_t size :
       {uint64_t{1}, uint64_t{1000}, MIN_CHUNK_SIZE - 1, MAX_CHUNK_SIZE - 1,
        MAX_CHUNK_SIZE, MAX_CHUNK_SIZE + 1, MAX_CHUNK_SIZE + MIN_CHUNK_SIZE,
        2 * MAX_CHUNK_SIZE, 3 * MAX_CHUNK_SIZE + 7, 5 * MAX_CHUNK_SIZE - 1}) {
    auto pieces = MerkleTree::chunkBoundaries(size);
    bool trailingEmpty = pieces.back().first == pieces.back().second;
    EXPECT_EQ(trailingEmpty, size % MAX_CHUNK_SIZE == 0) << size;

    uint64_t cursor = 0;
    for (size_t i = 0; i < pieces.size(); ++i) {
      uint64_t len = pieces[i].second - pieces[i].first;
      EXPECT_EQ(pieces[i].first, cursor) << size;
      EXPECT_LE(len, MAX_CHUNK_SIZE) << size;
      bool isTrailingEmpty = trailingEmpty && i + 1 == pieces.size();
      if (size > MAX_CHUNK_SIZE && !isTrailingEmpty)
        EXPECT_GE(len, MIN_CHUNK_SIZE) << size << " piece " << i;
      cursor = pieces[i].second;
    }
    EXPECT_EQ(cursor, size);
  }
}

TEST(MerkleTree, EveryProofValidates) {
  Bytes data = randomBytes(3 * MAX_CHUNK_SIZE + 1234, 7);
  auto leaves = MerkleTree::generateLeaves(data);
  auto root = MerkleTree::generateDataRoot(leaves);
  auto proofs = MerkleTree::resolveProofs(root);
  ASSERT_EQ(proofs.size(), leaves.size());
  for (size_t i = 0; i < leaves.size(); ++i) {
    EXPECT_EQ(proofs[i].offset, leaves[i]->maxOffset - 1);
    EXPECT_NO_THROW(
        MerkleTree::validateChunk(root->id, chunkOf(data, leaves[i]), proofs[i]));
  }
}

TEST(MerkleTree, ExactMultipleProvesEveryDataLeaf) {
  for (uint64_t blocks : {uint64_t{1}, uint64_t{2}, uint64_t{3}, uint64_t{4}}) {
    Bytes data = randomBytes(blocks * MAX_CHUNK_SIZE, 11);
    auto leaves = MerkleTree::generateLeaves(data);
    ASSERT_EQ(leaves.size(), blocks + 1);
    EXPECT_EQ(leaves.back()->minOffset, leaves.back()->maxOffset);
    auto root = MerkleTree::generateDataRoot(leaves);
    auto proofs = MerkleTree::resolveProofs(root);
    ASSERT_EQ(proofs.size(), blocks) << blocks;
    for (size_t i = 0; i < proofs.size(); ++i) {
      EXPECT_EQ(proofs[i].offset, leaves[i]->maxOffset - 1);
      EXPECT_NO_THROW(MerkleTree::validateChunk(
          root->id, chunkOf(data, leaves[i]), proofs[i]))
          << blocks << " blocks, leaf " << i;
    }
  }
}

TEST(MerkleTree, EmptyInputProofValidates) {
  Bytes data;
  auto leaves = MerkleTree::generateLeaves(data);
  auto root = MerkleTree::generateDataRoot(leaves);
  auto proofs = MerkleTree::resolveProofs(root);
  ASSERT_EQ(proofs.size(), 1u);
  EXPECT_EQ(proofs[0].offset, 0u);
  EXPECT_NO_THROW(
      MerkleTree::validateChunk(root->id, chunkOf(data, leaves[0]), proofs[0]));
}

TEST(MerkleTree, TamperedChunkIsRejected) {
  Bytes data = randomBytes(2 * MAX_CHUNK_SIZE + 5000, 3);
  auto leaves = MerkleTree::generateLeaves(data);
  auto root = MerkleTree::generateDataRoot(leaves);
  auto proofs = MerkleTree::resolveProofs(root);

  Bytes tampered = data;
  tampered[leaves[1]->minOffset + 17] ^= 0x01;
  try {
    MerkleTree::validateChunk(root->id, chunkOf(tampered, leaves[1]), proofs[1]);
    FAIL() << "tampered chunk accepted";
  } catch (const Error &e) {
    EXPECT_EQ(e.kind(), ErrorKind::InvalidProof);
  }

  Proof badPath = proofs[0];
  badPath.proof[5] ^= 0xff;
  EXPECT_THROW(
      MerkleTree::validateChunk(root->id, chunkOf(data, leaves[0]), badPath),
      Error);
}

TEST(MerkleTree, SwappedProofsAreRejected) {
  Bytes data = randomBytes(4 * MAX_CHUNK_SIZE + 99, 5);
  auto leaves = MerkleTree::generateLeaves(data);
  auto root = MerkleTree::generateDataRoot(leaves);
  auto proofs = MerkleTree::resolveProofs(root);
  for (size_t i = 0; i + 1 < leaves.size(); ++i) {
    EXPECT_THROW(MerkleTree::validateChunk(root->id, chunkOf(data, leaves[i]),
                                           proofs[i + 1]),
                 Error)
        << i;
  }
}

TEST(MerkleTree, TruncatedProofIsRejected) {
  Bytes data = randomBytes(MAX_CHUNK_SIZE + MIN_CHUNK_SIZE, 9);
  auto leaves = MerkleTree::generateLeaves(data);
  auto root = MerkleTree::generateDataRoot(leaves);
  auto proofs = MerkleTree::resolveProofs(root);
  Proof shortProof = proofs[0];
  shortProof.proof.resize(shortProof.proof.size() - 1);
  EXPECT_THROW(MerkleTree::validateChunk(root->id, chunkOf(data, leaves[0]),
                                         shortProof),
               Error);
}

TEST(MerkleTree, ParallelLeavesMatchSequential) {
  Bytes data = randomBytes(9 * MAX_CHUNK_SIZE + 3, 21);
  auto sequential = MerkleTree::generateLeaves(data, 1);
  auto parallel = MerkleTree::generateLeaves(data, 4);
  ASSERT_EQ(sequential.size(), parallel.size());
  for (size_t i = 0; i < sequential.size(); ++i)
    EXPECT_EQ(sequential[i]->id, parallel[i]->id);
}

TEST(MerkleTree, EmptyLeafListHasNoRoot) {
  EXPECT_THROW(MerkleTree::generateDataRoot({}), Error);
}

TEST(MerkleTree, OffsetNoteIsBigEndian) {
  auto note = MerkleTree::offsetNote(0x0102);
  EXPECT_EQ(note[31], 0x02);
  EXPECT_EQ(note[30], 0x01);
  for (size_t i = 0; i < 30; ++i)
    EXPECT_EQ(note[i], 0);
}
