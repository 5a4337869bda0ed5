#include "test_keys.hpp"
#include "transaction/pricing.hpp"
#include "transaction/transaction.hpp"
#include "utilities/encoding.hpp"
#include "utilities/errors.hpp"
#include <algorithm>
#include <gtest/gtest.h>

using namespace arloader;

namespace {

Transaction fixedTransaction() {
  Transaction tx;
  tx.owner = Bytes(512, 0x03);
  tx.lastTx = Bytes(32, 0x04);
  tx.reward = 1000;
  tx.tags = {Tag::fromUtf8("a", "b")};
  tx.data = to_bytes("tasty");
  tx.computeDataRoot();
  return tx;
}

} // namespace

TEST(Transaction, DataRootOfSingleChunk) {
  Transaction tx = fixedTransaction();
  EXPECT_EQ(tx.dataSize, 5u);
  EXPECT_EQ(b64_encode(tx.dataRoot),
            "0gp7wJRhAHRGY8X-0AilekfU6UaX6SUi7Y4WieHmutU");
  ASSERT_EQ(tx.chunks.size(), 1u);
  ASSERT_EQ(tx.proofs.size(), 1u);
}

TEST(Transaction, FormatTwoDeepHashVector) {
  Transaction tx = fixedTransaction();
  Sha384Digest expected = {182, 21,  243, 56,  235, 253, 223, 34,  131, 249,
                           25,  226, 248, 212, 31,  189, 123, 229, 91,  186,
                           249, 140, 112, 36,  243, 248, 62,  55,  142, 85,
                           69,  252, 14,  201, 132, 183, 24,  247, 15,  209,
                           120, 139, 53,  28,  238, 130, 161, 117};
  EXPECT_EQ(deepHash(tx.toDeepHashItem()), expected);
}

TEST(Transaction, FormatOneDeepHashVector) {
  Transaction tx = fixedTransaction();
  tx.format = 1;
  tx.tags.clear();
  Sha384Digest expected = {29,  151, 127, 68,  26,  87,  113, 230, 188, 171,
                           134, 191, 252, 172, 132, 77,  83,  199, 42,  3,
                           208, 175, 217, 237, 79,  92,  147, 125, 171, 126,
                           108, 137, 190, 32,  116, 90,  3,   231, 111, 53,
                           142, 230, 221, 214, 221, 6,   39,  136};
  EXPECT_EQ(deepHash(tx.toDeepHashItem()), expected);
}

TEST(Transaction, UnknownFormatIsRejected) {
  Transaction tx = fixedTransaction();
  tx.format = 3;
  EXPECT_THROW(tx.toDeepHashItem(), Error);
}

TEST(Transaction, SignAndVerify) {
  Transaction tx = fixedTransaction();
  EXPECT_FALSE(tx.isSigned());
  tx.sign(testkeys::signer());
  ASSERT_TRUE(tx.isSigned());
  EXPECT_EQ(tx.owner, testkeys::signer().publicModulus());
  auto idHash = sha256(tx.signature);
  EXPECT_EQ(tx.id, Bytes(idHash.begin(), idHash.end()));
  EXPECT_TRUE(tx.verify());

  Transaction altered = tx;
  altered.reward += 1;
  EXPECT_FALSE(altered.verify());
}

TEST(Transaction, JsonRoundTripKeepsSignature) {
  Transaction tx = fixedTransaction();
  tx.sign(testkeys::signer());
  nlohmann::json j = tx.toJson();
  EXPECT_EQ(j.at("reward").get<std::string>(), "1000");
  EXPECT_EQ(j.at("data_size").get<std::string>(), "5");
  EXPECT_EQ(j.at("quantity").get<std::string>(), "0");
  EXPECT_EQ(j.at("data").get<std::string>(), b64_encode(to_bytes("tasty")));

  Transaction parsed = Transaction::fromJson(j);
  EXPECT_EQ(parsed.id, tx.id);
  EXPECT_EQ(parsed.tags, tx.tags);
  EXPECT_EQ(parsed.dataRoot, tx.dataRoot);
  EXPECT_TRUE(parsed.verify());
}

TEST(Transaction, HeaderJsonOmitsData) {
  Transaction tx = fixedTransaction();
  EXPECT_EQ(tx.toJson(false).at("data").get<std::string>(), "");
}

TEST(Transaction, FromJsonRejectsBadNumbers) {
  nlohmann::json j = {{"format", 2}, {"reward", "12x"}};
  try {
    Transaction::fromJson(j);
    FAIL() << "bad reward accepted";
  } catch (const Error &e) {
    EXPECT_EQ(e.kind(), ErrorKind::Json);
  }
}

TEST(Transaction, ChunksViewTheDataBuffer) {
  Transaction tx;
  tx.data = Bytes(MAX_CHUNK_SIZE + MIN_CHUNK_SIZE, 0x5a);
  tx.computeDataRoot();
  ASSERT_EQ(tx.chunks.size(), 2u);
  ChunkPayload second = tx.getChunk(1);
  EXPECT_EQ(second.chunk.data(), tx.data.data() + MAX_CHUNK_SIZE);
  EXPECT_EQ(second.chunk.size(), MIN_CHUNK_SIZE);
  EXPECT_EQ(second.offset, MAX_CHUNK_SIZE + MIN_CHUNK_SIZE - 1);
  EXPECT_EQ(second.toJson().at("data_size").get<std::string>(),
            std::to_string(MAX_CHUNK_SIZE + MIN_CHUNK_SIZE));

  EXPECT_THROW(tx.getChunk(2), Error);
  tx.releaseData();
  EXPECT_THROW(tx.getChunk(0), Error);
}

TEST(Transaction, ExactMultipleHasNoEmptyChunk) {
  Transaction tx;
  tx.data = Bytes(2 * MAX_CHUNK_SIZE, 0x33);
  tx.computeDataRoot();
  ASSERT_EQ(tx.chunks.size(), 2u);
  ASSERT_EQ(tx.proofs.size(), 2u);
  Sha256Digest root{};
  std::copy(tx.dataRoot.begin(), tx.dataRoot.end(), root.begin());
  for (size_t i = 0; i < tx.chunks.size(); ++i) {
    ChunkPayload payload = tx.getChunk(i);
    EXPECT_EQ(payload.chunk.size(), MAX_CHUNK_SIZE);
    Proof proof{payload.offset, payload.dataPath};
    EXPECT_NO_THROW(MerkleTree::validateChunk(
        root,
        Chunk{payload.chunk, tx.chunks[i]->minOffset, tx.chunks[i]->maxOffset},
        proof));
  }
  EXPECT_THROW(tx.getChunk(2), Error);
}

TEST(Pricing, RewardGrowsPerStartedBlock) {
  PriceTerms terms = PriceTerms::fromQuotes(1000, 1500, 1.0);
  EXPECT_EQ(terms.base, 1000u);
  EXPECT_EQ(terms.incremental, 500u);
  EXPECT_EQ(terms.rewardFor(0), 1000u);
  EXPECT_EQ(terms.rewardFor(1), 1000u);
  EXPECT_EQ(terms.rewardFor(BLOCK_SIZE), 1000u);
  EXPECT_EQ(terms.rewardFor(BLOCK_SIZE + 1), 1500u);
  EXPECT_EQ(terms.rewardFor(3 * BLOCK_SIZE), 2000u);

  PriceTerms doubled = PriceTerms::fromQuotes(1000, 1500, 2.0);
  EXPECT_EQ(doubled.base, 2000u);
  EXPECT_EQ(doubled.incremental, 1000u);
}

TEST(Pricing, LamportsHaveAFloor) {
  EXPECT_EQ(lamportsFor(0), FLOOR);
  EXPECT_EQ(lamportsFor(RATE * 4000), FLOOR);
  EXPECT_EQ(lamportsFor(RATE * 6000), 6000u);
}
