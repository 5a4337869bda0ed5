#include "transaction/transaction.hpp"
#include "utilities/encoding.hpp"
#include "utilities/errors.hpp"

#include <algorithm>

namespace arloader {

namespace {

uint64_t readU64(const nlohmann::json &j, const char *key) {
  if (!j.contains(key))
    return 0;
  const auto &v = j.at(key);
  if (v.is_number_unsigned())
    return v.get<uint64_t>();
  std::string text = v.get<std::string>();
  if (text.empty())
    return 0;
  try {
    size_t used = 0;
    uint64_t value = std::stoull(text, &used);
    if (used != text.size())
      throw std::invalid_argument(text);
    return value;
  } catch (const std::exception &) {
    throwError(ErrorKind::Json, std::string("bad number in field ") + key);
  }
}

Bytes readB64(const nlohmann::json &j, const char *key) {
  if (!j.contains(key) || j.at(key).is_null())
    return {};
  return b64_decode(j.at(key).get<std::string>());
}

DeepHashItem decimal(uint64_t value) {
  return DeepHashItem::fromString(std::to_string(value));
}

} // namespace

nlohmann::json ChunkPayload::toJson() const {
  return nlohmann::json{{"data_root", b64_encode(dataRoot)},
                        {"data_size", std::to_string(dataSize)},
                        {"data_path", b64_encode(dataPath)},
                        {"offset", std::to_string(offset)},
                        {"chunk", b64_encode(chunk)}};
}

void Transaction::computeDataRoot(size_t threads) {
  dataSize = data.size();
  chunks = MerkleTree::generateLeaves(data, threads);
  auto root = MerkleTree::generateDataRoot(chunks);
  dataRoot.assign(root->id.begin(), root->id.end());
  proofs = MerkleTree::resolveProofs(root);
  if (chunks.size() > 1 && chunks.back()->minOffset == chunks.back()->maxOffset)
    chunks.pop_back();
}

DeepHashItem Transaction::toDeepHashItem() const {
  switch (format) {
  case 1:
    return DeepHashItem::fromChildren({
        DeepHashItem::fromBlob(ByteView(owner)),
        DeepHashItem::fromBlob(ByteView(target)),
        DeepHashItem::fromBlob(ByteView(data)),
        decimal(quantity),
        decimal(reward),
        DeepHashItem::fromBlob(ByteView(lastTx)),
        tagsToDeepHashItem(tags),
    });
  case 2:
    return DeepHashItem::fromChildren({
        DeepHashItem::fromString("2"),
        DeepHashItem::fromBlob(ByteView(owner)),
        DeepHashItem::fromBlob(ByteView(target)),
        decimal(quantity),
        decimal(reward),
        DeepHashItem::fromBlob(ByteView(lastTx)),
        tagsToDeepHashItem(tags),
        decimal(dataSize),
        DeepHashItem::fromBlob(ByteView(dataRoot)),
    });
  default:
    throwError(ErrorKind::FormatError,
               "unsupported transaction format " + std::to_string(format));
  }
}

void Transaction::sign(const Signer &signer) {
  owner = signer.publicModulus();
  auto digest = deepHash(toDeepHashItem());
  signature = signer.sign(digest);
  auto hash = sha256(signature);
  id.assign(hash.begin(), hash.end());
}

bool Transaction::verify() const {
  if (!isSigned())
    return false;
  auto hash = sha256(signature);
  if (!std::equal(hash.begin(), hash.end(), id.begin(), id.end()))
    return false;
  auto digest = deepHash(toDeepHashItem());
  return verifySignature(owner, digest, signature);
}

nlohmann::json Transaction::toJson(bool includeData) const {
  nlohmann::json j;
  j["format"] = format;
  j["id"] = b64_encode(id);
  j["last_tx"] = b64_encode(lastTx);
  j["owner"] = b64_encode(owner);
  j["tags"] = tags;
  j["target"] = b64_encode(target);
  j["quantity"] = std::to_string(quantity);
  j["data_root"] = b64_encode(dataRoot);
  j["data"] = includeData ? b64_encode(data) : std::string();
  j["data_size"] = std::to_string(dataSize);
  j["reward"] = std::to_string(reward);
  j["signature"] = b64_encode(signature);
  return j;
}

Transaction Transaction::fromJson(const nlohmann::json &j) {
  Transaction tx;
  try {
    tx.format = j.value("format", 1);
    tx.id = readB64(j, "id");
    tx.lastTx = readB64(j, "last_tx");
    tx.owner = readB64(j, "owner");
    if (j.contains("tags"))
      tx.tags = j.at("tags").get<std::vector<Tag>>();
    tx.target = readB64(j, "target");
    tx.quantity = readU64(j, "quantity");
    tx.dataRoot = readB64(j, "data_root");
    tx.data = readB64(j, "data");
    tx.dataSize = readU64(j, "data_size");
    tx.reward = readU64(j, "reward");
    tx.signature = readB64(j, "signature");
  } catch (const nlohmann::json::exception &e) {
    throwError(ErrorKind::Json, std::string("transaction: ") + e.what());
  }
  return tx;
}

ChunkPayload Transaction::getChunk(size_t index) const {
  if (index >= chunks.size() || index >= proofs.size()) {
    throwError(ErrorKind::InvalidProof,
               "chunk index " + std::to_string(index) + " out of range");
  }
  const auto &leaf = chunks[index];
  if (leaf->maxOffset > data.size())
    throwError(ErrorKind::InvalidProof, "transaction data already released");
  ChunkPayload payload;
  payload.dataRoot = dataRoot;
  payload.dataSize = dataSize;
  payload.dataPath = proofs[index].proof;
  payload.offset = proofs[index].offset;
  payload.chunk = ByteView(data).subspan(leaf->minOffset,
                                         leaf->maxOffset - leaf->minOffset);
  return payload;
}

void Transaction::releaseData() {
  Bytes().swap(data);
}

} // namespace arloader
