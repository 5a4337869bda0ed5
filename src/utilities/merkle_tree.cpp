#include "utilities/merkle_tree.hpp"
#include "utilities/errors.hpp"

#include <algorithm>
#include <cstring>
#include <functional>
#include <exception>
#include <thread>

namespace arloader {

std::array<uint8_t, NOTE_SIZE> MerkleTree::offsetNote(uint64_t value) {
  std::array<uint8_t, NOTE_SIZE> note{};
  for (size_t i = 0; i < 8; ++i) {
    note[NOTE_SIZE - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
  }
  return note;
}

static uint64_t readNote(const uint8_t *note) {
  uint64_t value = 0;
  for (size_t i = NOTE_SIZE - 8; i < NOTE_SIZE; ++i) {
    value = (value << 8) | note[i];
  }
  return value;
}

Sha256Digest MerkleTree::leafId(const Sha256Digest &dataHash,
                                uint64_t maxOffset) {
  auto note = offsetNote(maxOffset);
  return sha256_all({dataHash, note});
}

Sha256Digest MerkleTree::branchId(const Sha256Digest &left,
                                  const Sha256Digest &right, uint64_t pivot) {
  auto note = offsetNote(pivot);
  return sha256_all({left, right, note});
}

std::vector<std::pair<uint64_t, uint64_t>>
MerkleTree::chunkBoundaries(uint64_t size) {
  std::vector<std::pair<uint64_t, uint64_t>> pieces;
  uint64_t cursor = 0;
  while (size - cursor >= MAX_CHUNK_SIZE) {
    pieces.emplace_back(cursor, cursor + MAX_CHUNK_SIZE);
    cursor += MAX_CHUNK_SIZE;
  }
  if (cursor < size) {
    pieces.emplace_back(cursor, size);
  }

  if (pieces.size() > 1 &&
      pieces.back().second - pieces.back().first < MIN_CHUNK_SIZE) {
    uint64_t start = pieces[pieces.size() - 2].first;
    uint64_t end = pieces.back().second;
    uint64_t half = (end - start + 1) / 2;
    pieces[pieces.size() - 2] = {start, start + half};
    pieces.back() = {start + half, end};
  }

  if (!pieces.empty() &&
      pieces.back().second - pieces.back().first == MAX_CHUNK_SIZE) {
    pieces.emplace_back(size, size);
  }
  if (pieces.empty()) {
    pieces.emplace_back(0, 0);
  }
  return pieces;
}

std::vector<NodePtr> MerkleTree::generateLeaves(ByteView data, size_t threads) {
  const auto bounds = chunkBoundaries(data.size());
  std::vector<NodePtr> leaves(bounds.size());

  auto hashRange = [&](size_t first, size_t last) {
    for (size_t i = first; i < last; ++i) {
      auto node = std::make_shared<MerkleNode>();
      node->minOffset = bounds[i].first;
      node->maxOffset = bounds[i].second;
      node->dataHash = sha256(data.subspan(node->minOffset,
                                           node->maxOffset - node->minOffset));
      node->id = leafId(*node->dataHash, node->maxOffset);
      leaves[i] = std::move(node);
    }
  };

  if (threads == 0)
    threads = std::max(1u, std::thread::hardware_concurrency());
  threads = std::min(threads, bounds.size());
  if (threads <= 1) {
    hashRange(0, bounds.size());
    return leaves;
  }

  // Leaves are independent; give each worker a contiguous slice.
  std::vector<std::thread> workers;
  std::vector<std::exception_ptr> errors(threads);
  size_t per = (bounds.size() + threads - 1) / threads;
  for (size_t t = 0; t < threads; ++t) {
    size_t first = t * per;
    size_t last = std::min(bounds.size(), first + per);
    if (first >= last)
      break;
    workers.emplace_back([&, t, first, last] {
      try {
        hashRange(first, last);
      } catch (...) {
        errors[t] = std::current_exception();
      }
    });
  }
  for (auto &w : workers)
    w.join();
  for (auto &e : errors) {
    if (e)
      std::rethrow_exception(e);
  }
  return leaves;
}

NodePtr MerkleTree::generateDataRoot(std::vector<NodePtr> nodes) {
  if (nodes.empty())
    throwError(ErrorKind::InvalidHash, "cannot build a tree without leaves");
  while (nodes.size() > 1) {
    std::vector<NodePtr> next;
    next.reserve((nodes.size() + 1) / 2);
    for (size_t i = 0; i + 1 < nodes.size(); i += 2) {
      auto branch = std::make_shared<MerkleNode>();
      branch->left = nodes[i];
      branch->right = nodes[i + 1];
      branch->minOffset = nodes[i]->minOffset;
      branch->maxOffset = nodes[i + 1]->maxOffset;
      branch->id = branchId(nodes[i]->id, nodes[i + 1]->id,
                            nodes[i]->maxOffset);
      next.push_back(std::move(branch));
    }
    if (nodes.size() % 2 == 1)
      next.push_back(nodes.back());
    nodes = std::move(next);
  }
  return nodes.front();
}

std::vector<Proof> MerkleTree::resolveProofs(const NodePtr &root) {
  std::vector<Proof> proofs;
  std::function<void(const NodePtr &, const Bytes &)> walk =
      [&](const NodePtr &node, const Bytes &prefix) {
        Bytes path = prefix;
        if (node->isLeaf()) {
          // The trailing empty leaf of an exact multiple only pads the root.
          if (node->minOffset == node->maxOffset && node != root)
            return;
          auto note = offsetNote(node->maxOffset);
          path.insert(path.end(), node->dataHash->begin(),
                      node->dataHash->end());
          path.insert(path.end(), note.begin(), note.end());
          proofs.push_back(
              Proof{node->maxOffset == 0 ? 0 : node->maxOffset - 1,
                    std::move(path)});
          return;
        }
        auto note = offsetNote(node->left->maxOffset);
        path.insert(path.end(), node->left->id.begin(), node->left->id.end());
        path.insert(path.end(), node->right->id.begin(), node->right->id.end());
        path.insert(path.end(), note.begin(), note.end());
        walk(node->left, path);
        walk(node->right, path);
      };
  walk(root, Bytes{});
  return proofs;
}

void MerkleTree::validateChunk(const Sha256Digest &rootId, const Chunk &chunk,
                               const Proof &proof) {
  const Bytes &bytes = proof.proof;
  if (bytes.size() < LEAF_RECORD_SIZE ||
      (bytes.size() - LEAF_RECORD_SIZE) % BRANCH_RECORD_SIZE != 0) {
    throwError(ErrorKind::InvalidProof, "proof length " +
                                            std::to_string(bytes.size()));
  }

  Sha256Digest expected = rootId;
  size_t branches = (bytes.size() - LEAF_RECORD_SIZE) / BRANCH_RECORD_SIZE;
  for (size_t i = 0; i < branches; ++i) {
    const uint8_t *record = bytes.data() + i * BRANCH_RECORD_SIZE;
    Sha256Digest left{}, right{};
    std::memcpy(left.data(), record, NOTE_SIZE);
    std::memcpy(right.data(), record + NOTE_SIZE, NOTE_SIZE);
    uint64_t pivot = readNote(record + 2 * NOTE_SIZE);
    if (branchId(left, right, pivot) != expected) {
      throwError(ErrorKind::InvalidProof,
                 "branch " + std::to_string(i) + " does not hash to parent");
    }
    expected = chunk.maxOffset > pivot ? right : left;
  }

  const uint8_t *leaf = bytes.data() + branches * BRANCH_RECORD_SIZE;
  Sha256Digest dataHash{};
  std::memcpy(dataHash.data(), leaf, NOTE_SIZE);
  uint64_t maxOffset = readNote(leaf + NOTE_SIZE);
  if (leafId(dataHash, maxOffset) != expected || maxOffset != chunk.maxOffset) {
    throwError(ErrorKind::InvalidProof, "leaf does not match path");
  }
  if (dataHash != sha256(chunk.data)) {
    throwError(ErrorKind::InvalidProof, "chunk data hash mismatch");
  }
}

} // namespace arloader
