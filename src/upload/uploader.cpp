#include "upload/uploader.hpp"
#include "bundle/bundle.hpp"
#include "manifest/manifest.hpp"
#include "utilities/content_type.hpp"
#include "utilities/encoding.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <mutex>
#include <thread>

#ifndef ARLOADER_VERSION
#define ARLOADER_VERSION "0.1.63"
#endif

namespace fs = std::filesystem;

namespace arloader {

namespace {

/// Concurrent chunk POSTs per transaction.
constexpr size_t MAX_CHUNK_POSTERS = 8;

Bytes readFile(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    throwError(ErrorKind::Io, "cannot open " + path.string());
  Bytes data((std::istreambuf_iterator<char>(in)),
             std::istreambuf_iterator<char>());
  if (in.bad())
    throwError(ErrorKind::Io, "read failed for " + path.string());
  return data;
}

/// Runs fn(i) for i in [0, count) on up to @p threads threads and rethrows
/// the first failure once all have stopped.
template <typename Fn> void parallelFor(size_t count, size_t threads, Fn fn) {
  threads = std::max<size_t>(1, std::min(threads, count));
  if (threads == 1) {
    for (size_t i = 0; i < count; ++i)
      fn(i);
    return;
  }
  std::atomic<size_t> next{0};
  std::atomic<bool> failed{false};
  std::exception_ptr error;
  std::mutex errorMutex;
  std::vector<std::thread> workers;
  for (size_t t = 0; t < threads; ++t) {
    workers.emplace_back([&] {
      while (!failed) {
        size_t i = next++;
        if (i >= count)
          return;
        try {
          fn(i);
        } catch (...) {
          std::lock_guard<std::mutex> lock(errorMutex);
          if (!error)
            error = std::current_exception();
          failed = true;
        }
      }
    });
  }
  for (auto &w : workers)
    w.join();
  if (error)
    std::rethrow_exception(error);
}

} // namespace

std::string userAgent() { return std::string("arloader/") + ARLOADER_VERSION; }

Uploader::Uploader(NetworkClient &network, const Signer &signer,
                   PaymentChain *payment, CoSigner *coSigner)
    : network_(network), signer_(signer), payment_(payment),
      coSigner_(coSigner) {}

PriceTerms Uploader::priceTerms(double multiplier) {
  uint64_t one = network_.getPrice(BLOCK_SIZE);
  uint64_t two = network_.getPrice(2 * BLOCK_SIZE);
  return PriceTerms::fromQuotes(one, two, multiplier);
}

Transaction Uploader::createTransaction(Bytes data,
                                        const std::vector<Tag> &otherTags,
                                        std::optional<Bytes> lastTx,
                                        const PriceTerms &terms,
                                        bool autoContentTag,
                                        size_t hashThreads) {
  Transaction tx;
  tx.format = 2;
  tx.tags.push_back(Tag::fromUtf8("User-Agent", userAgent()));
  if (autoContentTag)
    tx.tags.push_back(Tag::fromUtf8("Content-Type", sniffContentType(data)));
  tx.tags.insert(tx.tags.end(), otherTags.begin(), otherTags.end());
  validateTags(tx.tags);

  tx.lastTx = lastTx ? std::move(*lastTx) : network_.getTxAnchor();
  tx.owner = signer_.publicModulus();
  tx.data = std::move(data);
  tx.computeDataRoot(hashThreads);
  tx.reward = terms.rewardFor(tx.dataSize);
  return tx;
}

void Uploader::signTransaction(Transaction &tx) const { tx.sign(signer_); }

SigResponse Uploader::signTransactionWithSol(Transaction &tx) {
  if (!payment_ || !coSigner_)
    throwError(ErrorKind::CoSignerError, "no payment keypair configured");
  uint64_t lamports = lamportsFor(tx.reward);
  std::string payment = payment_->createPayment(lamports);
  SigResponse response = coSigner_->coSign(tx.toDeepHashItem(), payment);
  tx.signature = response.arTxSig;
  tx.id = response.arTxId;
  tx.owner = response.arTxOwner;
  return response;
}

void Uploader::postChunks(const Transaction &tx) {
  parallelFor(tx.chunks.size(), MAX_CHUNK_POSTERS,
              [&](size_t i) { network_.postChunk(tx.getChunk(i)); });
}

void Uploader::postTransaction(Transaction &tx, bool chunked) {
  if (!tx.isSigned())
    throwError(ErrorKind::UnsignedTransaction);
  if (!chunked) {
    network_.postTransaction(tx, true);
    return;
  }
  network_.postTransaction(tx, false);
  postChunks(tx);
  Logger::getInstance().log(LogLevel::DEBUG,
                            "posted " + std::to_string(tx.chunks.size()) +
                                " chunks for " + b64_encode(tx.id));
  tx.releaseData();
}

Status Uploader::uploadFile(const fs::path &path, const UploadOptions &options) {
  std::vector<Tag> tags = options.tags;
  bool autoContentTag = true;
  std::string contentType = OCTET_STREAM;
  if (auto mime = mimeFromPath(path)) {
    contentType = *mime;
    autoContentTag = false;
    tags.push_back(Tag::fromUtf8("Content-Type", *mime));
  }

  Bytes data = readFile(path);
  if (autoContentTag)
    contentType = sniffContentType(data);
  bool chunked = data.size() > CHUNKED_POST_THRESHOLD;

  Transaction tx = createTransaction(std::move(data), tags, std::nullopt,
                                     options.priceTerms, autoContentTag,
                                     options.hashThreads);
  std::optional<SigResponse> sig;
  if (options.withSol)
    sig = signTransactionWithSol(tx);
  else
    signTransaction(tx);
  postTransaction(tx, chunked);

  Status status;
  status.id = tx.id;
  status.reward = tx.reward;
  status.filePath = path;
  status.contentType = contentType;
  status.solSig = std::move(sig);
  if (options.logDir)
    StatusStore(*options.logDir).writeStatus(status);

  Logger::getInstance().log(LogLevel::INFO, "uploaded " + path.string() +
                                                " as " + b64_encode(status.id));
  return status;
}

DataItem Uploader::createDataItem(Bytes data, std::vector<Tag> tags,
                                  bool autoContentTag) const {
  tags.push_back(Tag::fromUtf8("User-Agent", userAgent()));
  if (autoContentTag)
    tags.push_back(Tag::fromUtf8("Content-Type", sniffContentType(data)));
  validateTags(tags);

  DataItem item;
  item.tags = std::move(tags);
  item.data = std::move(data);
  item.sign(signer_);
  return item;
}

std::pair<DataItem, Status>
Uploader::createDataItemFromFile(const fs::path &path,
                                 const std::vector<Tag> &tags) const {
  std::vector<Tag> itemTags = tags;
  bool autoContentTag = true;
  std::string contentType = OCTET_STREAM;
  if (auto mime = mimeFromPath(path)) {
    contentType = *mime;
    autoContentTag = false;
    itemTags.push_back(Tag::fromUtf8("Content-Type", *mime));
  }

  DataItem item = createDataItem(readFile(path), std::move(itemTags),
                                 autoContentTag);
  Status status;
  status.id = item.id;
  status.filePath = path;
  status.contentType = contentType;
  return {std::move(item), std::move(status)};
}

BundleStatus Uploader::postBundle(const PathsChunk &chunk,
                                  const UploadOptions &options) {
  std::vector<DataItem> items(chunk.paths.size());
  parallelFor(chunk.paths.size(), options.hashThreads, [&](size_t i) {
    items[i] = createDataItemFromFile(chunk.paths[i], options.tags).first;
  });

  BundleStatus status;
  for (size_t i = 0; i < items.size(); ++i)
    status.filePaths[chunk.paths[i].string()] = items[i].id;

  Bytes bundle = createBundle(items);
  items.clear();

  std::vector<Tag> bundleTags{Tag::fromUtf8("Bundle-Format", "binary"),
                              Tag::fromUtf8("Bundle-Version", "2.0.0")};
  Transaction tx =
      createTransaction(std::move(bundle), bundleTags, std::nullopt,
                        options.priceTerms, true, options.hashThreads);
  if (options.withSol)
    status.solSig = signTransactionWithSol(tx);
  else
    signTransaction(tx);
  postTransaction(tx, chunk.dataSize > CHUNKED_POST_THRESHOLD);

  status.id = tx.id;
  status.reward = tx.reward;
  status.numberOfFiles = chunk.paths.size();
  status.dataSize = chunk.dataSize;
  if (options.logDir)
    StatusStore(*options.logDir).writeBundleStatus(status);

  Logger::getInstance().log(LogLevel::INFO,
                            "uploaded bundle " + b64_encode(status.id) +
                                " with " +
                                std::to_string(status.numberOfFiles) + " files");
  return status;
}

Status Uploader::getStatus(const Bytes &id) {
  NetworkStatus network = network_.getStatus(id);
  Status status;
  status.id = id;
  status.status = network.code;
  status.rawStatus = network.raw;
  return status;
}

Status Uploader::updateStatus(const fs::path &path, const StatusStore &store) {
  Status status = store.readStatus(path);
  NetworkStatus network = network_.getStatus(status.id);
  status.lastModified = std::chrono::system_clock::now();
  status.status = network.code;
  status.rawStatus = network.raw;
  store.writeStatus(status);
  return status;
}

BundleStatus Uploader::updateBundleStatus(const fs::path &statusFile,
                                          const StatusStore &store) {
  BundleStatus status = store.readBundleStatus(statusFile);
  NetworkStatus network = network_.getStatus(status.id);
  status.lastModified = std::chrono::system_clock::now();
  status.status = network.code;
  status.rawStatus = network.raw;
  store.writeBundleStatus(status);
  return status;
}

std::pair<Bytes, size_t> Uploader::uploadManifest(const std::string &logDir,
                                                  const PriceTerms &terms,
                                                  const std::string &gatewayUrl) {
  if (logDir.empty() || logDir.back() != '/')
    throwError(ErrorKind::MissingTrailingSlash, logDir);

  StatusStore store(logDir);
  auto files = store.bundleStatusPaths();
  if (files.empty())
    throwError(ErrorKind::NoBundleStatusesFound, logDir);

  std::vector<BundleStatus> statuses;
  statuses.reserve(files.size());
  for (const auto &file : files)
    statuses.push_back(store.readBundleStatus(file));

  nlohmann::json manifest = createManifestFromBundleStatuses(statuses);
  std::string body = manifest.dump();
  bool chunked = body.size() > CHUNKED_POST_THRESHOLD;
  Transaction tx = createTransaction(
      to_bytes(body), {Tag::fromUtf8("Content-Type", MANIFEST_CONTENT_TYPE)},
      std::nullopt, terms, false);
  signTransaction(tx);
  postTransaction(tx, chunked);

  std::string id = b64_encode(tx.id);
  store.writeManifestLog(id, manifestLog(manifest, id, gatewayUrl));
  Logger::getInstance().log(LogLevel::INFO, "uploaded manifest " + id);
  return {tx.id, manifestPathCount(manifest)};
}

std::unique_ptr<ResultStream<fs::path, Status>>
Uploader::uploadFilesStream(std::vector<fs::path> paths, UploadOptions options) {
  size_t buffer = options.buffer;
  return std::make_unique<ResultStream<fs::path, Status>>(
      std::move(paths),
      [this, options = std::move(options)](const fs::path &path) {
        return uploadFile(path, options);
      },
      buffer);
}

std::unique_ptr<ResultStream<PathsChunk, BundleStatus>>
Uploader::uploadBundlesStream(std::vector<PathsChunk> chunks,
                              UploadOptions options) {
  size_t buffer = options.buffer;
  return std::make_unique<ResultStream<PathsChunk, BundleStatus>>(
      std::move(chunks),
      [this, options = std::move(options)](const PathsChunk &chunk) {
        return postBundle(chunk, options);
      },
      buffer);
}

std::unique_ptr<ResultStream<fs::path, Status>>
Uploader::updateStatusesStream(std::vector<fs::path> paths, fs::path logDir,
                               size_t buffer) {
  return std::make_unique<ResultStream<fs::path, Status>>(
      std::move(paths),
      [this, store = StatusStore(std::move(logDir))](const fs::path &path) {
        return updateStatus(path, store);
      },
      buffer);
}

std::unique_ptr<ResultStream<fs::path, BundleStatus>>
Uploader::updateBundleStatusesStream(std::vector<fs::path> statusFiles,
                                     fs::path logDir, size_t buffer) {
  return std::make_unique<ResultStream<fs::path, BundleStatus>>(
      std::move(statusFiles),
      [this, store = StatusStore(std::move(logDir))](const fs::path &file) {
        return updateBundleStatus(file, store);
      },
      buffer);
}

} // namespace arloader
