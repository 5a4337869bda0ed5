#ifndef ARLOADER_UPLOADER_HPP
#define ARLOADER_UPLOADER_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "bundle/data_item.hpp"
#include "crypto/signer.hpp"
#include "network/network_client.hpp"
#include "payment/co_signer.hpp"
#include "payment/solana.hpp"
#include "status/status.hpp"
#include "status/status_store.hpp"
#include "transaction/pricing.hpp"
#include "transaction/transaction.hpp"
#include "upload/path_chunker.hpp"
#include "upload/status_stream.hpp"

namespace arloader {

/// Payloads above this size are posted as a header followed by chunks.
inline constexpr uint64_t CHUNKED_POST_THRESHOLD = 10000000;

/// User-Agent header and tag value, "arloader/<version>".
std::string userAgent();

/// Options shared by every item of one upload command.
struct UploadOptions {
  std::vector<Tag> tags;
  std::optional<std::filesystem::path> logDir;
  PriceTerms priceTerms;
  size_t buffer{5};
  /// Pay through the co-signer instead of signing with the local wallet.
  bool withSol{false};
  /// Threads used for leaf hashing of one payload.
  size_t hashThreads{1};
};

/**
 * @brief Builds, signs and posts transactions and bundles, and keeps the
 * status journal.
 *
 * The network client and signer are shared by all workers of a stream and
 * must outlive the uploader and any stream it returns.
 */
class Uploader {
public:
  Uploader(NetworkClient &network, const Signer &signer,
           PaymentChain *payment = nullptr, CoSigner *coSigner = nullptr);

  /// Quotes one and two blocks and scales them by @p multiplier.
  PriceTerms priceTerms(double multiplier);

  /**
   * @brief Assembles an unsigned format-2 transaction over @p data.
   *
   * Tags are User-Agent, then a sniffed Content-Type when
   * @p autoContentTag is set, then @p otherTags. The anchor is fetched
   * when @p lastTx is not given.
   */
  Transaction createTransaction(Bytes data, const std::vector<Tag> &otherTags,
                                std::optional<Bytes> lastTx,
                                const PriceTerms &terms, bool autoContentTag,
                                size_t hashThreads = 1);

  void signTransaction(Transaction &tx) const;

  /**
   * @brief Pays on the secondary chain and lets the co-signer sign.
   * @throws Error(CoSignerError) when no payment chain or co-signer is set.
   */
  SigResponse signTransactionWithSol(Transaction &tx);

  /**
   * @brief Posts a signed transaction, inline or as header plus chunks.
   *
   * In chunked mode the header goes first, then every chunk concurrently;
   * the payload is released afterwards.
   * @throws Error(UnsignedTransaction), Error(Post)
   */
  void postTransaction(Transaction &tx, bool chunked);

  /// Reads, signs and posts one file and journals its status.
  Status uploadFile(const std::filesystem::path &path,
                    const UploadOptions &options);

  /// Signed data item for a file plus a status describing it.
  std::pair<DataItem, Status>
  createDataItemFromFile(const std::filesystem::path &path,
                         const std::vector<Tag> &tags) const;

  /// Signed data item; appends User-Agent and a sniffed Content-Type.
  DataItem createDataItem(Bytes data, std::vector<Tag> tags,
                          bool autoContentTag) const;

  /// Packs, signs and posts one bundle and journals its status.
  BundleStatus postBundle(const PathsChunk &chunk, const UploadOptions &options);

  /// Current network status of @p id as a Status record.
  Status getStatus(const Bytes &id);

  /// Refreshes the journal entry of @p path from the network.
  Status updateStatus(const std::filesystem::path &path,
                      const StatusStore &store);

  /// Refreshes a bundle journal file in place.
  BundleStatus updateBundleStatus(const std::filesystem::path &statusFile,
                                  const StatusStore &store);

  /**
   * @brief Uploads a path manifest covering every bundle status in
   * @p logDir and writes manifest_<txid>.json.
   * @return The manifest transaction id and the number of paths.
   * @throws Error(MissingTrailingSlash), Error(NoBundleStatusesFound)
   */
  std::pair<Bytes, size_t> uploadManifest(const std::string &logDir,
                                          const PriceTerms &terms,
                                          const std::string &gatewayUrl);

  std::unique_ptr<ResultStream<std::filesystem::path, Status>>
  uploadFilesStream(std::vector<std::filesystem::path> paths,
                    UploadOptions options);

  std::unique_ptr<ResultStream<PathsChunk, BundleStatus>>
  uploadBundlesStream(std::vector<PathsChunk> chunks, UploadOptions options);

  std::unique_ptr<ResultStream<std::filesystem::path, Status>>
  updateStatusesStream(std::vector<std::filesystem::path> paths,
                       std::filesystem::path logDir, size_t buffer);

  std::unique_ptr<ResultStream<std::filesystem::path, BundleStatus>>
  updateBundleStatusesStream(std::vector<std::filesystem::path> statusFiles,
                             std::filesystem::path logDir, size_t buffer);

private:
  void postChunks(const Transaction &tx);

  NetworkClient &network_;
  const Signer &signer_;
  PaymentChain *payment_;
  CoSigner *coSigner_;
};

} // namespace arloader

#endif // ARLOADER_UPLOADER_HPP
