#ifndef ARLOADER_STATUS_STORE_HPP
#define ARLOADER_STATUS_STORE_HPP

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "status/status.hpp"

namespace arloader {

/**
 * @brief Directory of JSON status records.
 *
 * File uploads are keyed by BLAKE3(file path), bundles by their txid and
 * manifest logs by manifest_<txid>. Every write goes to a temporary file
 * that is renamed into place, so readers never see a partial record and
 * concurrent writers of the same key resolve last-writer-wins.
 */
class StatusStore {
public:
  explicit StatusStore(std::filesystem::path logDir);

  const std::filesystem::path &logDir() const { return logDir_; }

  /// Lower-case hex BLAKE3 of the path's UTF-8 text.
  static std::string statusFileStem(const std::filesystem::path &filePath);

  /// True if @p path's stem base64url-decodes to 32 bytes.
  static bool fileStemIsValidTxid(const std::filesystem::path &path);

  /**
   * @brief Persists @p status under its path-hash key, or txid_<id> when it
   * has no file path.
   * @throws Error(UnsignedTransaction) when the status has no id.
   */
  void writeStatus(const Status &status) const;

  /**
   * @brief Reads the record for @p filePath.
   * @throws Error(StatusNotFound) when none was written.
   */
  Status readStatus(const std::filesystem::path &filePath) const;

  std::vector<Status>
  readStatuses(const std::vector<std::filesystem::path> &filePaths) const;

  /**
   * @brief Reads the statuses of @p filePaths and keeps those whose code is
   * in @p codes (all when empty) and whose confirmations do not exceed
   * @p maxConfirms. A status without raw details counts as 0 confirmations.
   */
  std::vector<Status>
  filterStatuses(const std::vector<std::filesystem::path> &filePaths,
                 const std::vector<StatusCode> &codes,
                 std::optional<uint64_t> maxConfirms) const;

  /// Count table ordered Submitted, Pending, NotFound, Confirmed, Total.
  std::string
  statusSummary(const std::vector<std::filesystem::path> &filePaths) const;

  /// Persists @p status as <txid>.json.
  void writeBundleStatus(const BundleStatus &status) const;

  /// @throws Error(StatusNotFound) if @p statusFile does not exist.
  BundleStatus readBundleStatus(const std::filesystem::path &statusFile) const;

  /// Every <txid>.json in the directory, sorted by name.
  std::vector<std::filesystem::path> bundleStatusPaths() const;

  /// Writes manifest_<txid>.json.
  void writeManifestLog(const std::string &manifestTxId,
                        const nlohmann::json &log) const;

  /// @throws Error(ManifestNotFound)
  nlohmann::json readManifestLog(const std::string &manifestTxId) const;

private:
  void writeJson(const std::filesystem::path &target,
                 const nlohmann::json &value) const;
  nlohmann::json readJson(const std::filesystem::path &source) const;

  std::filesystem::path logDir_;
};

} // namespace arloader

#endif // ARLOADER_STATUS_STORE_HPP
