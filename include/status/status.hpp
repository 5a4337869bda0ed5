#ifndef ARLOADER_STATUS_HPP
#define ARLOADER_STATUS_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "payment/co_signer.hpp"
#include "utilities/content_type.hpp"
#include "utilities/digest.hpp"

namespace arloader {

using Timestamp = std::chrono::system_clock::time_point;

/// RFC 3339 UTC with microseconds, e.g. 2022-01-05T10:11:12.000123Z.
std::string formatTimestamp(Timestamp ts);
/// Accepts RFC 3339 with optional fraction and a Z or +00:00 suffix.
Timestamp parseTimestamp(const std::string &text);
/// "%Y-%m-%d %H:%M:%S" in UTC for verbose output.
std::string formatTimestampShort(Timestamp ts);

enum class StatusCode { Submitted, Pending, Confirmed, NotFound };

std::string statusCodeName(StatusCode code);
/// @throws Error(FormatError) on an unknown name.
StatusCode statusCodeFromName(const std::string &name);

/// Confirmation details reported by GET /tx/{id}/status.
struct RawStatus {
  uint64_t blockHeight{0};
  Bytes blockIndepHash;
  uint64_t numberOfConfirmations{0};

  bool operator==(const RawStatus &other) const = default;
};

void to_json(nlohmann::json &j, const RawStatus &raw);
void from_json(const nlohmann::json &j, RawStatus &raw);

/// Journal record of one per-file upload.
struct Status {
  Bytes id;
  StatusCode status{StatusCode::Submitted};
  std::optional<std::filesystem::path> filePath;
  std::string contentType{OCTET_STREAM};
  Timestamp createdAt{std::chrono::system_clock::now()};
  Timestamp lastModified{createdAt};
  uint64_t reward{0};
  std::optional<RawStatus> rawStatus;
  std::optional<SigResponse> solSig;

  uint64_t confirmations() const {
    return rawStatus ? rawStatus->numberOfConfirmations : 0;
  }
};

/// Journal record of one bundle transaction.
struct BundleStatus {
  Bytes id;
  StatusCode status{StatusCode::Submitted};
  /// relative path -> data item id
  std::map<std::string, Bytes> filePaths;
  uint64_t numberOfFiles{0};
  uint64_t dataSize{0};
  Timestamp createdAt{std::chrono::system_clock::now()};
  Timestamp lastModified{createdAt};
  uint64_t reward{0};
  std::optional<RawStatus> rawStatus;
  std::optional<SigResponse> solSig;

  uint64_t confirmations() const {
    return rawStatus ? rawStatus->numberOfConfirmations : 0;
  }
};

void to_json(nlohmann::json &j, const Status &status);
void from_json(const nlohmann::json &j, Status &status);
void to_json(nlohmann::json &j, const BundleStatus &status);
void from_json(const nlohmann::json &j, BundleStatus &status);

enum class OutputFormat { Display, Quiet, Verbose, Json, JsonCompact };

/// quiet, verbose, json, json_compact / json-compact; anything else is Display.
OutputFormat outputFormatFromName(const std::string &name);

/// Column header for multi-record output; empty except for Display.
std::string statusHeader(OutputFormat format);
std::string bundleStatusHeader(OutputFormat format);

std::string formatStatus(const Status &status, OutputFormat format);
std::string formatBundleStatus(const BundleStatus &status, OutputFormat format);

} // namespace arloader

#endif // ARLOADER_STATUS_HPP
