#include "status/status.hpp"
#include "utilities/encoding.hpp"
#include "utilities/errors.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace arloader {

namespace {

std::tm toUtc(Timestamp ts) {
  std::time_t t = std::chrono::system_clock::to_time_t(ts);
  std::tm tm{};
  gmtime_r(&t, &tm);
  return tm;
}

std::string dashes(size_t n) { return std::string(n, '-'); }

void writeRaw(nlohmann::json &j, const std::optional<RawStatus> &raw) {
  if (raw) {
    nlohmann::json flat = *raw;
    j.update(flat);
  }
}

void writeSig(nlohmann::json &j, const std::optional<SigResponse> &sig) {
  if (sig) {
    nlohmann::json flat = *sig;
    j.update(flat);
  }
}

std::optional<RawStatus> readRaw(const nlohmann::json &j) {
  if (!j.contains("block_height"))
    return std::nullopt;
  return j.get<RawStatus>();
}

std::optional<SigResponse> readSig(const nlohmann::json &j) {
  if (!j.contains("ar_tx_sig"))
    return std::nullopt;
  return j.get<SigResponse>();
}

void verboseRaw(std::ostringstream &oss, const std::optional<RawStatus> &raw) {
  if (!raw)
    return;
  oss << std::left << std::setw(15) << "height:" << ' ' << raw->blockHeight
      << '\n';
  oss << std::left << std::setw(15) << "indep_hash:" << ' '
      << b64_encode(raw->blockIndepHash) << '\n';
  oss << std::left << std::setw(15) << "confirms:" << ' '
      << raw->numberOfConfirmations << '\n';
}

template <typename T> std::string asJson(const T &status, bool pretty) {
  nlohmann::json j = status;
  return (pretty ? j.dump(2) : j.dump()) + ",\n";
}

} // namespace

std::string formatTimestamp(Timestamp ts) {
  std::tm tm = toUtc(ts);
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                    ts.time_since_epoch())
                    .count() %
                1000000;
  if (micros < 0)
    micros += 1000000;
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
      << std::setw(6) << micros << 'Z';
  return oss.str();
}

std::string formatTimestampShort(Timestamp ts) {
  std::tm tm = toUtc(ts);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

Timestamp parseTimestamp(const std::string &text) {
  std::tm tm{};
  int consumed = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &tm.tm_year,
                  &tm.tm_mon, &tm.tm_mday, &tm.tm_hour, &tm.tm_min, &tm.tm_sec,
                  &consumed) != 6) {
    throwError(ErrorKind::FormatError, "bad timestamp \"" + text + "\"");
  }
  tm.tm_year -= 1900;
  tm.tm_mon -= 1;

  size_t pos = static_cast<size_t>(consumed);
  long long micros = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (digits < 6) {
        micros = micros * 10 + (text[pos] - '0');
        ++digits;
      }
      ++pos;
    }
    for (; digits < 6; ++digits)
      micros *= 10;
  }
  std::string zone = text.substr(pos);
  if (zone != "Z" && zone != "+00:00" && !zone.empty())
    throwError(ErrorKind::FormatError, "timestamp not in UTC: \"" + text + "\"");

  std::time_t t = timegm(&tm);
  return std::chrono::system_clock::from_time_t(t) +
         std::chrono::microseconds(micros);
}

std::string statusCodeName(StatusCode code) {
  switch (code) {
  case StatusCode::Submitted:
    return "Submitted";
  case StatusCode::Pending:
    return "Pending";
  case StatusCode::Confirmed:
    return "Confirmed";
  case StatusCode::NotFound:
    return "NotFound";
  }
  return "Submitted";
}

StatusCode statusCodeFromName(const std::string &name) {
  if (name == "Submitted")
    return StatusCode::Submitted;
  if (name == "Pending")
    return StatusCode::Pending;
  if (name == "Confirmed")
    return StatusCode::Confirmed;
  if (name == "NotFound")
    return StatusCode::NotFound;
  throwError(ErrorKind::FormatError, "unknown status \"" + name + "\"");
}

void to_json(nlohmann::json &j, const RawStatus &raw) {
  j = nlohmann::json{{"block_height", raw.blockHeight},
                     {"block_indep_hash", b64_encode(raw.blockIndepHash)},
                     {"number_of_confirmations", raw.numberOfConfirmations}};
}

void from_json(const nlohmann::json &j, RawStatus &raw) {
  raw.blockHeight = j.at("block_height").get<uint64_t>();
  raw.blockIndepHash = b64_decode(j.at("block_indep_hash").get<std::string>());
  raw.numberOfConfirmations = j.at("number_of_confirmations").get<uint64_t>();
}

void to_json(nlohmann::json &j, const Status &status) {
  j = nlohmann::json{
      {"id", b64_encode(status.id)},
      {"status", statusCodeName(status.status)},
      {"file_path", status.filePath ? nlohmann::json(status.filePath->string())
                                    : nlohmann::json(nullptr)},
      {"content_type", status.contentType},
      {"created_at", formatTimestamp(status.createdAt)},
      {"last_modified", formatTimestamp(status.lastModified)},
      {"reward", status.reward}};
  writeRaw(j, status.rawStatus);
  writeSig(j, status.solSig);
}

void from_json(const nlohmann::json &j, Status &status) {
  status.id = b64_decode(j.at("id").get<std::string>());
  status.status = statusCodeFromName(j.at("status").get<std::string>());
  if (j.contains("file_path") && !j.at("file_path").is_null())
    status.filePath = std::filesystem::path(j.at("file_path").get<std::string>());
  else
    status.filePath.reset();
  status.contentType = j.value("content_type", std::string(OCTET_STREAM));
  status.createdAt = parseTimestamp(j.at("created_at").get<std::string>());
  status.lastModified = parseTimestamp(j.at("last_modified").get<std::string>());
  status.reward = j.value("reward", uint64_t{0});
  status.rawStatus = readRaw(j);
  status.solSig = readSig(j);
}

void to_json(nlohmann::json &j, const BundleStatus &status) {
  nlohmann::json paths = nlohmann::json::object();
  for (const auto &[path, id] : status.filePaths)
    paths[path] = nlohmann::json{{"id", b64_encode(id)}};
  j = nlohmann::json{{"id", b64_encode(status.id)},
                     {"status", statusCodeName(status.status)},
                     {"file_paths", paths},
                     {"number_of_files", status.numberOfFiles},
                     {"data_size", status.dataSize},
                     {"created_at", formatTimestamp(status.createdAt)},
                     {"last_modified", formatTimestamp(status.lastModified)},
                     {"reward", status.reward}};
  writeRaw(j, status.rawStatus);
  writeSig(j, status.solSig);
}

void from_json(const nlohmann::json &j, BundleStatus &status) {
  status.id = b64_decode(j.at("id").get<std::string>());
  status.status = statusCodeFromName(j.at("status").get<std::string>());
  status.filePaths.clear();
  for (const auto &[path, entry] : j.at("file_paths").items())
    status.filePaths[path] = b64_decode(entry.at("id").get<std::string>());
  status.numberOfFiles = j.at("number_of_files").get<uint64_t>();
  status.dataSize = j.at("data_size").get<uint64_t>();
  status.createdAt = parseTimestamp(j.at("created_at").get<std::string>());
  status.lastModified = parseTimestamp(j.at("last_modified").get<std::string>());
  status.reward = j.value("reward", uint64_t{0});
  status.rawStatus = readRaw(j);
  status.solSig = readSig(j);
}

OutputFormat outputFormatFromName(const std::string &name) {
  if (name == "quiet")
    return OutputFormat::Quiet;
  if (name == "verbose")
    return OutputFormat::Verbose;
  if (name == "json")
    return OutputFormat::Json;
  if (name == "json_compact" || name == "json-compact")
    return OutputFormat::JsonCompact;
  return OutputFormat::Display;
}

std::string statusHeader(OutputFormat format) {
  if (format != OutputFormat::Display)
    return "";
  std::ostringstream oss;
  oss << ' ' << std::left << std::setw(30) << "path" << "  " << std::setw(43)
      << "id" << "  " << std::setw(9) << "status" << "  " << "confirms" << '\n'
      << dashes(97);
  return oss.str();
}

std::string bundleStatusHeader(OutputFormat format) {
  if (format != OutputFormat::Display)
    return "";
  std::ostringstream oss;
  oss << ' ' << std::left << std::setw(43) << "bundle txid" << "  "
      << std::right << std::setw(6) << "items" << "  " << std::setw(6) << "KB"
      << "  " << std::left << std::setw(11) << "status" << "  " << "confirms"
      << '\n'
      << dashes(84);
  return oss.str();
}

std::string formatStatus(const Status &status, OutputFormat format) {
  std::ostringstream oss;
  switch (format) {
  case OutputFormat::Quiet:
    return "";
  case OutputFormat::Json:
    return asJson(status, true);
  case OutputFormat::JsonCompact:
    return asJson(status, false);
  case OutputFormat::Verbose:
    oss << std::left << std::setw(15) << "id:" << ' ' << b64_encode(status.id)
        << '\n';
    oss << std::left << std::setw(15) << "status:" << ' '
        << statusCodeName(status.status) << '\n';
    if (status.filePath)
      oss << std::left << std::setw(15) << "file_path:" << ' '
          << status.filePath->string() << '\n';
    oss << std::left << std::setw(15) << "created_at:" << ' '
        << formatTimestampShort(status.createdAt) << '\n';
    oss << std::left << std::setw(15) << "last_modified:" << ' '
        << formatTimestampShort(status.lastModified) << '\n';
    verboseRaw(oss, status.rawStatus);
    oss << '\n';
    return oss.str();
  case OutputFormat::Display:
    break;
  }
  oss << ' ' << std::left << std::setw(30)
      << (status.filePath ? status.filePath->string() : std::string()) << "  "
      << std::setw(43) << b64_encode(status.id) << "  " << std::setw(9)
      << statusCodeName(status.status) << "  " << std::right << std::setw(8)
      << status.confirmations() << '\n';
  return oss.str();
}

std::string formatBundleStatus(const BundleStatus &status, OutputFormat format) {
  std::ostringstream oss;
  switch (format) {
  case OutputFormat::Quiet:
    return "";
  case OutputFormat::Json:
    return asJson(status, true);
  case OutputFormat::JsonCompact:
    return asJson(status, false);
  case OutputFormat::Verbose:
    oss << std::left << std::setw(15) << "id:" << ' ' << b64_encode(status.id)
        << '\n';
    oss << std::left << std::setw(15) << "status:" << ' '
        << statusCodeName(status.status) << '\n';
    oss << std::left << std::setw(15) << "created_at:" << ' '
        << formatTimestampShort(status.createdAt) << '\n';
    oss << std::left << std::setw(15) << "last_modified:" << ' '
        << formatTimestampShort(status.lastModified) << '\n';
    verboseRaw(oss, status.rawStatus);
    oss << '\n';
    return oss.str();
  case OutputFormat::Display:
    break;
  }
  oss << ' ' << std::left << std::setw(43) << b64_encode(status.id) << "  "
      << std::right << std::setw(6) << status.numberOfFiles << "  "
      << std::setw(6) << status.dataSize / 1000 << "  " << std::left
      << std::setw(11) << statusCodeName(status.status) << ' ' << std::right
      << std::setw(9) << status.confirmations() << '\n';
  return oss.str();
}

} // namespace arloader
