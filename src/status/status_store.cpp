#include "status/status_store.hpp"
#include "utilities/encoding.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <iomanip>
#include <map>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace arloader {

namespace {

std::atomic<uint64_t> g_tempCounter{0};

} // namespace

StatusStore::StatusStore(fs::path logDir) : logDir_(std::move(logDir)) {}

std::string StatusStore::statusFileStem(const fs::path &filePath) {
  return blake3_hex(as_bytes(filePath.string()));
}

bool StatusStore::fileStemIsValidTxid(const fs::path &path) {
  try {
    return b64_decode(path.stem().string()).size() == SHA256_SIZE;
  } catch (const Error &) {
    return false;
  }
}

void StatusStore::writeJson(const fs::path &target,
                            const nlohmann::json &value) const {
  std::error_code ec;
  fs::create_directories(logDir_, ec);
  if (ec)
    throwError(ErrorKind::Io, "cannot create " + logDir_.string() + ": " +
                                  ec.message());

  // Paths are not guaranteed to be UTF-8; store them lossily.
  const std::string text =
      value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

  fs::path temp = target;
  temp += ".tmp." + std::to_string(::getpid()) + "." +
          std::to_string(g_tempCounter.fetch_add(1));
  {
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out)
      throwError(ErrorKind::Io, "cannot open " + temp.string());
    out << text;
    out.flush();
    if (!out) {
      fs::remove(temp, ec);
      throwError(ErrorKind::Io, "write failed for " + temp.string());
    }
  }
  fs::rename(temp, target, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(temp, ignored);
    throwError(ErrorKind::Io, "cannot rename to " + target.string() + ": " +
                                  ec.message());
  }
  Logger::getInstance().log(LogLevel::DEBUG, "wrote " + target.string());
}

nlohmann::json StatusStore::readJson(const fs::path &source) const {
  std::ifstream in(source, std::ios::binary);
  if (!in)
    throwError(ErrorKind::Io, "cannot open " + source.string());
  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::exception &e) {
    throwError(ErrorKind::Json, source.string() + ": " + e.what());
  }
}

void StatusStore::writeStatus(const Status &status) const {
  if (status.id.empty())
    throwError(ErrorKind::UnsignedTransaction, "status has no transaction id");
  std::string stem = status.filePath ? statusFileStem(*status.filePath)
                                     : "txid_" + b64_encode(status.id);
  writeJson(logDir_ / (stem + ".json"), status);
}

Status StatusStore::readStatus(const fs::path &filePath) const {
  fs::path source = logDir_ / (statusFileStem(filePath) + ".json");
  if (!fs::exists(source))
    throwError(ErrorKind::StatusNotFound, filePath.string());
  try {
    return readJson(source).get<Status>();
  } catch (const nlohmann::json::exception &e) {
    throwError(ErrorKind::Json, source.string() + ": " + e.what());
  }
}

std::vector<Status>
StatusStore::readStatuses(const std::vector<fs::path> &filePaths) const {
  std::vector<Status> statuses;
  statuses.reserve(filePaths.size());
  for (const auto &path : filePaths)
    statuses.push_back(readStatus(path));
  return statuses;
}

std::vector<Status>
StatusStore::filterStatuses(const std::vector<fs::path> &filePaths,
                            const std::vector<StatusCode> &codes,
                            std::optional<uint64_t> maxConfirms) const {
  std::vector<Status> all = readStatuses(filePaths);
  std::vector<Status> kept;
  for (auto &status : all) {
    if (!codes.empty() &&
        std::find(codes.begin(), codes.end(), status.status) == codes.end())
      continue;
    if (maxConfirms && status.confirmations() > *maxConfirms)
      continue;
    kept.push_back(std::move(status));
  }
  return kept;
}

std::string
StatusStore::statusSummary(const std::vector<fs::path> &filePaths) const {
  std::map<StatusCode, uint64_t> counts;
  for (const auto &status : readStatuses(filePaths))
    ++counts[status.status];

  std::ostringstream oss;
  oss << ' ' << std::left << std::setw(15) << "status" << "  " << std::right
      << std::setw(10) << "count" << '\n'
      << std::string(29, '-') << '\n';
  uint64_t total = 0;
  for (StatusCode code : {StatusCode::Submitted, StatusCode::Pending,
                          StatusCode::NotFound, StatusCode::Confirmed}) {
    uint64_t n = counts[code];
    oss << ' ' << std::left << std::setw(16) << statusCodeName(code) << ' '
        << std::right << std::setw(10) << n << '\n';
    total += n;
  }
  oss << std::string(29, '-') << '\n'
      << ' ' << std::left << std::setw(15) << "Total" << "  " << std::right
      << std::setw(10) << total << '\n';
  return oss.str();
}

void StatusStore::writeBundleStatus(const BundleStatus &status) const {
  if (status.id.empty())
    throwError(ErrorKind::UnsignedTransaction, "bundle status has no id");
  writeJson(logDir_ / (b64_encode(status.id) + ".json"), status);
}

BundleStatus StatusStore::readBundleStatus(const fs::path &statusFile) const {
  if (!fs::exists(statusFile))
    throwError(ErrorKind::StatusNotFound, statusFile.string());
  try {
    return readJson(statusFile).get<BundleStatus>();
  } catch (const nlohmann::json::exception &e) {
    throwError(ErrorKind::Json, statusFile.string() + ": " + e.what());
  }
}

std::vector<fs::path> StatusStore::bundleStatusPaths() const {
  std::vector<fs::path> paths;
  std::error_code ec;
  if (!fs::is_directory(logDir_, ec))
    return paths;
  for (const auto &entry : fs::directory_iterator(logDir_, ec)) {
    const fs::path &p = entry.path();
    if (entry.is_regular_file() && p.extension() == ".json" &&
        fileStemIsValidTxid(p))
      paths.push_back(p);
  }
  if (ec)
    throwError(ErrorKind::Io, "cannot list " + logDir_.string() + ": " +
                                  ec.message());
  std::sort(paths.begin(), paths.end());
  return paths;
}

void StatusStore::writeManifestLog(const std::string &manifestTxId,
                                   const nlohmann::json &log) const {
  writeJson(logDir_ / ("manifest_" + manifestTxId + ".json"), log);
}

nlohmann::json
StatusStore::readManifestLog(const std::string &manifestTxId) const {
  fs::path source = logDir_ / ("manifest_" + manifestTxId + ".json");
  if (!fs::exists(source))
    throwError(ErrorKind::ManifestNotFound, source.string());
  return readJson(source);
}

} // namespace arloader
