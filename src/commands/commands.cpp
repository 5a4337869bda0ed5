#include "commands/commands.hpp"
#include "status/status_store.hpp"
#include "transaction/pricing.hpp"
#include "upload/path_chunker.hpp"
#include "utilities/encoding.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <glob.h>

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace arloader {

namespace {

/// U+25A5, one per 50 pending transactions.
const char *const PENDING_BLOCK = "\xE2\x96\xA5";

std::optional<OraclePrices> tryOraclePrices(NetworkClient &network) {
  try {
    return network.getOraclePrices();
  } catch (const Error &e) {
    Logger::getInstance().log(LogLevel::WARN,
                              std::string("USD prices unavailable: ") + e.what());
    return std::nullopt;
  }
}

void printHeader(std::ostream &out, const std::string &header) {
  if (!header.empty())
    out << header << '\n';
}

/// Drops the leading path column from every line of a status table.
std::string withoutPathColumn(const std::string &text) {
  constexpr size_t PATH_COLUMN = 32;
  std::istringstream in(text);
  std::ostringstream out;
  std::string line;
  while (std::getline(in, line))
    out << (line.size() > PATH_COLUMN ? line.substr(PATH_COLUMN) : line) << '\n';
  return out.str();
}

/// Prints every record of @p stream, errors to @p err, and returns the count.
template <typename In, typename Out, typename Header, typename Format>
size_t drainStream(ResultStream<In, Out> &stream, Header header, Format format,
                   std::ostream &out, std::ostream &err) {
  size_t counter = 0;
  while (auto item = stream.next()) {
    if (!item->ok()) {
      Logger::getInstance().log(LogLevel::WARN, item->errorMessage());
      err << item->errorMessage() << '\n';
      continue;
    }
    if (counter == 0)
      header();
    out << format(item->get());
    ++counter;
  }
  return counter;
}

} // namespace

std::vector<fs::path> expandGlob(const std::string &pattern) {
  glob_t matches{};
  int rc = ::glob(pattern.c_str(), GLOB_TILDE, nullptr, &matches);
  if (rc == GLOB_NOMATCH) {
    globfree(&matches);
    return {};
  }
  if (rc != 0) {
    globfree(&matches);
    throwError(ErrorKind::GlobPattern, pattern);
  }
  std::vector<fs::path> paths;
  for (size_t i = 0; i < matches.gl_pathc; ++i) {
    fs::path p(matches.gl_pathv[i]);
    std::error_code ec;
    if (fs::is_regular_file(p, ec))
      paths.push_back(std::move(p));
  }
  globfree(&matches);
  return paths;
}

std::string addTrailingSlash(const std::string &value) {
  if (!value.empty() && value.back() == '/')
    return value;
  return value + "/";
}

std::vector<Tag> parseTagArgs(const std::vector<std::string> &args) {
  std::vector<Tag> tags;
  tags.reserve(args.size());
  for (const auto &arg : args)
    tags.push_back(parseTag(arg));
  validateTags(tags);
  return tags;
}

std::vector<StatusCode> parseStatusArgs(const std::vector<std::string> &args) {
  std::vector<StatusCode> codes;
  for (const auto &arg : args)
    codes.push_back(statusCodeFromName(arg));
  return codes;
}

void commandEstimate(NetworkClient &network, const std::string &pattern,
                     double rewardMultiplier, bool withSol, uint64_t bundleSize,
                     bool noBundle, std::ostream &out) {
  auto paths = expandGlob(pattern);
  if (paths.empty()) {
    out << "No files matched glob.\n";
    return;
  }

  PriceTerms terms = PriceTerms::fromQuotes(network.getPrice(BLOCK_SIZE),
                                            network.getPrice(2 * BLOCK_SIZE),
                                            rewardMultiplier);
  auto costOf = [&](uint64_t dataSize) {
    uint64_t reward = terms.rewardFor(dataSize);
    return withSol ? lamportsFor(reward) + SOL_TX_FEE : reward;
  };

  std::vector<PathsChunk> groups;
  if (noBundle) {
    for (const auto &path : paths) {
      std::error_code ec;
      uint64_t size = fs::file_size(path, ec);
      if (ec)
        throwError(ErrorKind::Io, path.string() + ": " + ec.message());
      groups.push_back(PathsChunk{{path}, size});
    }
  } else {
    groups = chunkFilePaths(paths, bundleSize);
  }

  uint64_t cost = 0;
  uint64_t bytes = 0;
  size_t files = 0;
  for (const auto &group : groups) {
    cost += costOf(group.dataSize);
    bytes += group.dataSize;
    files += group.paths.size();
  }

  out << "The price to upload " << files << " files with " << bytes
      << " total bytes in " << groups.size() << " transaction(s) is " << cost
      << ' ' << (withSol ? "lamports" : "winstons");
  if (auto prices = tryOraclePrices(network)) {
    double usd = withSol ? static_cast<double>(cost) *
                               static_cast<double>(prices->usdCentsPerSol) / 1e11
                         : static_cast<double>(cost) *
                               static_cast<double>(prices->usdCentsPerAr) / 1e14;
    out << " ($" << std::fixed << std::setprecision(4) << usd << ')';
  }
  out << ".\n";
}

void commandWalletBalance(NetworkClient &network, const std::string &address,
                          std::ostream &out) {
  constexpr uint64_t MB = 1024 * 1024;
  uint64_t balance = network.getWalletBalance(address);
  uint64_t perMb = network.getPrice(MB);
  uint64_t maxMb = perMb > 0 ? balance / perMb : 0;
  auto prices = tryOraclePrices(network);

  out << "Wallet balance is " << balance << " winstons";
  if (prices) {
    double arUsd = static_cast<double>(prices->usdCentsPerAr) / 100.0;
    double balanceUsd =
        static_cast<double>(balance) / static_cast<double>(WINSTONS_PER_AR) * arUsd;
    out << std::fixed << std::setprecision(2) << " ($" << balanceUsd << " at $"
        << arUsd << " USD per AR)";
  }
  out << ". At the current price of " << perMb << " winstons per MB";
  if (prices) {
    double mbUsd = static_cast<double>(perMb) *
                   static_cast<double>(prices->usdCentsPerAr) / 1e14;
    out << " ($" << std::fixed << std::setprecision(4) << mbUsd << ')';
  }
  out << ", you can upload " << maxMb << " MB of data.\n";
}

void commandPending(NetworkClient &network, std::ostream &out, int polls,
                    std::chrono::milliseconds interval) {
  out << " pending tx\n" << std::string(84, '-') << '\n';
  for (int i = 0; i < polls; ++i) {
    std::this_thread::sleep_for(interval);
    size_t count = network.getPending().size();
    out << std::right << std::setw(5) << count << " | ";
    for (size_t b = 0; b < count / 50 + 1; ++b)
      out << PENDING_BLOCK;
    out << std::endl;
  }
}

void commandGetTransaction(NetworkClient &network, const std::string &id,
                           std::ostream &out) {
  Transaction tx = network.getTransaction(b64_decode(id));
  out << "Fetched transaction " << b64_encode(tx.id) << '\n';
}

void commandRawStatus(NetworkClient &network, const std::string &id,
                      std::ostream &out) {
  NetworkStatus status = network.getStatus(b64_decode(id));
  if (status.raw)
    out << nlohmann::json(*status.raw).dump(4) << '\n';
  else
    out << statusCodeName(status.code) << '\n';
}

void commandGetStatus(NetworkClient &network, const std::string &id,
                      OutputFormat format, std::ostream &out) {
  Status status;
  status.id = b64_decode(id);
  NetworkStatus current = network.getStatus(status.id);
  status.status = current.code;
  status.rawStatus = current.raw;
  if (format == OutputFormat::Display) {
    out << withoutPathColumn(statusHeader(format))
        << withoutPathColumn(formatStatus(status, format));
  } else {
    out << formatStatus(status, format);
  }
}

void commandListStatus(const std::string &pattern, const std::string &logDir,
                       const std::vector<StatusCode> &codes,
                       std::optional<uint64_t> maxConfirms, OutputFormat format,
                       std::ostream &out) {
  StatusStore store(logDir);
  auto statuses = store.filterStatuses(expandGlob(pattern), codes, maxConfirms);
  if (statuses.empty()) {
    out << "Didn't find match any statuses.\n";
    return;
  }
  printHeader(out, statusHeader(format));
  for (const auto &status : statuses)
    out << formatStatus(status, format);
  out << "Found " << statuses.size() << " files matching filter criteria.\n";
}

void commandStatusReport(const std::string &pattern, const std::string &logDir,
                         std::ostream &out) {
  StatusStore store(logDir);
  out << store.statusSummary(expandGlob(pattern)) << '\n';
}

void commandUpdateStatus(Uploader &uploader, const std::string &pattern,
                         const std::string &logDir, OutputFormat format,
                         size_t buffer, std::ostream &out) {
  auto stream = uploader.updateStatusesStream(expandGlob(pattern), logDir, buffer);
  size_t counter = drainStream(
      *stream, [&] { printHeader(out, statusHeader(format)); },
      [&](const Status &s) { return formatStatus(s, format); }, out, std::cerr);
  if (counter == 0)
    out << "The `glob` and `log_dir` combination you provided didn't return "
           "any statuses.\n";
  else
    out << "Updated " << counter << " statuses.\n";
}

void commandUpdateBundleStatus(Uploader &uploader, const std::string &logDir,
                               OutputFormat format, size_t buffer,
                               std::ostream &out) {
  StatusStore store(logDir);
  auto stream =
      uploader.updateBundleStatusesStream(store.bundleStatusPaths(), logDir, buffer);
  size_t counter = drainStream(
      *stream, [&] { printHeader(out, bundleStatusHeader(format)); },
      [&](const BundleStatus &s) { return formatBundleStatus(s, format); }, out,
      std::cerr);
  if (counter == 0)
    out << "The `log_dir` you provided didn't have any statuses in it.\n";
  else
    out << "Updated " << counter << " statuses.\n";
}

void commandUploadFiles(Uploader &uploader, const std::string &pattern,
                        UploadOptions options, OutputFormat format,
                        std::ostream &out, std::ostream &err) {
  std::string logDir = options.logDir ? options.logDir->string() : std::string();
  auto stream = uploader.uploadFilesStream(expandGlob(pattern), std::move(options));
  size_t counter = drainStream(
      *stream,
      [&] {
        if (!logDir.empty())
          out << "Logging statuses to " << logDir << '\n';
        printHeader(out, statusHeader(format));
      },
      [&](const Status &s) { return formatStatus(s, format); }, out, err);
  if (counter == 0) {
    out << "The pattern \"" << pattern << "\" didn't match any files.\n";
  } else {
    out << "Uploaded " << counter << " files. Run `arloader update-status \""
        << pattern << "\" --log-dir \"" << logDir
        << "\"` to confirm transaction(s).\n";
  }
}

void commandUploadBundles(Uploader &uploader, const std::string &pattern,
                          uint64_t bundleSize, UploadOptions options,
                          OutputFormat format, std::ostream &out,
                          std::ostream &err) {
  auto groups = chunkFilePaths(expandGlob(pattern), bundleSize);
  if (groups.empty()) {
    out << "The pattern \"" << pattern << "\" didn't match any files.\n";
    return;
  }
  std::string logDir = options.logDir ? options.logDir->string() : std::string();
  auto stream = uploader.uploadBundlesStream(std::move(groups), std::move(options));

  uint64_t files = 0;
  uint64_t bytes = 0;
  size_t counter = drainStream(
      *stream, [&] { printHeader(out, bundleStatusHeader(format)); },
      [&](const BundleStatus &s) {
        files += s.numberOfFiles;
        bytes += s.dataSize;
        return formatBundleStatus(s, format);
      },
      out, err);
  out << "\nUploaded " << bytes / 1000 << " KB in " << files << " files in "
      << counter
      << " bundle transaction(s). Run `arloader update-status --log-dir \""
      << logDir << "\"` to update statuses.\n";
}

void commandUploadFilter(Uploader &uploader, const std::string &pattern,
                         const std::vector<StatusCode> &codes,
                         std::optional<uint64_t> maxConfirms,
                         UploadOptions options, OutputFormat format,
                         std::ostream &out, std::ostream &err) {
  if (!options.logDir)
    throwError(ErrorKind::Io, "upload-filter needs a log directory");
  std::string logDir = options.logDir->string();
  StatusStore store(*options.logDir);
  std::vector<fs::path> paths;
  for (auto &status : store.filterStatuses(expandGlob(pattern), codes, maxConfirms)) {
    if (status.filePath)
      paths.push_back(std::move(*status.filePath));
  }

  auto stream = uploader.uploadFilesStream(std::move(paths), std::move(options));
  size_t counter = drainStream(
      *stream, [&] { printHeader(out, statusHeader(format)); },
      [&](const Status &s) { return formatStatus(s, format); }, out, err);
  if (counter == 0) {
    out << "Didn't find any matching statuses.\n";
  } else {
    out << "Uploaded " << counter << " files. Run `arloader update-status \""
        << pattern << "\" --log-dir " << logDir
        << "` to confirm transaction(s).\n";
  }
}

void commandUploadManifest(Uploader &uploader, const std::string &logDir,
                           const PriceTerms &terms,
                           const std::string &gatewayUrl, std::ostream &out) {
  auto [id, count] = uploader.uploadManifest(logDir, terms, gatewayUrl);
  std::string txid = b64_encode(id);
  out << "Uploaded manifest for " << count << " files and wrote to " << logDir
      << "manifest_" << txid << ".json.\n\nRun `arloader get-status " << txid
      << "` to confirm manifest transaction.\n";
}

} // namespace arloader
