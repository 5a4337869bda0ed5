#ifndef ARLOADER_COMMANDS_HPP
#define ARLOADER_COMMANDS_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "network/network_client.hpp"
#include "status/status.hpp"
#include "transaction/tag.hpp"
#include "upload/uploader.hpp"

namespace arloader {

/**
 * @brief Expands a shell glob (with ~) into matching paths, sorted.
 *
 * A pattern that matches nothing yields an empty list.
 * @throws Error(GlobPattern) on a read error or an invalid pattern.
 */
std::vector<std::filesystem::path> expandGlob(const std::string &pattern);

/// Appends '/' unless already present.
std::string addTrailingSlash(const std::string &value);

/// Parses repeated "name:value" arguments. @throws Error(InvalidTags)
std::vector<Tag> parseTagArgs(const std::vector<std::string> &args);

/// Parses status code names. @throws Error(FormatError)
std::vector<StatusCode> parseStatusArgs(const std::vector<std::string> &args);

void commandEstimate(NetworkClient &network, const std::string &pattern,
                     double rewardMultiplier, bool withSol, uint64_t bundleSize,
                     bool noBundle, std::ostream &out);

void commandWalletBalance(NetworkClient &network, const std::string &address,
                          std::ostream &out);

/// Prints the pending transaction count once per @p interval.
void commandPending(NetworkClient &network, std::ostream &out, int polls = 60,
                    std::chrono::milliseconds interval = std::chrono::seconds(1));

void commandGetTransaction(NetworkClient &network, const std::string &id,
                           std::ostream &out);

void commandRawStatus(NetworkClient &network, const std::string &id,
                      std::ostream &out);

void commandGetStatus(NetworkClient &network, const std::string &id,
                      OutputFormat format, std::ostream &out);

void commandListStatus(const std::string &pattern, const std::string &logDir,
                       const std::vector<StatusCode> &codes,
                       std::optional<uint64_t> maxConfirms, OutputFormat format,
                       std::ostream &out);

void commandStatusReport(const std::string &pattern, const std::string &logDir,
                         std::ostream &out);

void commandUpdateStatus(Uploader &uploader, const std::string &pattern,
                         const std::string &logDir, OutputFormat format,
                         size_t buffer, std::ostream &out);

void commandUpdateBundleStatus(Uploader &uploader, const std::string &logDir,
                               OutputFormat format, size_t buffer,
                               std::ostream &out);

/// Per-file upload of every file matched by @p pattern.
void commandUploadFiles(Uploader &uploader, const std::string &pattern,
                        UploadOptions options, OutputFormat format,
                        std::ostream &out, std::ostream &err);

/// Bundled upload; groups are at most @p bundleSize bytes.
void commandUploadBundles(Uploader &uploader, const std::string &pattern,
                          uint64_t bundleSize, UploadOptions options,
                          OutputFormat format, std::ostream &out,
                          std::ostream &err);

/// Re-uploads the files whose stored statuses pass the filter.
void commandUploadFilter(Uploader &uploader, const std::string &pattern,
                         const std::vector<StatusCode> &codes,
                         std::optional<uint64_t> maxConfirms,
                         UploadOptions options, OutputFormat format,
                         std::ostream &out, std::ostream &err);

void commandUploadManifest(Uploader &uploader, const std::string &logDir,
                           const PriceTerms &terms,
                           const std::string &gatewayUrl, std::ostream &out);

} // namespace arloader

#endif // ARLOADER_COMMANDS_HPP
