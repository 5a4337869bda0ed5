#ifndef ARLOADER_MANIFEST_HPP
#define ARLOADER_MANIFEST_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "status/status.hpp"

namespace arloader {

inline constexpr const char *MANIFEST_TYPE = "arweave/paths";
inline constexpr const char *MANIFEST_VERSION = "0.1.0";

/**
 * @brief {"manifest":"arweave/paths","version":"0.1.0","paths":{path:{id}}}
 * over per-file statuses.
 * @throws Error(MissingFilePath) if a status has no file path.
 */
nlohmann::json createManifest(const std::vector<Status> &statuses);

/// Same document with the merged file_paths of every bundle.
nlohmann::json
createManifestFromBundleStatuses(const std::vector<BundleStatus> &statuses);

size_t manifestPathCount(const nlohmann::json &manifest);

/**
 * @brief Log written next to the bundle statuses after a manifest upload.
 *
 * relative_paths holds <gateway><manifest id>/<path> and id_paths
 * <gateway><item id>, both in manifest path order.
 */
nlohmann::json manifestLog(const nlohmann::json &manifest,
                           const std::string &manifestTxId,
                           const std::string &gatewayUrl);

} // namespace arloader

#endif // ARLOADER_MANIFEST_HPP
