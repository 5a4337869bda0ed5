#include "manifest/manifest.hpp"
#include "utilities/encoding.hpp"
#include "utilities/errors.hpp"

namespace arloader {

namespace {

nlohmann::json wrap(nlohmann::json paths) {
  return nlohmann::json{{"manifest", MANIFEST_TYPE},
                        {"version", MANIFEST_VERSION},
                        {"paths", std::move(paths)}};
}

} // namespace

nlohmann::json createManifest(const std::vector<Status> &statuses) {
  nlohmann::json paths = nlohmann::json::object();
  for (const auto &status : statuses) {
    if (!status.filePath)
      throwError(ErrorKind::MissingFilePath, b64_encode(status.id));
    paths[status.filePath->string()] =
        nlohmann::json{{"id", b64_encode(status.id)}};
  }
  return wrap(std::move(paths));
}

nlohmann::json
createManifestFromBundleStatuses(const std::vector<BundleStatus> &statuses) {
  nlohmann::json paths = nlohmann::json::object();
  for (const auto &status : statuses) {
    for (const auto &[path, id] : status.filePaths)
      paths[path] = nlohmann::json{{"id", b64_encode(id)}};
  }
  return wrap(std::move(paths));
}

size_t manifestPathCount(const nlohmann::json &manifest) {
  if (!manifest.contains("paths") || !manifest["paths"].is_object())
    return 0;
  return manifest["paths"].size();
}

nlohmann::json manifestLog(const nlohmann::json &manifest,
                           const std::string &manifestTxId,
                           const std::string &gatewayUrl) {
  std::string base = gatewayUrl;
  if (base.empty() || base.back() != '/')
    base += '/';
  nlohmann::json relative = nlohmann::json::array();
  nlohmann::json ids = nlohmann::json::array();
  for (const auto &[path, entry] : manifest.at("paths").items()) {
    relative.push_back(base + manifestTxId + "/" + path);
    ids.push_back(base + entry.at("id").get<std::string>());
  }
  return nlohmann::json{{"relative_paths", relative}, {"id_paths", ids}};
}

} // namespace arloader
