#include "utilities/config.hpp"
#include "utilities/errors.hpp"

#include <cstdlib>
#include <filesystem>
#include <yaml-cpp/yaml.h>

namespace arloader {

namespace {

const char *DEFAULT_CONFIG_FILE = "arloader.yaml";

template <typename T>
void readKey(const YAML::Node &node, const char *key, T &out) {
  if (node[key])
    out = node[key].as<T>();
}

} // namespace

void applyEnvironment(Config &config) {
  if (const char *env = std::getenv("AR_BASE_URL"); env && env[0] != '\0')
    config.baseUrl = env;
  if (const char *env = std::getenv("AR_KEYPAIR_PATH"); env && env[0] != '\0')
    config.arKeypairPath = env;
  if (const char *env = std::getenv("SOL_KEYPAIR_PATH"); env && env[0] != '\0')
    config.solKeypairPath = env;
  if (const char *env = std::getenv("ARLOADER_LOG_LEVEL");
      env && env[0] != '\0')
    config.logLevel = env;
}

Config loadConfig(const std::string &path) {
  Config config;
  std::string file = path;
  bool explicitFile = !file.empty();
  if (!explicitFile) {
    if (const char *env = std::getenv("ARLOADER_CONFIG");
        env && env[0] != '\0') {
      file = env;
      explicitFile = true;
    } else {
      file = DEFAULT_CONFIG_FILE;
    }
  }

  if (std::filesystem::exists(file)) {
    try {
      YAML::Node node = YAML::LoadFile(file);
      readKey(node, "base_url", config.baseUrl);
      readKey(node, "ar_keypair_path", config.arKeypairPath);
      readKey(node, "sol_keypair_path", config.solKeypairPath);
      readKey(node, "solana_url", config.solanaUrl);
      readKey(node, "sol_ar_url", config.solArUrl);
      readKey(node, "oracle_url", config.oracleUrl);
      readKey(node, "log_file", config.logFile);
      readKey(node, "log_level", config.logLevel);
      readKey(node, "bundle_size", config.bundleSize);
      readKey(node, "buffer", config.buffer);
      readKey(node, "reward_multiplier", config.rewardMultiplier);
    } catch (const YAML::Exception &e) {
      throwError(ErrorKind::FormatError,
                 "config file " + file + ": " + e.what());
    }
  } else if (explicitFile) {
    throwError(ErrorKind::Io, "config file not found: " + file);
  }

  applyEnvironment(config);
  return config;
}

void validateConfig(const Config &config) {
  if (!(config.rewardMultiplier > 0.0 && config.rewardMultiplier < 10.0)) {
    throwError(ErrorKind::FormatError,
               "reward multiplier must be greater than 0 and less than 10");
  }
  if (config.buffer < 1) {
    throwError(ErrorKind::FormatError, "buffer must be at least 1");
  }
  if (config.bundleSize == 0) {
    throwError(ErrorKind::FormatError, "bundle size must be positive");
  }
}

} // namespace arloader
