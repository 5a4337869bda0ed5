#ifndef ARLOADER_CONFIG_HPP
#define ARLOADER_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace arloader {

/// Default bundle payload limit in bytes.
inline constexpr uint64_t DEFAULT_BUNDLE_SIZE = 10000000;

/**
 * @brief Runtime options shared by every CLI command.
 *
 * Values are layered: built-in defaults, then the YAML file named by
 * ARLOADER_CONFIG (or ./arloader.yaml), then environment variables. CLI
 * flags are applied on top by the command layer.
 */
struct Config {
  std::string baseUrl = "https://arweave.net/";
  std::string arKeypairPath;
  std::string solKeypairPath;
  std::string solanaUrl = "https://api.mainnet-beta.solana.com/";
  std::string solArUrl = "https://arloader.io/sol";
  std::string oracleUrl = "https://api.coingecko.com/api/v3/simple/"
                          "price?ids=arweave,solana&vs_currencies=usd";
  std::string logFile = "console";
  std::string logLevel = "warn";
  uint64_t bundleSize = DEFAULT_BUNDLE_SIZE;
  size_t buffer = 5;
  double rewardMultiplier = 1.0;
};

/**
 * @brief Loads configuration from @p path (when non-empty) or the default
 * locations and applies environment overrides.
 *
 * A missing default file is not an error; an explicitly named file that is
 * missing or malformed raises Error(Io) / Error(FormatError).
 */
Config loadConfig(const std::string &path = "");

/** Applies AR_BASE_URL, AR_KEYPAIR_PATH, SOL_KEYPAIR_PATH, ARLOADER_LOG_LEVEL. */
void applyEnvironment(Config &config);

/**
 * @brief Checks value ranges.
 * @throws Error(FormatError) when reward multiplier or buffer are out of range.
 */
void validateConfig(const Config &config);

} // namespace arloader

#endif // ARLOADER_CONFIG_HPP
