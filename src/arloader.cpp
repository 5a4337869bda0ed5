#include "commands/commands.hpp"
#include "crypto/signer.hpp"
#include "network/http_network_client.hpp"
#include "payment/co_signer.hpp"
#include "payment/solana.hpp"
#include "upload/uploader.hpp"
#include "utilities/config.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

using namespace arloader;

namespace {

const std::set<std::string> VALUE_FLAGS = {
    "--base-url",   "--ar-keypair-path",   "--output",
    "--bundle-size", "--config",           "--reward-multiplier",
    "--sol-keypair-path", "--log-dir",     "--buffer",
    "--min-confirms", "--max-confirms"};
const std::set<std::string> SWITCH_FLAGS = {"--with-sol", "--no-bundle",
                                            "--help"};
const std::set<std::string> LIST_FLAGS = {"--tags", "--statuses"};

struct CommandLine {
  std::string command;
  std::vector<std::string> positional;
  std::map<std::string, std::string> values;
  std::map<std::string, std::vector<std::string>> lists;
  std::set<std::string> switches;

  bool has(const std::string &flag) const {
    return values.count(flag) > 0 || switches.count(flag) > 0;
  }
  std::string value(const std::string &flag, const std::string &def = "") const {
    auto it = values.find(flag);
    return it == values.end() ? def : it->second;
  }
  std::vector<std::string> list(const std::string &flag) const {
    auto it = lists.find(flag);
    return it == lists.end() ? std::vector<std::string>{} : it->second;
  }
  std::string arg(size_t i, const std::string &name) const {
    if (i >= positional.size())
      throwError(ErrorKind::FormatError, command + " needs <" + name + ">");
    return positional[i];
  }
};

CommandLine parseCommandLine(int argc, char **argv) {
  CommandLine cl;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (VALUE_FLAGS.count(a)) {
      if (i + 1 >= argc)
        throwError(ErrorKind::FormatError, a + " needs a value");
      cl.values[a] = argv[++i];
    } else if (SWITCH_FLAGS.count(a)) {
      cl.switches.insert(a);
    } else if (LIST_FLAGS.count(a)) {
      auto &items = cl.lists[a];
      while (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0)
        items.push_back(argv[++i]);
    } else if (a.rfind("--", 0) == 0) {
      throwError(ErrorKind::FormatError, "unknown flag " + a);
    } else if (cl.command.empty()) {
      cl.command = a;
    } else {
      cl.positional.push_back(a);
    }
  }
  return cl;
}

uint64_t parseUnsigned(const std::string &flag, const std::string &text) {
  try {
    size_t used = 0;
    unsigned long long v = std::stoull(text, &used);
    if (used != text.size())
      throw std::invalid_argument(text);
    return v;
  } catch (const std::logic_error &) {
    throwError(ErrorKind::FormatError, flag + " expects a number, got " + text);
  }
}

double parseDouble(const std::string &flag, const std::string &text) {
  try {
    return std::stod(text);
  } catch (const std::logic_error &) {
    throwError(ErrorKind::FormatError, flag + " expects a number, got " + text);
  }
}

void printUsage(std::ostream &out) {
  out << "Usage: arloader [--base-url URL] [--ar-keypair-path PATH] "
         "[--output FORMAT] [--config FILE] <command> [args]\n\n"
         "Commands:\n"
         "  estimate <glob> [--reward-multiplier M] [--with-sol] [--no-bundle]\n"
         "  wallet-balance [address]\n"
         "  pending\n"
         "  get-transaction <id>\n"
         "  raw-status <id>\n"
         "  get-status <id>\n"
         "  upload <glob> [--log-dir DIR] [--tags name:value...] "
         "[--reward-multiplier M]\n"
         "         [--with-sol --sol-keypair-path PATH] [--no-bundle] "
         "[--bundle-size BYTES] [--buffer N]\n"
         "  list-status <glob> --log-dir DIR [--statuses CODE...] "
         "[--max-confirms N]\n"
         "  update-status [glob] --log-dir DIR [--buffer N]\n"
         "  status-report <glob> --log-dir DIR\n"
         "  upload-filter <glob> --log-dir DIR [--statuses CODE...] "
         "[--max-confirms N]\n"
         "  upload-manifest <log_dir> [--reward-multiplier M]\n";
}

Config resolveConfig(const CommandLine &cl) {
  Config config = loadConfig(cl.value("--config"));
  if (cl.has("--base-url"))
    config.baseUrl = cl.value("--base-url");
  if (cl.has("--ar-keypair-path"))
    config.arKeypairPath = cl.value("--ar-keypair-path");
  if (cl.has("--sol-keypair-path"))
    config.solKeypairPath = cl.value("--sol-keypair-path");
  if (cl.has("--bundle-size"))
    config.bundleSize = parseUnsigned("--bundle-size", cl.value("--bundle-size"));
  if (cl.has("--buffer"))
    config.buffer = parseUnsigned("--buffer", cl.value("--buffer"));
  if (cl.has("--reward-multiplier"))
    config.rewardMultiplier =
        parseDouble("--reward-multiplier", cl.value("--reward-multiplier"));
  config.baseUrl = addTrailingSlash(config.baseUrl);
  validateConfig(config);
  return config;
}

std::unique_ptr<RsaSigner> loadSigner(const Config &config) {
  if (config.arKeypairPath.empty())
    throwError(ErrorKind::KeyRejected,
               "set --ar-keypair-path or AR_KEYPAIR_PATH");
  return RsaSigner::fromJwkFile(config.arKeypairPath);
}

std::optional<uint64_t> maxConfirmsOf(const CommandLine &cl) {
  for (const char *flag : {"--max-confirms", "--min-confirms"}) {
    if (cl.has(flag))
      return parseUnsigned(flag, cl.value(flag));
  }
  return std::nullopt;
}

std::string requireLogDir(const CommandLine &cl) {
  if (!cl.has("--log-dir"))
    throwError(ErrorKind::FormatError, cl.command + " needs --log-dir");
  return addTrailingSlash(cl.value("--log-dir"));
}

int run(const CommandLine &cl) {
  Config config = resolveConfig(cl);
  std::string logFile = config.logFile == "console"
                            ? Logger::CONSOLE_ONLY_OUTPUT
                            : config.logFile;
  Logger::init(logFile, Logger::levelFromString(config.logLevel));
  Logger::getInstance().log(LogLevel::DEBUG, "arloader " + cl.command +
                                                 " against " + config.baseUrl);

  OutputFormat format = outputFormatFromName(cl.value("--output"));
  HttpNetworkClient network(config.baseUrl, config.oracleUrl, userAgent());
  const std::string &cmd = cl.command;
  bool withSol = cl.has("--with-sol");

  if (cmd == "estimate") {
    commandEstimate(network, cl.arg(0, "glob"), config.rewardMultiplier, withSol,
                    config.bundleSize, cl.has("--no-bundle"), std::cout);
  } else if (cmd == "wallet-balance") {
    std::string address;
    if (!cl.positional.empty())
      address = cl.positional[0];
    else
      address = loadSigner(config)->walletAddress();
    commandWalletBalance(network, address, std::cout);
  } else if (cmd == "pending") {
    commandPending(network, std::cout);
  } else if (cmd == "get-transaction") {
    commandGetTransaction(network, cl.arg(0, "id"), std::cout);
  } else if (cmd == "raw-status") {
    commandRawStatus(network, cl.arg(0, "id"), std::cout);
  } else if (cmd == "get-status") {
    commandGetStatus(network, cl.arg(0, "id"), format, std::cout);
  } else if (cmd == "list-status") {
    commandListStatus(cl.arg(0, "glob"), requireLogDir(cl),
                      parseStatusArgs(cl.list("--statuses")), maxConfirmsOf(cl),
                      format, std::cout);
  } else if (cmd == "status-report") {
    commandStatusReport(cl.arg(0, "glob"), requireLogDir(cl), std::cout);
  } else if (cmd == "update-status" || cmd == "upload" ||
             cmd == "upload-filter" || cmd == "upload-manifest") {
    auto signer = loadSigner(config);
    std::unique_ptr<SolanaClient> solana;
    std::unique_ptr<HttpCoSigner> coSigner;
    if (withSol) {
      if (config.solKeypairPath.empty())
        throwError(ErrorKind::KeyRejected,
                   "--with-sol needs --sol-keypair-path or SOL_KEYPAIR_PATH");
      solana = std::make_unique<SolanaClient>(
          config.solanaUrl, SolanaKeypair::fromFile(config.solKeypairPath),
          userAgent());
      coSigner = std::make_unique<HttpCoSigner>(config.solArUrl, userAgent());
    }
    Uploader uploader(network, *signer, solana.get(), coSigner.get());

    if (cmd == "update-status") {
      std::string logDir = requireLogDir(cl);
      if (cl.positional.empty())
        commandUpdateBundleStatus(uploader, logDir, format, config.buffer,
                                  std::cout);
      else
        commandUpdateStatus(uploader, cl.positional[0], logDir, format,
                            config.buffer, std::cout);
      return 0;
    }

    PriceTerms terms = uploader.priceTerms(config.rewardMultiplier);
    if (cmd == "upload-manifest") {
      commandUploadManifest(uploader, addTrailingSlash(cl.arg(0, "log_dir")),
                            terms, config.baseUrl, std::cout);
      return 0;
    }

    UploadOptions options;
    options.tags = parseTagArgs(cl.list("--tags"));
    if (cl.has("--log-dir"))
      options.logDir = addTrailingSlash(cl.value("--log-dir"));
    options.priceTerms = terms;
    options.buffer = config.buffer;
    options.withSol = withSol;

    if (cmd == "upload-filter") {
      options.logDir = requireLogDir(cl);
      commandUploadFilter(uploader, cl.arg(0, "glob"),
                          parseStatusArgs(cl.list("--statuses")),
                          maxConfirmsOf(cl), std::move(options), format,
                          std::cout, std::cerr);
    } else if (cl.has("--no-bundle")) {
      commandUploadFiles(uploader, cl.arg(0, "glob"), std::move(options), format,
                         std::cout, std::cerr);
    } else {
      commandUploadBundles(uploader, cl.arg(0, "glob"), config.bundleSize,
                           std::move(options), format, std::cout, std::cerr);
    }
  } else {
    std::cerr << "Unknown command " << cmd << "\n";
    printUsage(std::cerr);
    return 2;
  }
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  try {
    CommandLine cl = parseCommandLine(argc, argv);
    if (cl.command.empty() || cl.has("--help")) {
      printUsage(cl.has("--help") ? std::cout : std::cerr);
      return cl.has("--help") ? 0 : 2;
    }
    return run(cl);
  } catch (const Error &e) {
    std::cerr << "error: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "FATAL ERROR: " << e.what() << std::endl;
    return 1;
  }
}
