#ifndef ARLOADER_ERRORS_HPP
#define ARLOADER_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace arloader {

/// Every failure surfaced by the library is classified by one of these kinds.
enum class ErrorKind {
  // validation
  InvalidProof,
  InvalidDataItem,
  InvalidTags,
  UnsignedTransaction,
  InvalidHash,
  MissingFilePath,
  MissingTrailingSlash,
  // io
  Io,
  FormatError,
  GlobPattern,
  Json,
  Base64Decode,
  // network
  GetPrice,
  OraclePrice,
  Post,
  Http,
  // crypto
  KeyRejected,
  SigningFailed,
  // storage
  StatusNotFound,
  NoBundleStatusesFound,
  ManifestNotFound,
  // payment
  InsufficientFunds,
  CoSignerError
};

const char *errorKindName(ErrorKind kind);

/**
 * @brief Exception type thrown at every library boundary.
 *
 * The message is prefixed with the kind name so `what()` is self describing
 * when printed by the CLI.
 */
class Error : public std::runtime_error {
public:
  explicit Error(ErrorKind kind, const std::string &detail = "");

  ErrorKind kind() const noexcept { return kind_; }
  const std::string &detail() const noexcept { return detail_; }

private:
  ErrorKind kind_;
  std::string detail_;
};

/// Logs the failure at DEBUG and throws an Error of the given kind.
[[noreturn]] void throwError(ErrorKind kind, const std::string &detail = "");

} // namespace arloader

#endif // ARLOADER_ERRORS_HPP
