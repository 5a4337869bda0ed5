#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <iostream>

namespace arloader {

const char *errorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::InvalidProof:
    return "invalid proof";
  case ErrorKind::InvalidDataItem:
    return "invalid data item";
  case ErrorKind::InvalidTags:
    return "tags could not be parsed";
  case ErrorKind::UnsignedTransaction:
    return "transaction is not signed";
  case ErrorKind::InvalidHash:
    return "hashing failed";
  case ErrorKind::MissingFilePath:
    return "file path not provided";
  case ErrorKind::MissingTrailingSlash:
    return "missing trailing slash";
  case ErrorKind::Io:
    return "io";
  case ErrorKind::FormatError:
    return "formatting error";
  case ErrorKind::GlobPattern:
    return "glob pattern";
  case ErrorKind::Json:
    return "json";
  case ErrorKind::Base64Decode:
    return "base64 decode";
  case ErrorKind::GetPrice:
    return "failed to get price";
  case ErrorKind::OraclePrice:
    return "failed to get oracle price";
  case ErrorKind::Post:
    return "post failed";
  case ErrorKind::Http:
    return "http";
  case ErrorKind::KeyRejected:
    return "key rejected";
  case ErrorKind::SigningFailed:
    return "signing failed";
  case ErrorKind::StatusNotFound:
    return "status not found";
  case ErrorKind::NoBundleStatusesFound:
    return "no bundle statuses found";
  case ErrorKind::ManifestNotFound:
    return "manifest not found";
  case ErrorKind::InsufficientFunds:
    return "insufficient funds";
  case ErrorKind::CoSignerError:
    return "co-signer error";
  }
  return "unknown";
}

static std::string composeMessage(ErrorKind kind, const std::string &detail) {
  std::string msg = errorKindName(kind);
  if (!detail.empty())
    msg += ": " + detail;
  return msg;
}

Error::Error(ErrorKind kind, const std::string &detail)
    : std::runtime_error(composeMessage(kind, detail)), kind_(kind),
      detail_(detail) {}

void throwError(ErrorKind kind, const std::string &detail) {
  Error err(kind, detail);
  try {
    Logger::getInstance().log(LogLevel::DEBUG, err.what());
  } catch (const std::runtime_error &e) {
    std::cerr << "Logger not initialized. Original error: " << err.what()
              << " Logger error: " << e.what() << std::endl;
  }
  throw err;
}

} // namespace arloader
