/*
 * Copyright (c) 2025
 * All rights reserved.
 *
 * libxdrtraj error types - implementation file
 */

#include "xdr_errors.h"

namespace xdrtraj {

const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Io:
    return "I/O error";
  case ErrorKind::Format:
    return "format error";
  case ErrorKind::TruncatedInput:
    return "truncated input";
  case ErrorKind::CorruptFrame:
    return "corrupt frame";
  case ErrorKind::CoordinateOutOfRange:
    return "coordinate out of range";
  case ErrorKind::UnsupportedPrecision:
    return "unsupported precision";
  case ErrorKind::Usage:
    return "usage error";
  }
  return "unknown error";
}

Error::Error(ErrorKind kind, const std::string &message)
    : std::runtime_error(message), errkind(kind) {}

} // namespace xdrtraj
