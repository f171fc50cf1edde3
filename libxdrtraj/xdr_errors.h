/*
 * Copyright (c) 2025
 * All rights reserved.
 *
 * libxdrtraj error types - header file
 */

#ifndef XDRTRAJ_XDR_ERRORS_H
#define XDRTRAJ_XDR_ERRORS_H

#include <fmt/format.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace xdrtraj {

enum class ErrorKind {
  Io,                   // underlying file operation failed
  Format,               // magic number or structural mismatch
  TruncatedInput,       // file ended in the middle of a record
  CorruptFrame,         // decode invariants violated
  CoordinateOutOfRange, // coordinates cannot be compressed at this precision
  UnsupportedPrecision, // TRR element width is neither 4 nor 8
  Usage                 // API misuse (wrong mode, inconsistent frame, ...)
};

const char *to_string(ErrorKind kind);

// Exception thrown by every libxdrtraj operation
class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &message);

  ErrorKind kind() const noexcept { return errkind; }

private:
  ErrorKind errkind;
};

template <typename... Args>
Error make_error(ErrorKind kind, fmt::format_string<Args...> fmt,
                 Args &&...args) {
  return Error(kind, fmt::format(fmt, std::forward<Args>(args)...));
}

} // namespace xdrtraj

#endif // XDRTRAJ_XDR_ERRORS_H
