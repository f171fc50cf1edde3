/*
 * Copyright (c) 2025
 * All rights reserved.
 *
 * XDR primitive codec - implementation file
 */

#include "xdr_file.h"
#include "xdr_errors.h"
#include <cerrno>
#include <cstring>

namespace xdrtraj {

namespace {

inline bool is_little_endian() {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
  return true;
#elif defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
  return false;
#else
  union {
    uint16_t value;
    uint8_t data[sizeof(uint16_t)];
  } number;
  number.value = 1;
  return number.data[0];
#endif
}

// Endian swap utilities
template <typename T> T byteswap(T value) {
  union {
    T val;
    uint8_t bytes[sizeof(T)];
  } src, dst;

  src.val = value;
  for (size_t i = 0; i < sizeof(T); i++) {
    dst.bytes[i] = src.bytes[sizeof(T) - 1 - i];
  }
  return dst.val;
}

// Convert between host order and XDR (big-endian) order
template <typename T> T to_xdr(T value) {
  return is_little_endian() ? byteswap(value) : value;
}

template <typename T, typename U> T bit_cast(U value) {
  static_assert(sizeof(T) == sizeof(U), "size mismatch");
  T out;
  std::memcpy(&out, &value, sizeof(T));
  return out;
}

template <typename T> void append(std::vector<uint8_t> &buf, T value) {
  T swapped = to_xdr(value);
  const uint8_t *ptr = reinterpret_cast<const uint8_t *>(&swapped);
  buf.insert(buf.end(), ptr, ptr + sizeof(T));
}

template <typename T> T decode(const char *ptr) {
  T value;
  std::memcpy(&value, ptr, sizeof(T));
  return to_xdr(value);
}

std::ios::openmode open_flags(FileMode mode) {
  switch (mode) {
  case FileMode::Read:
    return std::ios::binary | std::ios::in;
  case FileMode::Write:
    return std::ios::binary | std::ios::out | std::ios::trunc;
  case FileMode::Append:
    return std::ios::binary | std::ios::in | std::ios::out | std::ios::app;
  }
  return std::ios::binary | std::ios::in;
}

} // namespace

const char *to_string(FileMode mode) {
  switch (mode) {
  case FileMode::Read:
    return "read";
  case FileMode::Write:
    return "write";
  case FileMode::Append:
    return "append";
  }
  return "unknown";
}

// XDRBuffer

void XDRBuffer::put_int(int32_t value) { append(buf, value); }

void XDRBuffer::put_uint(uint32_t value) { append(buf, value); }

void XDRBuffer::put_float(float value) {
  append(buf, bit_cast<uint32_t>(value));
}

void XDRBuffer::put_double(double value) {
  append(buf, bit_cast<uint64_t>(value));
}

void XDRBuffer::put_string(const std::string &value) {
  put_uint(static_cast<uint32_t>(value.size()));
  put_opaque(reinterpret_cast<const uint8_t *>(value.data()), value.size());
}

void XDRBuffer::put_opaque(const uint8_t *data, size_t count) {
  buf.insert(buf.end(), data, data + count);
  buf.resize(buf.size() + (align4(count) - count), 0);
}

// XDRFile

XDRFile::XDRFile(const std::string &fname, FileMode mode)
    : filename(fname), fmode(mode) {
  fxdr.open(fname, open_flags(mode));
  if (!fxdr.is_open()) {
    throw make_error(ErrorKind::Io, "cannot open '{}' in {} mode: {}", fname,
                     to_string(mode), std::strerror(errno));
  }
  if (mode == FileMode::Append) {
    fxdr.seekp(0, std::ios::end);
  }
}

XDRFile::~XDRFile() {
  if (fxdr.is_open()) {
    fxdr.close();
  }
}

void XDRFile::read_bytes(char *out, size_t count) {
  if (!fxdr.is_open()) {
    throw make_error(ErrorKind::Usage, "'{}' is closed", filename);
  }
  fxdr.read(out, static_cast<std::streamsize>(count));
  auto got = static_cast<size_t>(fxdr.gcount());
  if (got != count) {
    throw make_error(ErrorKind::TruncatedInput,
                     "unexpected end of file in '{}': needed {} bytes, got {}",
                     filename, count, got);
  }
}

void XDRFile::write_bytes(const char *data, size_t count) {
  if (!fxdr.is_open()) {
    throw make_error(ErrorKind::Usage, "'{}' is closed", filename);
  }
  fxdr.write(data, static_cast<std::streamsize>(count));
  if (!fxdr) {
    throw make_error(ErrorKind::Io, "failed to write {} bytes to '{}': {}",
                     count, filename, std::strerror(errno));
  }
}

int32_t XDRFile::read_int() {
  char mem[4];
  read_bytes(mem, sizeof(mem));
  return decode<int32_t>(mem);
}

uint32_t XDRFile::read_uint() {
  char mem[4];
  read_bytes(mem, sizeof(mem));
  return decode<uint32_t>(mem);
}

float XDRFile::read_float() { return bit_cast<float>(read_uint()); }

double XDRFile::read_double() {
  char mem[8];
  read_bytes(mem, sizeof(mem));
  return bit_cast<double>(decode<uint64_t>(mem));
}

void XDRFile::read_floats(float *out, size_t count) {
  std::vector<char> mem(count * 4);
  read_bytes(mem.data(), mem.size());
  for (size_t i = 0; i < count; i++) {
    out[i] = bit_cast<float>(decode<uint32_t>(mem.data() + 4 * i));
  }
}

void XDRFile::read_doubles(double *out, size_t count) {
  std::vector<char> mem(count * 8);
  read_bytes(mem.data(), mem.size());
  for (size_t i = 0; i < count; i++) {
    out[i] = bit_cast<double>(decode<uint64_t>(mem.data() + 8 * i));
  }
}

std::string XDRFile::read_string(size_t maxlen) {
  uint32_t len = read_uint();
  if (len > maxlen) {
    throw make_error(ErrorKind::Format,
                     "string of {} bytes in '{}' exceeds the limit of {}", len,
                     filename, maxlen);
  }
  std::vector<char> mem(align4(len));
  read_bytes(mem.data(), mem.size());
  return std::string(mem.data(), len);
}

void XDRFile::read_opaque(std::vector<uint8_t> &out, size_t count) {
  auto padded = align4(count);
  if (padded > remaining()) {
    throw make_error(ErrorKind::TruncatedInput,
                     "unexpected end of file in '{}': block of {} bytes "
                     "exceeds the {} remaining",
                     filename, padded, remaining());
  }
  out.resize(padded);
  read_bytes(reinterpret_cast<char *>(out.data()), padded);
  out.resize(count);
}

void XDRFile::skip(uint64_t nbytes) {
  if (nbytes > remaining()) {
    throw make_error(ErrorKind::TruncatedInput,
                     "unexpected end of file in '{}': cannot skip {} bytes",
                     filename, nbytes);
  }
  seek(tell() + nbytes);
}

bool XDRFile::at_eof() {
  if (!fxdr.is_open()) {
    throw make_error(ErrorKind::Usage, "'{}' is closed", filename);
  }
  if (fxdr.peek() == std::char_traits<char>::eof()) {
    fxdr.clear();
    return true;
  }
  return false;
}

void XDRFile::write_int(int32_t value) {
  value = to_xdr(value);
  write_bytes(reinterpret_cast<const char *>(&value), sizeof(value));
}

void XDRFile::write_uint(uint32_t value) {
  value = to_xdr(value);
  write_bytes(reinterpret_cast<const char *>(&value), sizeof(value));
}

void XDRFile::write_float(float value) {
  write_uint(bit_cast<uint32_t>(value));
}

void XDRFile::write_double(double value) {
  uint64_t tmp = to_xdr(bit_cast<uint64_t>(value));
  write_bytes(reinterpret_cast<const char *>(&tmp), sizeof(tmp));
}

void XDRFile::write_floats(const float *values, size_t count) {
  XDRBuffer buf;
  for (size_t i = 0; i < count; i++) {
    buf.put_float(values[i]);
  }
  write_buffer(buf);
}

void XDRFile::write_doubles(const double *values, size_t count) {
  XDRBuffer buf;
  for (size_t i = 0; i < count; i++) {
    buf.put_double(values[i]);
  }
  write_buffer(buf);
}

void XDRFile::write_string(const std::string &value) {
  XDRBuffer buf;
  buf.put_string(value);
  write_buffer(buf);
}

void XDRFile::write_opaque(const uint8_t *data, size_t count) {
  XDRBuffer buf;
  buf.put_opaque(data, count);
  write_buffer(buf);
}

void XDRFile::write_buffer(const XDRBuffer &buffer) {
  write_bytes(reinterpret_cast<const char *>(buffer.data().data()),
              buffer.size());
}

uint64_t XDRFile::tell() {
  if (!fxdr.is_open()) {
    throw make_error(ErrorKind::Usage, "'{}' is closed", filename);
  }
  std::streampos pos =
      fmode == FileMode::Read ? fxdr.tellg() : fxdr.tellp();
  if (pos == std::streampos(-1)) {
    throw make_error(ErrorKind::Io, "cannot get position in '{}'", filename);
  }
  return static_cast<uint64_t>(pos);
}

void XDRFile::seek(uint64_t offset) {
  if (!fxdr.is_open()) {
    throw make_error(ErrorKind::Usage, "'{}' is closed", filename);
  }
  fxdr.clear();
  auto pos = static_cast<std::streamoff>(offset);
  if (fmode == FileMode::Read) {
    fxdr.seekg(pos);
  } else {
    fxdr.seekp(pos);
  }
  if (!fxdr) {
    throw make_error(ErrorKind::Io, "cannot seek to offset {} in '{}'",
                     offset, filename);
  }
}

uint64_t XDRFile::size() {
  auto cur = tell();
  if (fmode == FileMode::Read) {
    fxdr.seekg(0, std::ios::end);
  } else {
    fxdr.seekp(0, std::ios::end);
  }
  auto end = tell();
  seek(cur);
  return end;
}

void XDRFile::flush() {
  if (!fxdr.is_open()) {
    throw make_error(ErrorKind::Usage, "'{}' is closed", filename);
  }
  fxdr.flush();
  if (!fxdr) {
    throw make_error(ErrorKind::Io, "failed to flush '{}'", filename);
  }
}

void XDRFile::close() {
  if (fxdr.is_open()) {
    fxdr.close();
    if (fxdr.fail()) {
      throw make_error(ErrorKind::Io, "failed to close '{}'", filename);
    }
  }
}

} // namespace xdrtraj
