/*
 * Copyright (c) 2025
 * All rights reserved.
 *
 * XDR primitive codec - header file
 *
 * Big-endian 4-byte integers and floats, 8-byte doubles, strings and opaque
 * blocks, either appended to an in-memory buffer (XDRBuffer) or read from and
 * written to a seekable file (XDRFile).
 */

#ifndef XDRTRAJ_XDR_FILE_H
#define XDRTRAJ_XDR_FILE_H

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace xdrtraj {

enum class FileMode { Read, Write, Append };

const char *to_string(FileMode mode);

// XDR items are padded to a multiple of 4 bytes
inline uint64_t align4(uint64_t l) { return (l + 3) & ~uint64_t(3); }

// In-memory XDR encoder, used to assemble a whole record before writing it
class XDRBuffer {
public:
  void put_int(int32_t value);
  void put_uint(uint32_t value);
  void put_float(float value);
  void put_double(double value);

  // XDR string: length, bytes, zero padding
  void put_string(const std::string &value);

  // Fixed length opaque data, zero padded to 4 bytes
  void put_opaque(const uint8_t *data, size_t count);

  const std::vector<uint8_t> &data() const { return buf; }
  size_t size() const { return buf.size(); }
  void clear() { buf.clear(); }

private:
  std::vector<uint8_t> buf;
};

// Sequential XDR cursor over a file. Owns the file; closed on destruction.
class XDRFile {
public:
  XDRFile(const std::string &fname, FileMode mode);
  ~XDRFile();

  XDRFile(const XDRFile &) = delete;
  XDRFile &operator=(const XDRFile &) = delete;
  XDRFile(XDRFile &&) = default;
  XDRFile &operator=(XDRFile &&) = default;

  // Reading. All of these throw ErrorKind::TruncatedInput when fewer bytes
  // remain than required.
  int32_t read_int();
  uint32_t read_uint();
  float read_float();
  double read_double();
  void read_floats(float *out, size_t count);
  void read_doubles(double *out, size_t count);
  std::string read_string(size_t maxlen);
  void read_opaque(std::vector<uint8_t> &out, size_t count);

  // Move the cursor forward without decoding
  void skip(uint64_t nbytes);

  // True if no byte remains at the current position
  bool at_eof();

  // Writing. All of these throw ErrorKind::Io on failure.
  void write_int(int32_t value);
  void write_uint(uint32_t value);
  void write_float(float value);
  void write_double(double value);
  void write_floats(const float *values, size_t count);
  void write_doubles(const double *values, size_t count);
  void write_string(const std::string &value);
  void write_opaque(const uint8_t *data, size_t count);
  void write_buffer(const XDRBuffer &buffer);

  uint64_t tell();
  void seek(uint64_t offset);
  uint64_t size();
  uint64_t remaining() { return size() - tell(); }
  void flush();
  void close();

  bool is_open() const { return fxdr.is_open(); }
  FileMode mode() const { return fmode; }
  const std::string &path() const { return filename; }

private:
  void read_bytes(char *out, size_t count);
  void write_bytes(const char *data, size_t count);

  std::fstream fxdr;
  std::string filename;
  FileMode fmode;
};

} // namespace xdrtraj

#endif // XDRTRAJ_XDR_FILE_H
