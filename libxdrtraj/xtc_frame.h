/*
 * Copyright (c) 2020, Nikolay A. Krylov
 * Copyright (c) 2025
 * All rights reserved.
 *
 * XTC frame record layout - header file
 */

#ifndef XDRTRAJ_XTC_FRAME_H
#define XDRTRAJ_XTC_FRAME_H

#include "frame.h"
#include "xdr_file.h"
#include "xtc_compress.h"
#include <cstdint>

namespace xdrtraj {

constexpr int32_t xtc_magic = 1995;

// magic, natoms, step, time, box
constexpr uint64_t xtc_header_size = 4 * 4 + 4 * 9;

struct XTCHeader {
  uint32_t natoms = 0;
  int32_t step = 0;
  float time = 0.0f;
  Matrix3f box{};
};

// Reads and writes whole XTC records. Keeps the coordinate codec and the
// record buffer alive between frames.
class XTCFrameCodec {
public:
  // Parse the fixed record header. Returns false when no byte of a new
  // record is left (clean end of file).
  bool read_header(XDRFile &in, XTCHeader &hdr);

  // Decode the next record into frame, resizing it when the atom count
  // changed. Velocities and forces are removed, lambda is reset.
  bool read(XDRFile &in, Frame &frame);

  // Move past the next record without decompressing coordinates
  bool skip(XDRFile &in, XTCHeader *hdr = nullptr);

  // Encode frame and append it in a single write
  void write(XDRFile &out, const Frame &frame, float precision);

  // Compression parameters of the last record read or written. Meaningless
  // for frames stored raw.
  const CompressionParameters &last_parameters() const { return params; }

private:
  XTCCoordCodec coords;
  XDRBuffer record;
  CompressionParameters params;
};

} // namespace xdrtraj

#endif // XDRTRAJ_XTC_FRAME_H
