/*
 * Copyright (c) 2020, Nikolay A. Krylov
 * Copyright (c) 2025
 * All rights reserved.
 *
 * XTC compressed coordinate codec - header file
 */

#ifndef XDRTRAJ_XTC_COMPRESS_H
#define XDRTRAJ_XTC_COMPRESS_H

#include "frame.h"
#include <cstdint>
#include <vector>

namespace xdrtraj {

class XDRBuffer;
class XDRFile;

constexpr float xtc_default_precision = 1000.0f;

// Frames with this many atoms or fewer store raw floats instead of a
// compressed block
constexpr uint32_t xtc_raw_threshold = 9;

inline bool xtc_use_raw(uint32_t natoms) { return natoms <= xtc_raw_threshold; }

// Per-frame parameters of a compressed coordinate block
struct CompressionParameters {
  float precision = xtc_default_precision;
  int32_t minint[3] = {0, 0, 0};
  int32_t maxint[3] = {0, 0, 0};
  uint32_t size_bits[3] = {0, 0, 0}; // bits needed for maxint - minint
  int32_t smallidx = 0;              // initial run-length size index
  int32_t nbytes = 0;                // length of the packed bitstream
};

// Compressor/decompressor keeping its work buffers between frames, so that
// streaming a trajectory does not allocate once per frame.
class XTCCoordCodec {
public:
  // Scale, bound and bit-pack natoms coordinates. The packed bitstream is
  // available through packed() until the next call.
  // Throws ErrorKind::CoordinateOutOfRange if the scaled coordinates do not
  // fit in 31 bits.
  CompressionParameters compress(const Vector3f *coords, uint32_t natoms,
                                 float precision);

  // Exact inverse of compress. `data` must hold cp.nbytes bytes.
  // Throws ErrorKind::CorruptFrame on any inconsistency.
  static void decompress(const CompressionParameters &cp, uint32_t natoms,
                         const uint8_t *data, Vector3f *coords);

  // Coordinate block of an XTC record: atom count, then either raw floats
  // (raw == true) or precision, bounds, small index, byte count and the
  // packed bitstream. The caller decides `raw`, normally through
  // xtc_use_raw(). Returns the parameters of the compressed block.
  CompressionParameters write_block(XDRBuffer &out, const Vector3f *coords,
                                    uint32_t natoms, float precision, bool raw);

  // Read a block written by write_block. The atom count stored in the block
  // must equal natoms. With coords == nullptr the block is skipped.
  CompressionParameters read_block(XDRFile &in, uint32_t natoms,
                                   Vector3f *coords, bool raw);

  const std::vector<uint8_t> &packed() const { return packed_buffer; }

private:
  std::vector<uint8_t> packed_buffer;
  std::vector<int32_t> int_coords;
  std::vector<float> raw_coords;
};

// One-shot helpers around XTCCoordCodec
CompressionParameters compress_coords(const Vector3f *coords, uint32_t natoms,
                                      float precision,
                                      std::vector<uint8_t> &packed);
void decompress_coords(const CompressionParameters &cp, uint32_t natoms,
                       const uint8_t *packed, Vector3f *coords);

} // namespace xdrtraj

#endif // XDRTRAJ_XTC_COMPRESS_H
