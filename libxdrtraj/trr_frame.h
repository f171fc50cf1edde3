/*
 * Copyright (c) 2025
 * All rights reserved.
 *
 * TRR frame record layout - header file
 */

#ifndef XDRTRAJ_TRR_FRAME_H
#define XDRTRAJ_TRR_FRAME_H

#include "frame.h"
#include "xdr_file.h"
#include <cstdint>
#include <vector>

namespace xdrtraj {

constexpr int32_t trr_magic = 1993;
constexpr const char *trr_version = "GMX_trn_file";

// Element width of the floating point fields of a TRR record
enum class TRRPrecision { Single, Double };

const char *to_string(TRRPrecision prec);

struct TRRHeader {
  // Byte sizes of the optional blocks; zero means absent
  int32_t ir_size = 0;
  int32_t e_size = 0;
  int32_t box_size = 0;
  int32_t vir_size = 0;
  int32_t pres_size = 0;
  int32_t top_size = 0;
  int32_t sym_size = 0;
  int32_t x_size = 0;
  int32_t v_size = 0;
  int32_t f_size = 0;

  uint32_t natoms = 0;
  int32_t step = 0;
  int32_t nre = 0;
  double time = 0.0;
  double lambda = 0.0;

  TRRPrecision precision = TRRPrecision::Single;

  // Bytes of the data blocks following the header
  uint64_t data_size() const;
};

// Infer the element width (4 or 8) from the first nonzero block size.
// Throws ErrorKind::UnsupportedPrecision for any other width, and
// ErrorKind::Format when the block sizes disagree with each other.
int trr_element_width(const TRRHeader &hdr);

// Reads and writes whole TRR records
class TRRFrameCodec {
public:
  // Returns false when no byte of a new record is left
  bool read_header(XDRFile &in, TRRHeader &hdr);

  // Decode the next record into frame. Velocities and forces are added or
  // removed to match the record; absent coordinates read as zeros.
  bool read(XDRFile &in, Frame &frame);

  bool skip(XDRFile &in, TRRHeader *hdr = nullptr);

  // Box, coordinates, and the velocities and forces present in frame are
  // written with the requested width.
  void write(XDRFile &out, const Frame &frame, TRRPrecision precision);

private:
  void read_vectors(XDRFile &in, const TRRHeader &hdr, Vector3f *out,
                    size_t count);
  void put_vectors(const Vector3f *values, size_t count, bool dbl);

  XDRBuffer record;
  std::vector<float> fbuf;
  std::vector<double> dbuf;
};

} // namespace xdrtraj

#endif // XDRTRAJ_TRR_FRAME_H
