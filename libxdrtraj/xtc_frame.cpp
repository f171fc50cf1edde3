/*
 * Copyright (c) 2020, Nikolay A. Krylov
 * Copyright (c) 2025
 * All rights reserved.
 *
 * XTC frame record layout - implementation file
 */

#include "xtc_frame.h"
#include "xdr_errors.h"
#include <climits>
#include <limits>

namespace xdrtraj {

bool XTCFrameCodec::read_header(XDRFile &in, XTCHeader &hdr) {
  if (in.at_eof()) {
    return false;
  }
  auto offset = in.tell();
  int32_t magic = in.read_int();
  if (magic != xtc_magic) {
    throw make_error(ErrorKind::Format,
                     "bad XTC magic number {} at offset {} in '{}'", magic,
                     offset, in.path());
  }
  int32_t natoms = in.read_int();
  if (natoms < 0) {
    throw make_error(ErrorKind::CorruptFrame,
                     "negative atom count {} at offset {} in '{}'", natoms,
                     offset, in.path());
  }
  hdr.natoms = static_cast<uint32_t>(natoms);
  hdr.step = in.read_int();
  hdr.time = in.read_float();
  in.read_floats(hdr.box[0].data(), 3);
  in.read_floats(hdr.box[1].data(), 3);
  in.read_floats(hdr.box[2].data(), 3);
  return true;
}

bool XTCFrameCodec::read(XDRFile &in, Frame &frame) {
  XTCHeader hdr;
  if (!read_header(in, hdr)) {
    return false;
  }

  // Smallest coordinate block the atom count allows: raw floats, or the
  // compressed block header and one bit per atom
  const uint64_t natoms = hdr.natoms;
  uint64_t needed = 4 + (xtc_use_raw(hdr.natoms) ? natoms * 12
                                                 : 36 + (natoms + 7) / 8);
  if (needed > in.remaining()) {
    throw make_error(ErrorKind::TruncatedInput,
                     "XTC frame of {} atoms needs at least {} more bytes, "
                     "only {} left in '{}'",
                     natoms, needed, in.remaining(), in.path());
  }

  frame.resize(hdr.natoms);
  frame.remove_velocities();
  frame.remove_forces();
  frame.step = hdr.step;
  frame.time = hdr.time;
  frame.lambda = 0.0f;
  frame.box = hdr.box;
  frame.has_box = true;

  params = coords.read_block(in, hdr.natoms, frame.coords().data(),
                             xtc_use_raw(hdr.natoms));
  return true;
}

bool XTCFrameCodec::skip(XDRFile &in, XTCHeader *hdr) {
  XTCHeader local;
  XTCHeader &h = hdr ? *hdr : local;
  if (!read_header(in, h)) {
    return false;
  }
  params = coords.read_block(in, h.natoms, nullptr, xtc_use_raw(h.natoms));
  return true;
}

void XTCFrameCodec::write(XDRFile &out, const Frame &frame, float precision) {
  frame.check_consistency();
  if (frame.step < std::numeric_limits<int32_t>::min() ||
      frame.step > std::numeric_limits<int32_t>::max()) {
    throw make_error(ErrorKind::Usage,
                     "step {} does not fit in the 32 bit XTC step field",
                     frame.step);
  }
  uint32_t natoms = frame.num_atoms();
  if (natoms > static_cast<uint32_t>(INT_MAX)) {
    throw make_error(ErrorKind::Usage, "too many atoms for XTC: {}", natoms);
  }

  record.clear();
  record.put_int(xtc_magic);
  record.put_int(static_cast<int32_t>(natoms));
  record.put_int(static_cast<int32_t>(frame.step));
  record.put_float(frame.time);
  for (const auto &row : frame.box) {
    for (float v : row) {
      record.put_float(v);
    }
  }

  params = coords.write_block(record, frame.coords().data(), natoms, precision,
                              xtc_use_raw(natoms));
  out.write_buffer(record);
}

} // namespace xdrtraj
