/*
 * Copyright (c) 2025
 * All rights reserved.
 *
 * TRR frame record layout - implementation file
 */

#include "trr_frame.h"
#include "xdr_errors.h"
#include "xdr_log.h"
#include <algorithm>
#include <limits>

namespace xdrtraj {

namespace {

// Length of the version string including its terminating zero, as stored
// in the header
const int32_t trr_version_len = 13;

// Largest atom count whose double precision blocks still fit the int32
// size fields
const uint32_t trr_max_atoms = std::numeric_limits<int32_t>::max() / 24;

int32_t block_size(int64_t nelem, int width) {
  return static_cast<int32_t>(nelem * width);
}

} // namespace

const char *to_string(TRRPrecision prec) {
  return prec == TRRPrecision::Double ? "double" : "single";
}

uint64_t TRRHeader::data_size() const {
  return uint64_t(box_size) + uint64_t(vir_size) + uint64_t(pres_size) +
         uint64_t(x_size) + uint64_t(v_size) + uint64_t(f_size);
}

int trr_element_width(const TRRHeader &hdr) {
  const int64_t nvec = int64_t(hdr.natoms) * 3;
  int width = 0;
  if (hdr.box_size) {
    width = hdr.box_size / 9;
  } else if (hdr.vir_size) {
    width = hdr.vir_size / 9;
  } else if (hdr.pres_size) {
    width = hdr.pres_size / 9;
  } else if (nvec > 0 && hdr.x_size) {
    width = static_cast<int>(hdr.x_size / nvec);
  } else if (nvec > 0 && hdr.v_size) {
    width = static_cast<int>(hdr.v_size / nvec);
  } else if (nvec > 0 && hdr.f_size) {
    width = static_cast<int>(hdr.f_size / nvec);
  } else {
    // no block gives the width: time and lambda are single precision, and
    // any per-atom block of an empty frame is rejected below
    width = 4;
  }
  if (width != 4 && width != 8) {
    throw make_error(ErrorKind::UnsupportedPrecision,
                     "TRR element width of {} bytes is not supported", width);
  }

  auto check = [&](const char *name, int32_t size, int64_t nelem) {
    if (size != 0 && size != nelem * width) {
      throw make_error(ErrorKind::Format,
                       "TRR {} block of {} bytes, expected {} for {} byte "
                       "elements",
                       name, size, nelem * width, width);
    }
  };
  check("box", hdr.box_size, 9);
  check("virial", hdr.vir_size, 9);
  check("pressure", hdr.pres_size, 9);
  check("coordinate", hdr.x_size, nvec);
  check("velocity", hdr.v_size, nvec);
  check("force", hdr.f_size, nvec);
  return width;
}

bool TRRFrameCodec::read_header(XDRFile &in, TRRHeader &hdr) {
  if (in.at_eof()) {
    return false;
  }
  auto offset = in.tell();
  int32_t magic = in.read_int();
  if (magic != trr_magic) {
    throw make_error(ErrorKind::Format,
                     "bad TRR magic number {} at offset {} in '{}'", magic,
                     offset, in.path());
  }
  int32_t slen = in.read_int();
  std::string version = in.read_string(128);
  if (slen != trr_version_len || version != trr_version) {
    throw make_error(ErrorKind::Format,
                     "bad TRR version string '{}' at offset {} in '{}'",
                     version, offset, in.path());
  }

  int32_t *sizes[] = {&hdr.ir_size,  &hdr.e_size,   &hdr.box_size,
                      &hdr.vir_size, &hdr.pres_size, &hdr.top_size,
                      &hdr.sym_size, &hdr.x_size,   &hdr.v_size,
                      &hdr.f_size};
  for (auto size : sizes) {
    *size = in.read_int();
    if (*size < 0) {
      throw make_error(ErrorKind::Format,
                       "negative block size {} at offset {} in '{}'", *size,
                       offset, in.path());
    }
  }
  int32_t natoms = in.read_int();
  if (natoms < 0) {
    throw make_error(ErrorKind::Format,
                     "negative atom count {} at offset {} in '{}'", natoms,
                     offset, in.path());
  }
  hdr.natoms = static_cast<uint32_t>(natoms);
  hdr.step = in.read_int();
  hdr.nre = in.read_int();
  if (hdr.natoms > 0 && !hdr.x_size && !hdr.v_size && !hdr.f_size) {
    throw make_error(ErrorKind::Format,
                     "TRR frame of {} atoms without coordinates, velocities "
                     "or forces at offset {} in '{}'",
                     hdr.natoms, offset, in.path());
  }

  if (hdr.ir_size || hdr.e_size || hdr.top_size || hdr.sym_size) {
    log::warning("ignoring input record, energy, topology and symmetry "
                 "sizes of the TRR frame at offset {} in '{}'",
                 offset, in.path());
  }

  if (trr_element_width(hdr) == 8) {
    hdr.precision = TRRPrecision::Double;
    hdr.time = in.read_double();
    hdr.lambda = in.read_double();
  } else {
    hdr.precision = TRRPrecision::Single;
    hdr.time = in.read_float();
    hdr.lambda = in.read_float();
  }
  return true;
}

void TRRFrameCodec::read_vectors(XDRFile &in, const TRRHeader &hdr,
                                 Vector3f *out, size_t count) {
  if (hdr.precision == TRRPrecision::Double) {
    dbuf.resize(count * 3);
    in.read_doubles(dbuf.data(), dbuf.size());
    for (size_t i = 0; i < count; i++) {
      out[i] = {static_cast<float>(dbuf[3 * i]),
                static_cast<float>(dbuf[3 * i + 1]),
                static_cast<float>(dbuf[3 * i + 2])};
    }
  } else {
    fbuf.resize(count * 3);
    in.read_floats(fbuf.data(), fbuf.size());
    for (size_t i = 0; i < count; i++) {
      out[i] = {fbuf[3 * i], fbuf[3 * i + 1], fbuf[3 * i + 2]};
    }
  }
}

bool TRRFrameCodec::read(XDRFile &in, Frame &frame) {
  TRRHeader hdr;
  if (!read_header(in, hdr)) {
    return false;
  }
  if (hdr.data_size() > in.remaining()) {
    throw make_error(ErrorKind::TruncatedInput,
                     "TRR frame of {} atoms needs {} more bytes, only {} "
                     "left in '{}'",
                     hdr.natoms, hdr.data_size(), in.remaining(), in.path());
  }

  frame.resize(hdr.natoms);
  frame.step = hdr.step;
  frame.time = static_cast<float>(hdr.time);
  frame.lambda = static_cast<float>(hdr.lambda);
  frame.has_box = hdr.box_size != 0;
  if (frame.has_box) {
    read_vectors(in, hdr, frame.box.data(), 3);
  } else {
    frame.box = Matrix3f{};
  }
  // virial and pressure are not kept
  in.skip(uint64_t(hdr.vir_size) + uint64_t(hdr.pres_size));

  auto &crds = frame.coords();
  if (hdr.x_size) {
    read_vectors(in, hdr, crds.data(), crds.size());
  } else {
    std::fill(crds.begin(), crds.end(), Vector3f{0.0f, 0.0f, 0.0f});
  }

  if (hdr.v_size) {
    frame.add_velocities();
    read_vectors(in, hdr, frame.velocities().data(), hdr.natoms);
  } else {
    frame.remove_velocities();
  }

  if (hdr.f_size) {
    frame.add_forces();
    read_vectors(in, hdr, frame.forces().data(), hdr.natoms);
  } else {
    frame.remove_forces();
  }
  return true;
}

bool TRRFrameCodec::skip(XDRFile &in, TRRHeader *hdr) {
  TRRHeader local;
  TRRHeader &h = hdr ? *hdr : local;
  if (!read_header(in, h)) {
    return false;
  }
  in.skip(h.data_size());
  return true;
}

void TRRFrameCodec::put_vectors(const Vector3f *values, size_t count,
                                bool dbl) {
  for (size_t i = 0; i < count; i++) {
    for (float v : values[i]) {
      if (dbl) {
        record.put_double(v);
      } else {
        record.put_float(v);
      }
    }
  }
}

void TRRFrameCodec::write(XDRFile &out, const Frame &frame,
                          TRRPrecision precision) {
  frame.check_consistency();
  if (frame.step < std::numeric_limits<int32_t>::min() ||
      frame.step > std::numeric_limits<int32_t>::max()) {
    throw make_error(ErrorKind::Usage,
                     "step {} does not fit in the 32 bit TRR step field",
                     frame.step);
  }
  const uint32_t natoms = frame.num_atoms();
  if (natoms > trr_max_atoms) {
    throw make_error(ErrorKind::Usage, "too many atoms for TRR: {}", natoms);
  }

  // A record without any block cannot carry its width, readers assume
  // single precision
  if (precision == TRRPrecision::Double && natoms == 0 && !frame.has_box) {
    log::debug("writing empty TRR frame at step {} in single precision",
               frame.step);
    precision = TRRPrecision::Single;
  }
  const bool dbl = precision == TRRPrecision::Double;
  const int width = dbl ? 8 : 4;
  const int64_t nvec = int64_t(natoms) * 3;

  record.clear();
  record.put_int(trr_magic);
  record.put_int(trr_version_len);
  record.put_string(trr_version);
  record.put_int(0);                                          // ir_size
  record.put_int(0);                                          // e_size
  record.put_int(frame.has_box ? block_size(9, width) : 0);   // box_size
  record.put_int(0);                                          // vir_size
  record.put_int(0);                                          // pres_size
  record.put_int(0);                                          // top_size
  record.put_int(0);                                          // sym_size
  record.put_int(block_size(nvec, width));                    // x_size
  record.put_int(frame.has_velocities() ? block_size(nvec, width) : 0);
  record.put_int(frame.has_forces() ? block_size(nvec, width) : 0);
  record.put_int(static_cast<int32_t>(natoms));
  record.put_int(static_cast<int32_t>(frame.step));
  record.put_int(0); // nre
  if (dbl) {
    record.put_double(frame.time);
    record.put_double(frame.lambda);
  } else {
    record.put_float(frame.time);
    record.put_float(frame.lambda);
  }

  if (frame.has_box) {
    put_vectors(frame.box.data(), 3, dbl);
  }
  put_vectors(frame.coords().data(), natoms, dbl);
  if (frame.has_velocities()) {
    put_vectors(frame.velocities().data(), natoms, dbl);
  }
  if (frame.has_forces()) {
    put_vectors(frame.forces().data(), natoms, dbl);
  }
  out.write_buffer(record);
}

} // namespace xdrtraj
