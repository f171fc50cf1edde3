/*
 * Copyright (c) 2020, Nikolay A. Krylov
 * Copyright (c) 2025
 * All rights reserved.
 *
 * Trajectory handles - implementation file
 */

#include "trajectory.h"
#include "xdr_errors.h"
#include "xdr_log.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>

namespace xdrtraj {

namespace fs = std::filesystem;

const char *to_string(TrajectoryFormat format) {
  return format == TrajectoryFormat::XTC ? "XTC" : "TRR";
}

// Trajectory

Trajectory::Trajectory(const std::string &fname, FileMode mode, int32_t magic)
    : file(fname, mode) {
  if (mode == FileMode::Read) {
    check_magic(file, magic);
  } else if (mode == FileMode::Append) {
    XDRFile in(fname, FileMode::Read);
    check_magic(in, magic);
  }
}

void Trajectory::check_magic(XDRFile &in, int32_t magic) const {
  auto size = in.size();
  if (size == 0) {
    return;
  }
  if (size < 4) {
    throw make_error(ErrorKind::Format,
                     "'{}' is too short to hold a trajectory frame",
                     in.path());
  }
  int32_t first = in.read_int();
  in.seek(0);
  if (first != magic) {
    throw make_error(ErrorKind::Format,
                     "'{}' does not start with the magic number {} (found {})",
                     in.path(), magic, first);
  }
}

void Trajectory::check_readable(const char *op) const {
  if (!file.is_open()) {
    throw make_error(ErrorKind::Usage, "cannot {} '{}': file is closed", op,
                     file.path());
  }
  if (file.mode() != FileMode::Read) {
    throw make_error(ErrorKind::Usage, "cannot {} '{}' opened in {} mode", op,
                     file.path(), to_string(file.mode()));
  }
}

void Trajectory::check_writable(const char *op) const {
  if (!file.is_open()) {
    throw make_error(ErrorKind::Usage, "cannot {} '{}': file is closed", op,
                     file.path());
  }
  if (file.mode() == FileMode::Read) {
    throw make_error(ErrorKind::Usage, "cannot {} '{}' opened in {} mode", op,
                     file.path(), to_string(file.mode()));
  }
}

void Trajectory::track_atoms(uint32_t natoms) {
  // only a new file is known to start with this frame, otherwise
  // num_atoms() peeks the first record
  if (!natoms_first && file.mode() == FileMode::Write) {
    natoms_first = natoms;
  }
  if (natoms_last && *natoms_last != natoms) {
    log::debug("atom count changed from {} to {} in '{}'", *natoms_last,
               natoms, file.path());
  }
  natoms_last = natoms;
}

bool Trajectory::read(Frame &frame) {
  check_readable("read from");
  if (!read_frame(frame)) {
    return false;
  }
  track_atoms(frame.num_atoms());
  return true;
}

bool Trajectory::skip() {
  check_readable("skip in");
  uint32_t natoms = 0;
  if (!skip_frame(natoms)) {
    return false;
  }
  track_atoms(natoms);
  return true;
}

void Trajectory::write(const Frame &frame) {
  check_writable("write to");
  write_frame(frame);
  track_atoms(frame.num_atoms());
}

uint32_t Trajectory::peek_num_atoms(XDRFile &in) {
  uint32_t natoms = 0;
  bool found = false;
  try {
    found = peek_atoms(in, natoms);
  } catch (const Error &e) {
    if (e.kind() != ErrorKind::TruncatedInput) {
      throw;
    }
    throw make_error(ErrorKind::Format,
                     "cannot read the atom count of '{}': {}", in.path(),
                     e.what());
  }
  if (!found) {
    throw make_error(ErrorKind::Format,
                     "cannot read the atom count of '{}': no frame", in.path());
  }
  return natoms;
}

uint32_t Trajectory::num_atoms() {
  if (natoms_first) {
    return *natoms_first;
  }
  if (!file.is_open()) {
    throw make_error(ErrorKind::Usage, "'{}' is closed", file.path());
  }

  switch (file.mode()) {
  case FileMode::Read: {
    auto pos = file.tell();
    file.seek(0);
    try {
      natoms_first = peek_num_atoms(file);
    } catch (const Error &) {
      file.seek(pos);
      throw;
    }
    file.seek(pos);
    break;
  }
  case FileMode::Append: {
    file.flush();
    XDRFile in(file.path(), FileMode::Read);
    natoms_first = peek_num_atoms(in);
    break;
  }
  case FileMode::Write:
    throw make_error(ErrorKind::Usage,
                     "no frame has been written to '{}' yet", file.path());
  }
  log::debug("'{}' holds {} atoms", file.path(), *natoms_first);
  return *natoms_first;
}

void Trajectory::flush() { file.flush(); }

uint64_t Trajectory::tell() { return file.tell(); }

void Trajectory::seek(uint64_t offset) { file.seek(offset); }

void Trajectory::close() { file.close(); }

FrameRange Trajectory::frames() {
  check_readable("iterate over");
  return FrameRange(*this);
}

// XTCTrajectory

XTCTrajectory::XTCTrajectory(const std::string &fname, FileMode mode,
                             float precision)
    : Trajectory(fname, mode, xtc_magic), prec(xtc_default_precision) {
  set_precision(precision);
}

XTCTrajectory XTCTrajectory::open_read(const std::string &fname) {
  return XTCTrajectory(fname, FileMode::Read);
}

XTCTrajectory XTCTrajectory::open_write(const std::string &fname,
                                        float precision) {
  return XTCTrajectory(fname, FileMode::Write, precision);
}

XTCTrajectory XTCTrajectory::open_append(const std::string &fname,
                                         float precision) {
  return XTCTrajectory(fname, FileMode::Append, precision);
}

void XTCTrajectory::set_precision(float precision) {
  if (!(precision > 0.0f) || !std::isfinite(precision)) {
    throw make_error(ErrorKind::Usage, "invalid XTC precision {}", precision);
  }
  prec = precision;
}

bool XTCTrajectory::read_frame(Frame &frame) {
  return codec.read(file, frame);
}

bool XTCTrajectory::skip_frame(uint32_t &natoms) {
  XTCHeader hdr;
  if (!codec.skip(file, &hdr)) {
    return false;
  }
  natoms = hdr.natoms;
  return true;
}

void XTCTrajectory::write_frame(const Frame &frame) {
  codec.write(file, frame, prec);
}

bool XTCTrajectory::peek_atoms(XDRFile &in, uint32_t &natoms) {
  XTCHeader hdr;
  if (!codec.read_header(in, hdr)) {
    return false;
  }
  natoms = hdr.natoms;
  return true;
}

// TRRTrajectory

TRRTrajectory::TRRTrajectory(const std::string &fname, FileMode mode,
                             TRRPrecision precision)
    : Trajectory(fname, mode, trr_magic), prec(precision) {}

TRRTrajectory TRRTrajectory::open_read(const std::string &fname) {
  return TRRTrajectory(fname, FileMode::Read);
}

TRRTrajectory TRRTrajectory::open_write(const std::string &fname,
                                        TRRPrecision precision) {
  return TRRTrajectory(fname, FileMode::Write, precision);
}

TRRTrajectory TRRTrajectory::open_append(const std::string &fname,
                                         TRRPrecision precision) {
  return TRRTrajectory(fname, FileMode::Append, precision);
}

bool TRRTrajectory::read_frame(Frame &frame) {
  return codec.read(file, frame);
}

bool TRRTrajectory::skip_frame(uint32_t &natoms) {
  TRRHeader hdr;
  if (!codec.skip(file, &hdr)) {
    return false;
  }
  natoms = hdr.natoms;
  return true;
}

void TRRTrajectory::write_frame(const Frame &frame) {
  codec.write(file, frame, prec);
}

bool TRRTrajectory::peek_atoms(XDRFile &in, uint32_t &natoms) {
  TRRHeader hdr;
  if (!codec.read_header(in, hdr)) {
    return false;
  }
  natoms = hdr.natoms;
  return true;
}

std::unique_ptr<Trajectory> open_trajectory(const std::string &fname,
                                            FileMode mode) {
  std::string ext = fs::path(fname).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (ext == ".xtc") {
    return std::make_unique<XTCTrajectory>(fname, mode);
  }
  if (ext == ".trr") {
    return std::make_unique<TRRTrajectory>(fname, mode);
  }
  throw make_error(ErrorKind::Usage,
                   "cannot guess the trajectory format of '{}'", fname);
}

// FrameRange

// the frame is sized by its first read, an atom count taken from an
// unchecked header is not allocated up front
FrameRange::FrameRange(Trajectory &traj) : traj(traj) {}

void FrameRange::advance() {
  if (error) {
    // the error was the last element
    error = nullptr;
    done = true;
    return;
  }
  try {
    if (!traj.read(frame)) {
      done = true;
    }
  } catch (const Error &) {
    error = std::current_exception();
  }
}

FrameRange::iterator FrameRange::begin() {
  if (started) {
    throw make_error(ErrorKind::Usage,
                     "frames of '{}' can only be iterated once", traj.path());
  }
  started = true;
  advance();
  return iterator(this);
}

FrameRange::iterator::reference FrameRange::iterator::operator*() const {
  if (range->error) {
    std::rethrow_exception(range->error);
  }
  return range->frame;
}

FrameRange::iterator &FrameRange::iterator::operator++() {
  range->advance();
  return *this;
}

} // namespace xdrtraj
