/*
 * Copyright (c) 2020, Nikolay A. Krylov
 * Copyright (c) 2025
 * All rights reserved.
 *
 * Trajectory handles - header file
 */

#ifndef XDRTRAJ_TRAJECTORY_H
#define XDRTRAJ_TRAJECTORY_H

#include "frame.h"
#include "trr_frame.h"
#include "xdr_file.h"
#include "xtc_frame.h"
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iterator>
#include <memory>
#include <optional>
#include <string>

namespace xdrtraj {

enum class TrajectoryFormat { XTC, TRR };

const char *to_string(TrajectoryFormat format);

class FrameRange;

// Common interface of XTC and TRR trajectory files. A trajectory owns its
// file; it is closed on destruction.
class Trajectory {
public:
  virtual ~Trajectory() = default;

  Trajectory(const Trajectory &) = delete;
  Trajectory &operator=(const Trajectory &) = delete;

  virtual TrajectoryFormat format() const = 0;

  // Read the next frame into `frame`, resizing it when needed.
  // Returns false at the end of the trajectory.
  bool read(Frame &frame);

  // Move past the next frame without decoding it.
  // Returns false at the end of the trajectory.
  bool skip();

  void write(const Frame &frame);

  // Atom count of the first frame of the file, whatever frame the handle is
  // at. In read and append mode the first frame header is peeked without
  // moving the current position.
  uint32_t num_atoms();

  void flush();
  uint64_t tell();
  void seek(uint64_t offset);
  void close();

  bool is_open() const { return file.is_open(); }
  FileMode mode() const { return file.mode(); }
  const std::string &path() const { return file.path(); }

  // Lazy single pass range over the remaining frames, see FrameRange
  FrameRange frames();

protected:
  Trajectory(const std::string &fname, FileMode mode, int32_t magic);
  Trajectory(Trajectory &&) = default;

  virtual bool read_frame(Frame &frame) = 0;
  virtual bool skip_frame(uint32_t &natoms) = 0;
  virtual void write_frame(const Frame &frame) = 0;

  // Parse the header of the record at the position of `in`
  virtual bool peek_atoms(XDRFile &in, uint32_t &natoms) = 0;

  XDRFile file;

private:
  void check_readable(const char *op) const;
  void check_writable(const char *op) const;
  void check_magic(XDRFile &in, int32_t magic) const;
  uint32_t peek_num_atoms(XDRFile &in);
  void track_atoms(uint32_t natoms);

  std::optional<uint32_t> natoms_first;
  std::optional<uint32_t> natoms_last;
};

class XTCTrajectory : public Trajectory {
public:
  XTCTrajectory(const std::string &fname, FileMode mode,
                float precision = xtc_default_precision);
  XTCTrajectory(XTCTrajectory &&) = default;

  static XTCTrajectory open_read(const std::string &fname);
  static XTCTrajectory open_write(const std::string &fname,
                                  float precision = xtc_default_precision);
  static XTCTrajectory open_append(const std::string &fname,
                                   float precision = xtc_default_precision);

  TrajectoryFormat format() const override { return TrajectoryFormat::XTC; }

  // Precision used to compress the frames written from now on
  float precision() const { return prec; }
  void set_precision(float precision);

  // Compression parameters of the last frame read or written
  const CompressionParameters &last_parameters() const {
    return codec.last_parameters();
  }

protected:
  bool read_frame(Frame &frame) override;
  bool skip_frame(uint32_t &natoms) override;
  void write_frame(const Frame &frame) override;
  bool peek_atoms(XDRFile &in, uint32_t &natoms) override;

private:
  XTCFrameCodec codec;
  float prec;
};

class TRRTrajectory : public Trajectory {
public:
  TRRTrajectory(const std::string &fname, FileMode mode,
                TRRPrecision precision = TRRPrecision::Single);
  TRRTrajectory(TRRTrajectory &&) = default;

  static TRRTrajectory open_read(const std::string &fname);
  static TRRTrajectory open_write(const std::string &fname,
                                  TRRPrecision precision = TRRPrecision::Single);
  static TRRTrajectory
  open_append(const std::string &fname,
              TRRPrecision precision = TRRPrecision::Single);

  TrajectoryFormat format() const override { return TrajectoryFormat::TRR; }

  // Width of the frames written from now on
  TRRPrecision precision() const { return prec; }
  void set_precision(TRRPrecision precision) { prec = precision; }

protected:
  bool read_frame(Frame &frame) override;
  bool skip_frame(uint32_t &natoms) override;
  void write_frame(const Frame &frame) override;
  bool peek_atoms(XDRFile &in, uint32_t &natoms) override;

private:
  TRRFrameCodec codec;
  TRRPrecision prec;
};

// Open an XTC or TRR trajectory depending on the extension of fname
std::unique_ptr<Trajectory> open_trajectory(const std::string &fname,
                                            FileMode mode);

// Single pass range over the frames of a trajectory, from its current
// position to its end.
//
// All iterators of a range share one Frame owned by the range. The reference
// obtained from an iterator is only valid until the iterator is advanced:
// after that it shows the data of the next frame. Copy the frame to keep it.
//
// If reading a frame fails, the error becomes the last element: the
// dereference rethrows it and the next increment ends the iteration.
//
// The range must not outlive its trajectory, and begin() may only be called
// once.
class FrameRange {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Frame;
    using difference_type = std::ptrdiff_t;
    using pointer = Frame *;
    using reference = Frame &;

    iterator() = default;

    reference operator*() const;
    pointer operator->() const { return &**this; }
    iterator &operator++();

    bool operator==(const iterator &other) const {
      return at_end() == other.at_end();
    }
    bool operator!=(const iterator &other) const { return !(*this == other); }

  private:
    friend class FrameRange;
    explicit iterator(FrameRange *r) : range(r) {}
    bool at_end() const { return range == nullptr || range->done; }

    FrameRange *range = nullptr;
  };

  FrameRange(const FrameRange &) = delete;
  FrameRange &operator=(const FrameRange &) = delete;

  iterator begin();
  iterator end() { return iterator(); }

private:
  friend class Trajectory;
  explicit FrameRange(Trajectory &traj);
  void advance();

  Trajectory &traj;
  Frame frame;
  std::exception_ptr error;
  bool started = false;
  bool done = false;
};

} // namespace xdrtraj

#endif // XDRTRAJ_TRAJECTORY_H
