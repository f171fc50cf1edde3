/*
 * Copyright (c) 2025
 * All rights reserved.
 *
 * Frame class - header file
 */

#ifndef XDRTRAJ_FRAME_H
#define XDRTRAJ_FRAME_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace xdrtraj {

using Vector3f = std::array<float, 3>;
using Matrix3f = std::array<std::array<float, 3>, 3>;

// One timestep of a trajectory. A frame is meant to be created once and then
// overwritten in place by successive reads: storage is only reallocated when
// the number of atoms changes.
//
// All present arrays (coordinates, and optionally velocities and forces)
// always hold exactly num_atoms() elements.
class Frame {
public:
  int64_t step = 0;
  float time = 0.0f;
  float lambda = 0.0f; // TRR only
  Matrix3f box{};      // Unit cell vectors [3x3]
  bool has_box = true; // TRR frames may omit the box

  Frame() = default;

  // Frame with zero-filled coordinates for natoms atoms
  explicit Frame(uint32_t natoms);

  uint32_t num_atoms() const { return static_cast<uint32_t>(crds.size()); }
  size_t size() const { return crds.size(); }

  // Resize every present array; no-op when natoms is unchanged
  void resize(uint32_t natoms);

  std::vector<Vector3f> &coords() { return crds; }
  const std::vector<Vector3f> &coords() const { return crds; }

  bool has_velocities() const { return bvel; }
  std::vector<Vector3f> &velocities();
  const std::vector<Vector3f> &velocities() const;
  void add_velocities();
  void remove_velocities();

  bool has_forces() const { return bfrc; }
  std::vector<Vector3f> &forces();
  const std::vector<Vector3f> &forces() const;
  void add_forces();
  void remove_forces();

  // Keep only the atoms at the given indices, in the given order
  void filter(const std::vector<size_t> &indices);

  // Throws ErrorKind::Usage if an array was resized behind the frame's back
  void check_consistency() const;

private:
  std::vector<Vector3f> crds;
  std::vector<Vector3f> vels;
  std::vector<Vector3f> frcs;
  bool bvel = false;
  bool bfrc = false;
};

} // namespace xdrtraj

#endif // XDRTRAJ_FRAME_H
