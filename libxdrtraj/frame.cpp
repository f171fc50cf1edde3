/*
 * Copyright (c) 2025
 * All rights reserved.
 *
 * Frame class - implementation file
 */

#include "frame.h"
#include "xdr_errors.h"

namespace xdrtraj {

namespace {

const Vector3f zero3 = {0.0f, 0.0f, 0.0f};

std::vector<Vector3f> pick(const std::vector<Vector3f> &src,
                           const std::vector<size_t> &indices) {
  std::vector<Vector3f> out;
  out.reserve(indices.size());
  for (auto idx : indices) {
    out.push_back(src[idx]);
  }
  return out;
}

} // namespace

Frame::Frame(uint32_t natoms) : crds(natoms, zero3) {}

void Frame::resize(uint32_t natoms) {
  if (natoms == crds.size()) {
    return;
  }
  crds.resize(natoms, zero3);
  if (bvel) {
    vels.resize(natoms, zero3);
  }
  if (bfrc) {
    frcs.resize(natoms, zero3);
  }
}

std::vector<Vector3f> &Frame::velocities() {
  if (!bvel) {
    throw make_error(ErrorKind::Usage, "frame has no velocities");
  }
  return vels;
}

const std::vector<Vector3f> &Frame::velocities() const {
  if (!bvel) {
    throw make_error(ErrorKind::Usage, "frame has no velocities");
  }
  return vels;
}

void Frame::add_velocities() {
  if (!bvel) {
    vels.assign(crds.size(), zero3);
    bvel = true;
  }
}

void Frame::remove_velocities() {
  vels.clear();
  vels.shrink_to_fit();
  bvel = false;
}

std::vector<Vector3f> &Frame::forces() {
  if (!bfrc) {
    throw make_error(ErrorKind::Usage, "frame has no forces");
  }
  return frcs;
}

const std::vector<Vector3f> &Frame::forces() const {
  if (!bfrc) {
    throw make_error(ErrorKind::Usage, "frame has no forces");
  }
  return frcs;
}

void Frame::add_forces() {
  if (!bfrc) {
    frcs.assign(crds.size(), zero3);
    bfrc = true;
  }
}

void Frame::remove_forces() {
  frcs.clear();
  frcs.shrink_to_fit();
  bfrc = false;
}

void Frame::filter(const std::vector<size_t> &indices) {
  for (auto idx : indices) {
    if (idx >= crds.size()) {
      throw make_error(ErrorKind::Usage,
                       "atom index {} out of range for a frame of {} atoms",
                       idx, crds.size());
    }
  }
  crds = pick(crds, indices);
  if (bvel) {
    vels = pick(vels, indices);
  }
  if (bfrc) {
    frcs = pick(frcs, indices);
  }
}

void Frame::check_consistency() const {
  if (bvel && vels.size() != crds.size()) {
    throw make_error(ErrorKind::Usage,
                     "frame has {} velocities for {} atoms", vels.size(),
                     crds.size());
  }
  if (bfrc && frcs.size() != crds.size()) {
    throw make_error(ErrorKind::Usage, "frame has {} forces for {} atoms",
                     frcs.size(), crds.size());
  }
}

} // namespace xdrtraj
