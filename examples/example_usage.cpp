/*
 * Example usage of the libxdrtraj trajectory classes
 */

#include "libxdrtraj/trajectory.h"
#include "libxdrtraj/xdr_errors.h"
#include <cmath>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;
using namespace xdrtraj;

namespace {

// Atoms moving on a circle in a cubic 5 nm box
void fill_frame(Frame &frame, uint32_t iframe) {
  const float pi = 3.14159265f;
  float time = iframe * 2.0f; // 2 ps between frames
  frame.step = iframe * 1000;
  frame.time = time;
  frame.box = {{{5.0f, 0.0f, 0.0f}, {0.0f, 5.0f, 0.0f}, {0.0f, 0.0f, 5.0f}}};

  auto &crds = frame.coords();
  const auto natoms = static_cast<uint32_t>(crds.size());
  for (uint32_t i = 0; i < natoms; i++) {
    float angle = 2.0f * pi * i / natoms + 0.01f * time;
    float radius = 2.0f;
    crds[i] = {2.5f + radius * std::cos(angle), 2.5f + radius * std::sin(angle),
               2.5f + 0.1f * std::sin(time)};
  }
  if (frame.has_velocities()) {
    for (uint32_t i = 0; i < natoms; i++) {
      float angle = 2.0f * pi * i / natoms + 0.01f * time;
      frame.velocities()[i] = {-0.02f * std::sin(angle), 0.02f * std::cos(angle),
                               0.0f};
    }
  }
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    fs::path outdir = argc > 1 ? fs::path(argv[1]) : fs::temp_directory_path();
    fs::path xtc_file = outdir / "xdrtraj_example.xtc";
    fs::path trr_file = outdir / "xdrtraj_example.trr";

    const uint32_t natoms = 1000;
    const uint32_t nframes = 100;

    // Example 1: Write XTC
    std::cout << "=== Example 1: Write XTC ===" << std::endl;
    {
      auto writer = XTCTrajectory::open_write(xtc_file.string(), 1000.0f);
      Frame frame(natoms);
      for (uint32_t i = 0; i < nframes; i++) {
        fill_frame(frame, i);
        writer.write(frame);
      }
      writer.flush();
      std::cout << "Written " << nframes << " frames of " << natoms
                << " atoms, " << writer.tell() << " bytes" << std::endl;
    }

    // Example 2: Read all frames, reusing one frame buffer
    std::cout << "\n=== Example 2: Reading all frames ===" << std::endl;
    auto reader = XTCTrajectory::open_read(xtc_file.string());
    std::cout << "Number of atoms: " << reader.num_atoms() << std::endl;

    Frame frame(reader.num_atoms());
    int frame_count = 0;
    while (reader.read(frame)) {
      if (frame_count % 25 == 0) {
        const auto &first = frame.coords()[0];
        std::cout << "Frame " << frame_count << ", Time: " << frame.time
                  << " ps, Box: [" << frame.box[0][0] << ", "
                  << frame.box[1][1] << ", " << frame.box[2][2] << "]"
                  << ", First atom: [" << first[0] << ", " << first[1] << ", "
                  << first[2] << "]" << std::endl;
      }
      frame_count++;
    }
    std::cout << "Total frames read: " << frame_count << std::endl;

    // Example 3: Fast header scanning
    std::cout << "\n=== Example 3: Fast header scanning ===" << std::endl;
    reader.seek(0);
    frame_count = 0;
    while (reader.skip()) {
      frame_count++;
    }
    std::cout << "Scanned " << frame_count << " frames" << std::endl;

    // Example 4: RMSD between the first and the last frame
    std::cout << "\n=== Example 4: Computing with coordinates ===" << std::endl;
    auto scan = XTCTrajectory::open_read(xtc_file.string());
    Frame ref;
    double rmsd = 0.0;
    for (const Frame &cur : scan.frames()) {
      if (ref.size() == 0) {
        ref = cur; // the range reuses its frame, keep a copy
        continue;
      }
      double sum_sq = 0.0;
      for (size_t i = 0; i < cur.size(); i++) {
        for (int d = 0; d < 3; d++) {
          double diff = cur.coords()[i][d] - ref.coords()[i][d];
          sum_sq += diff * diff;
        }
      }
      rmsd = std::sqrt(sum_sq / cur.size());
    }
    std::cout << "RMSD between first and last frame: " << rmsd << " nm"
              << std::endl;

    // Example 5: Lossless TRR with velocities, in double precision
    std::cout << "\n=== Example 5: Write and read TRR ===" << std::endl;
    {
      auto writer =
          TRRTrajectory::open_write(trr_file.string(), TRRPrecision::Double);
      Frame out(natoms);
      out.add_velocities();
      for (uint32_t i = 0; i < 10; i++) {
        fill_frame(out, i);
        writer.write(out);
      }
    }
    auto trr = open_trajectory(trr_file.string(), FileMode::Read);
    Frame in;
    frame_count = 0;
    while (trr->read(in)) {
      frame_count++;
    }
    std::cout << "Read " << frame_count << " " << to_string(trr->format())
              << " frames, velocities: " << std::boolalpha
              << in.has_velocities() << std::endl;

  } catch (const Error &e) {
    std::cerr << "Error (" << to_string(e.kind()) << "): " << e.what()
              << std::endl;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
