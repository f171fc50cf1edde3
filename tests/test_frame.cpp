/*
 * Copyright (c) 2025
 * All rights reserved.
 *
 * Frame tests
 */

#include "libxdrtraj/frame.h"
#include "test_utils.h"

using namespace xdrtraj;

TEST(Frame, DefaultIsEmpty) {
  Frame frame;
  EXPECT_EQ(frame.num_atoms(), 0u);
  EXPECT_EQ(frame.size(), 0u);
  EXPECT_FALSE(frame.has_velocities());
  EXPECT_FALSE(frame.has_forces());
  EXPECT_TRUE(frame.has_box);
}

TEST(Frame, SizedFrameIsZeroFilled) {
  Frame frame(4);
  EXPECT_EQ(frame.num_atoms(), 4u);
  for (const auto &xyz : frame.coords()) {
    EXPECT_EQ(xyz, (Vector3f{0.0f, 0.0f, 0.0f}));
  }
}

TEST(Frame, ResizeKeepsStorageWhenUnchanged) {
  Frame frame(10);
  const Vector3f *before = frame.coords().data();
  frame.coords()[3] = {1.0f, 2.0f, 3.0f};
  frame.resize(10);
  EXPECT_EQ(frame.coords().data(), before);
  EXPECT_EQ(frame.coords()[3], (Vector3f{1.0f, 2.0f, 3.0f}));
}

TEST(Frame, ResizeFollowsOptionalArrays) {
  Frame frame(2);
  frame.add_velocities();
  frame.resize(5);
  EXPECT_EQ(frame.coords().size(), 5u);
  EXPECT_EQ(frame.velocities().size(), 5u);
  EXPECT_FALSE(frame.has_forces());

  frame.add_forces();
  EXPECT_EQ(frame.forces().size(), 5u);
  frame.resize(1);
  EXPECT_EQ(frame.velocities().size(), 1u);
  EXPECT_EQ(frame.forces().size(), 1u);
}

TEST(Frame, RemovedArraysAreNotAccessible) {
  Frame frame(3);
  frame.add_velocities();
  frame.velocities()[0] = {1.0f, 1.0f, 1.0f};
  frame.remove_velocities();
  EXPECT_FALSE(frame.has_velocities());
  EXPECT_XDRTRAJ_ERROR(frame.velocities(), ErrorKind::Usage);
  EXPECT_XDRTRAJ_ERROR(frame.forces(), ErrorKind::Usage);

  // added again, zero filled
  frame.add_velocities();
  EXPECT_EQ(frame.velocities()[0], (Vector3f{0.0f, 0.0f, 0.0f}));
}

TEST(Frame, FilterKeepsSelectedAtomsInOrder) {
  Frame frame(4);
  frame.add_forces();
  for (uint32_t i = 0; i < 4; i++) {
    frame.coords()[i] = {float(i), 0.0f, 0.0f};
    frame.forces()[i] = {0.0f, float(i), 0.0f};
  }
  frame.filter({3, 1});
  ASSERT_EQ(frame.num_atoms(), 2u);
  EXPECT_EQ(frame.coords()[0][0], 3.0f);
  EXPECT_EQ(frame.coords()[1][0], 1.0f);
  EXPECT_EQ(frame.forces()[0][1], 3.0f);
  EXPECT_EQ(frame.forces()[1][1], 1.0f);
}

TEST(Frame, FilterRejectsBadIndex) {
  Frame frame(2);
  EXPECT_XDRTRAJ_ERROR(frame.filter({0, 2}), ErrorKind::Usage);
  EXPECT_EQ(frame.num_atoms(), 2u);
}

TEST(Frame, InconsistentArraysAreDetected) {
  Frame frame(3);
  frame.add_velocities();
  EXPECT_NO_THROW(frame.check_consistency());
  frame.velocities().pop_back();
  EXPECT_XDRTRAJ_ERROR(frame.check_consistency(), ErrorKind::Usage);
}
