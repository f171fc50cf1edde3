/*
 * Copyright (c) 2025
 * All rights reserved.
 *
 * XDR primitive codec tests
 */

#include "libxdrtraj/xdr_file.h"
#include "test_utils.h"

#include <cmath>
#include <limits>

using namespace xdrtraj;
using xdrtraj::test::TempFile;

TEST(XDRBuffer, IntegersAreBigEndian) {
  XDRBuffer buf;
  buf.put_int(1995);
  buf.put_int(-2);
  buf.put_uint(0x01020304u);
  std::vector<uint8_t> expected = {0x00, 0x00, 0x07, 0xcb, 0xff, 0xff,
                                   0xff, 0xfe, 0x01, 0x02, 0x03, 0x04};
  EXPECT_EQ(buf.data(), expected);
}

TEST(XDRBuffer, FloatingPointIsBigEndianIEEE) {
  XDRBuffer buf;
  buf.put_float(1.0f);
  buf.put_double(-2.0);
  std::vector<uint8_t> expected = {0x3f, 0x80, 0x00, 0x00, 0xc0, 0x00,
                                   0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
  EXPECT_EQ(buf.data(), expected);
}

TEST(XDRBuffer, StringsAndOpaqueArePadded) {
  XDRBuffer buf;
  buf.put_string("GMX_trn_file");
  EXPECT_EQ(buf.size(), 16u);
  EXPECT_EQ(buf.data()[3], 12);

  buf.clear();
  const uint8_t bytes[] = {0xaa, 0xbb, 0xcc, 0xdd, 0xee};
  buf.put_opaque(bytes, 5);
  std::vector<uint8_t> expected = {0xaa, 0xbb, 0xcc, 0xdd,
                                   0xee, 0x00, 0x00, 0x00};
  EXPECT_EQ(buf.data(), expected);
}

TEST(XDRFile, WriteThenReadPrimitives) {
  TempFile tmp(".xdr");
  const uint8_t opaque[] = {1, 2, 3};
  const float floats[] = {0.5f, -1.25f, 3.0e-7f};
  const double doubles[] = {1.0 / 3.0, -1e300};
  {
    XDRFile out(tmp.path(), FileMode::Write);
    out.write_int(-42);
    out.write_uint(4000000000u);
    out.write_float(3.5f);
    out.write_double(std::numeric_limits<double>::min());
    out.write_string("hello");
    out.write_opaque(opaque, 3);
    out.write_floats(floats, 3);
    out.write_doubles(doubles, 2);
    EXPECT_EQ(out.tell(), 4u + 4 + 4 + 8 + 12 + 4 + 12 + 16);
  }

  XDRFile in(tmp.path(), FileMode::Read);
  EXPECT_EQ(in.read_int(), -42);
  EXPECT_EQ(in.read_uint(), 4000000000u);
  EXPECT_EQ(in.read_float(), 3.5f);
  EXPECT_EQ(in.read_double(), std::numeric_limits<double>::min());
  EXPECT_EQ(in.read_string(16), "hello");

  std::vector<uint8_t> got;
  in.read_opaque(got, 3);
  EXPECT_EQ(got, std::vector<uint8_t>({1, 2, 3}));

  float fl[3];
  in.read_floats(fl, 3);
  EXPECT_EQ(fl[0], floats[0]);
  EXPECT_EQ(fl[1], floats[1]);
  EXPECT_EQ(fl[2], floats[2]);

  double db[2];
  in.read_doubles(db, 2);
  EXPECT_EQ(db[0], doubles[0]);
  EXPECT_EQ(db[1], doubles[1]);
  EXPECT_TRUE(in.at_eof());
}

TEST(XDRFile, ShortReadIsTruncatedInput) {
  TempFile tmp(".xdr");
  tmp.write_bytes({0x00, 0x00});

  XDRFile in(tmp.path(), FileMode::Read);
  EXPECT_FALSE(in.at_eof());
  EXPECT_XDRTRAJ_ERROR(in.read_int(), ErrorKind::TruncatedInput);
}

TEST(XDRFile, SkipAndOpaqueCheckRemainingBytes) {
  TempFile tmp(".xdr");
  tmp.write_bytes(std::vector<uint8_t>(8, 0));

  XDRFile in(tmp.path(), FileMode::Read);
  EXPECT_EQ(in.remaining(), 8u);
  in.skip(4);
  EXPECT_EQ(in.tell(), 4u);
  EXPECT_XDRTRAJ_ERROR(in.skip(5), ErrorKind::TruncatedInput);

  std::vector<uint8_t> out;
  EXPECT_XDRTRAJ_ERROR(in.read_opaque(out, 5), ErrorKind::TruncatedInput);
}

TEST(XDRFile, EmptyFileIsAtEof) {
  TempFile tmp(".xdr");
  tmp.write_bytes({});

  XDRFile in(tmp.path(), FileMode::Read);
  EXPECT_EQ(in.size(), 0u);
  EXPECT_TRUE(in.at_eof());
  // the query does not break later seeks
  in.seek(0);
  EXPECT_EQ(in.tell(), 0u);
}

TEST(XDRFile, OverlongStringIsFormatError) {
  TempFile tmp(".xdr");
  {
    XDRFile out(tmp.path(), FileMode::Write);
    out.write_string("a string that is too long");
  }
  XDRFile in(tmp.path(), FileMode::Read);
  EXPECT_XDRTRAJ_ERROR(in.read_string(8), ErrorKind::Format);
}

TEST(XDRFile, MissingFileIsIoError) {
  TempFile tmp(".xdr");
  EXPECT_XDRTRAJ_ERROR(XDRFile(tmp.path(), FileMode::Read), ErrorKind::Io);
}

TEST(XDRFile, AppendWritesAfterExistingData) {
  TempFile tmp(".xdr");
  {
    XDRFile out(tmp.path(), FileMode::Write);
    out.write_int(1);
  }
  {
    XDRFile out(tmp.path(), FileMode::Append);
    out.write_int(2);
  }
  XDRFile in(tmp.path(), FileMode::Read);
  EXPECT_EQ(in.read_int(), 1);
  EXPECT_EQ(in.read_int(), 2);
  EXPECT_TRUE(in.at_eof());
}

TEST(XDRFile, ClosedFileIsUsageError) {
  TempFile tmp(".xdr");
  XDRFile out(tmp.path(), FileMode::Write);
  out.write_int(7);
  out.close();
  EXPECT_FALSE(out.is_open());
  EXPECT_XDRTRAJ_ERROR(out.write_int(8), ErrorKind::Usage);
  EXPECT_XDRTRAJ_ERROR(out.tell(), ErrorKind::Usage);
  EXPECT_EQ(tmp.size(), 4u);
}
