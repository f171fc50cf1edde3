/*
 * Copyright (c) 2009-2014, Erik Lindahl & David van der Spoel
 * Copyright (c) 2016-2020, Nikolay A. Krylov
 * Copyright (c) 2025
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * 1. Redistributions of source code must retain the above copyright notice, this
 * list of conditions and the following disclaimer.
 *
 * 2. Redistributions in binary form must reproduce the above copyright notice,
 * this list of conditions and the following disclaimer in the documentation
 * and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
 * FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
 * DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
 * SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
 * CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
 * OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
 * OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#include "xtc_compress.h"
#include "xdr_errors.h"
#include "xdr_file.h"
#include "xdr_log.h"
#include <algorithm>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace xdrtraj {

namespace {

const int magicints[] = {
    0,        0,        0,       0,       0,       0,       0,       0,
    0,        8,        10,      12,      16,      20,      25,      32,
    40,       50,       64,      80,      101,     128,     161,     203,
    256,      322,      406,     512,     645,     812,     1024,    1290,
    1625,     2048,     2580,    3250,    4096,    5060,    6501,    8192,
    10321,    13003,    16384,   20642,   26007,   32768,   41285,   52015,
    65536,    82570,    104031,  131072,  165140,  208063,  262144,  330280,
    416127,   524287,   660561,  832255,  1048576, 1321122, 1664510, 2097152,
    2642245,  3329021,  4194304, 5284491, 6658042, 8388607, 10568983,
    13316085, 16777216};

const int FIRSTIDX = 9;
/* note that magicints[FIRSTIDX-1] == 0 */
const int LASTIDX = (sizeof(magicints) / sizeof(*magicints));

// Largest scaled coordinate magnitude that still leaves room for the deltas
const double MAXABS = INT_MAX - 2;

// Above this range on any axis every axis gets its own bit width
const unsigned int LARGE_RANGE = 0xffffff;

/*
 * sizeofint - calculate smallest number of bits necessary
 * to represent a certain integer.
 */
int sizeofint(unsigned int size) {
  unsigned int num = 1;
  int num_of_bits = 0;

  while (size >= num && num_of_bits < 32) {
    num_of_bits++;
    num <<= 1;
  }
  return num_of_bits;
}

/*
 * sizeofints - calculate 'bitsize' of compressed ints
 *
 * given a number of small unsigned integers and the maximum value
 * return the number of bits needed to read or write them with the
 * routines encodeints/decodeints.
 */
int sizeofints(int num_of_ints, const unsigned int sizes[]) {
  unsigned int bytes[32] = {0};
  unsigned int num_of_bytes = 1, num_of_bits = 0, bytecnt, tmp;
  bytes[0] = 1;
  for (int i = 0; i < num_of_ints; i++) {
    tmp = 0;
    for (bytecnt = 0; bytecnt < num_of_bytes; bytecnt++) {
      tmp = bytes[bytecnt] * sizes[i] + tmp;
      bytes[bytecnt] = tmp & 0xff;
      tmp >>= 8;
    }
    while (tmp != 0) {
      bytes[bytecnt++] = tmp & 0xff;
      tmp >>= 8;
    }
    num_of_bytes = bytecnt;
  }
  unsigned int num = 1;
  num_of_bytes--;
  while (bytes[num_of_bytes] >= num) {
    num_of_bits++;
    num *= 2;
  }
  return static_cast<int>(num_of_bits + num_of_bytes * 8);
}

// MSB-first bit packer appending to a byte vector
class bit_writer {
public:
  explicit bit_writer(std::vector<uint8_t> &out) : out(out) {}

  // write the low nbits (<= 32) of value
  void write_bits(uint32_t value, int nbits) {
    if (nbits <= 0) {
      return;
    }
    if (nbits < 32) {
      value &= (uint32_t(1) << nbits) - 1;
    }
    acc = (acc << nbits) | value;
    nacc += nbits;
    while (nacc >= 8) {
      nacc -= 8;
      out.push_back(static_cast<uint8_t>(acc >> nacc));
    }
    acc &= (uint64_t(1) << nacc) - 1;
  }

  void write_zeros(int nbits) {
    while (nbits > 32) {
      write_bits(0, 32);
      nbits -= 32;
    }
    write_bits(0, nbits);
  }

  // pad the last partial byte with zero bits
  void flush() {
    if (nacc > 0) {
      out.push_back(static_cast<uint8_t>(acc << (8 - nacc)));
      acc = 0;
      nacc = 0;
    }
  }

private:
  std::vector<uint8_t> &out;
  uint64_t acc = 0;
  int nacc = 0;
};

// MSB-first bit reader bounded by the declared byte count
class bit_reader {
public:
  bit_reader(const uint8_t *d, size_t n) : data(d), nbytes(n) {}

  // read up to 32 bits
  uint32_t read_bits(int nbits) {
    if (nbits <= 0) {
      return 0;
    }
    while (nacc < nbits) {
      if (pos >= nbytes) {
        throw make_error(ErrorKind::CorruptFrame,
                         "compressed coordinates end after {} bytes", nbytes);
      }
      acc = (acc << 8) | data[pos++];
      nacc += 8;
    }
    nacc -= nbits;
    auto value = static_cast<uint32_t>((acc >> nacc) &
                                       ((uint64_t(1) << nbits) - 1));
    acc &= (uint64_t(1) << nacc) - 1;
    return value;
  }

private:
  const uint8_t *data;
  size_t nbytes;
  size_t pos = 0;
  uint64_t acc = 0;
  int nacc = 0;
};

/*
 * encodeints - encode a small set of small integers in compressed format
 *
 * this routine is used internally by compress_coords to encode a set of
 * three small integers as one mixed-radix number. The bytes of that number
 * are written least significant first, each byte most significant bit
 * first, and the last byte only with the bits left in num_of_bits.
 */
void encodeints(bit_writer &bw, int num_of_bits, const unsigned int sizes[3],
                const unsigned int nums[3]) {
  unsigned int bytes[32];
  unsigned int num_of_bytes = 0, bytecnt, tmp;

  tmp = nums[0];
  do {
    bytes[num_of_bytes++] = tmp & 0xff;
    tmp >>= 8;
  } while (tmp != 0);

  for (int i = 1; i < 3; i++) {
    tmp = nums[i];
    for (bytecnt = 0; bytecnt < num_of_bytes; bytecnt++) {
      tmp = bytes[bytecnt] * sizes[i] + tmp;
      bytes[bytecnt] = tmp & 0xff;
      tmp >>= 8;
    }
    while (tmp != 0) {
      bytes[bytecnt++] = tmp & 0xff;
      tmp >>= 8;
    }
    num_of_bytes = bytecnt;
  }

  auto full_bits = static_cast<int>(num_of_bytes * 8);
  if (num_of_bits >= full_bits) {
    for (unsigned int i = 0; i < num_of_bytes; i++) {
      bw.write_bits(bytes[i], 8);
    }
    bw.write_zeros(num_of_bits - full_bits);
  } else {
    unsigned int i = 0;
    for (; i < num_of_bytes - 1; i++) {
      bw.write_bits(bytes[i], 8);
    }
    bw.write_bits(bytes[i], num_of_bits - static_cast<int>(i * 8));
  }
}

/*
 * decodeints - decode 'small' integers from the bit stream
 *
 * inverse of encodeints: the remainders of successive divisions by sizes[]
 * give the three integers.
 */
void decodeints(bit_reader &br, int num_of_bits, const unsigned int sizes[3],
                int32_t nums[3]) {
  unsigned int bytes[32] = {0};
  int num_of_bytes = 0;

  while (num_of_bits > 8) {
    bytes[num_of_bytes++] = br.read_bits(8);
    num_of_bits -= 8;
  }
  if (num_of_bits > 0) {
    bytes[num_of_bytes++] = br.read_bits(num_of_bits);
  }
  for (int i = 2; i > 0; i--) {
    unsigned int num = 0;
    for (int j = num_of_bytes - 1; j >= 0; j--) {
      num = (num << 8) | bytes[j];
      unsigned int p = num / sizes[i];
      bytes[j] = p;
      num = num - p * sizes[i];
    }
    nums[i] = static_cast<int32_t>(num);
  }
  nums[0] = static_cast<int32_t>(bytes[0] | (bytes[1] << 8) |
                                 (bytes[2] << 16) | (bytes[3] << 24));
}

inline bool all_below(const int32_t *a, const int32_t *b, int64_t limit) {
  return std::llabs(int64_t(a[0]) - b[0]) < limit &&
         std::llabs(int64_t(a[1]) - b[1]) < limit &&
         std::llabs(int64_t(a[2]) - b[2]) < limit;
}

inline int32_t wrap_add(int32_t a, int64_t b) {
  return static_cast<int32_t>(int64_t(a) + b);
}

inline void to_float(const int32_t c[3], float inv_precision, Vector3f &out) {
  out[0] = static_cast<float>(c[0]) * inv_precision;
  out[1] = static_cast<float>(c[1]) * inv_precision;
  out[2] = static_cast<float>(c[2]) * inv_precision;
}

} // namespace

CompressionParameters XTCCoordCodec::compress(const Vector3f *coords,
                                              uint32_t natoms,
                                              float precision) {
  if (!(precision > 0.0f) || !std::isfinite(precision)) {
    log::warning("invalid XTC precision {}, using {}", precision,
                 xtc_default_precision);
    precision = xtc_default_precision;
  }

  CompressionParameters cp;
  cp.precision = precision;
  packed_buffer.clear();
  if (natoms == 0) {
    cp.smallidx = FIRSTIDX;
    return cp;
  }

  int_coords.resize(size_t(natoms) * 3);
  int32_t minint[3] = {INT_MAX, INT_MAX, INT_MAX};
  int32_t maxint[3] = {INT_MIN, INT_MIN, INT_MIN};
  int32_t oldlint[3] = {0, 0, 0};
  int64_t mindiff = INT_MAX;

  for (uint32_t i = 0; i < natoms; i++) {
    int64_t diff = 0;
    for (int d = 0; d < 3; d++) {
      float x = coords[i][d];
      float lf = x >= 0.0f ? x * precision + 0.5f : x * precision - 0.5f;
      if (!(std::fabs(static_cast<double>(lf)) <= MAXABS)) {
        throw make_error(ErrorKind::CoordinateOutOfRange,
                         "coordinate {} of atom {} ({}) cannot be compressed "
                         "at precision {}",
                         d, i, x, precision);
      }
      auto lint = static_cast<int32_t>(lf);
      minint[d] = std::min(minint[d], lint);
      maxint[d] = std::max(maxint[d], lint);
      int_coords[3 * i + d] = lint;
      diff += std::llabs(int64_t(oldlint[d]) - lint);
      oldlint[d] = lint;
    }
    if (i > 0 && diff < mindiff) {
      mindiff = diff;
    }
  }

  unsigned int sizeint[3], bitsizeint[3] = {0, 0, 0};
  for (int d = 0; d < 3; d++) {
    if (int64_t(maxint[d]) - minint[d] >= INT_MAX - 2) {
      throw make_error(ErrorKind::CoordinateOutOfRange,
                       "coordinate range {}..{} on axis {} is too large for "
                       "precision {}",
                       minint[d], maxint[d], d, precision);
    }
    cp.minint[d] = minint[d];
    cp.maxint[d] = maxint[d];
    auto range = static_cast<unsigned int>(maxint[d] - minint[d]);
    cp.size_bits[d] = static_cast<uint32_t>(sizeofint(range));
    sizeint[d] = range + 1;
  }

  int bitsize = 0;
  if (sizeint[0] > LARGE_RANGE || sizeint[1] > LARGE_RANGE ||
      sizeint[2] > LARGE_RANGE) {
    for (int d = 0; d < 3; d++) {
      bitsizeint[d] = sizeofint(sizeint[d]);
    }
  } else {
    bitsize = sizeofints(3, sizeint);
  }

  int smallidx = FIRSTIDX;
  while (smallidx < LASTIDX - 1 && magicints[smallidx] < mindiff) {
    smallidx++;
  }
  cp.smallidx = smallidx;

  const int maxidx = std::min(LASTIDX - 1, smallidx + 8);
  const int minidx = maxidx - 8; /* often this equal smallidx */
  int smaller = magicints[std::max(FIRSTIDX, smallidx - 1)] / 2;
  int smallnum = magicints[smallidx] / 2;
  unsigned int sizesmall[3];
  sizesmall[0] = sizesmall[1] = sizesmall[2] = magicints[smallidx];
  const int larger = magicints[maxidx] / 2;

  bit_writer bw(packed_buffer);
  int32_t prevcoord[3] = {0, 0, 0};
  unsigned int tmpcoord[30];
  int prevrun = -1;
  uint32_t i = 0;

  while (i < natoms) {
    bool is_small = false;
    int is_smaller;
    int32_t *thiscoord = int_coords.data() + 3 * size_t(i);

    if (smallidx < maxidx && i >= 1 && all_below(thiscoord, prevcoord, larger)) {
      is_smaller = 1;
    } else if (smallidx > minidx) {
      is_smaller = -1;
    } else {
      is_smaller = 0;
    }
    if (i + 1 < natoms && all_below(thiscoord, thiscoord + 3, smallnum)) {
      // interchange first with second atom for better compression of water
      // molecules
      std::swap(thiscoord[0], thiscoord[3]);
      std::swap(thiscoord[1], thiscoord[4]);
      std::swap(thiscoord[2], thiscoord[5]);
      is_small = true;
    }

    if (bitsize == 0) {
      for (int d = 0; d < 3; d++) {
        bw.write_bits(static_cast<uint32_t>(thiscoord[d] - minint[d]),
                      static_cast<int>(bitsizeint[d]));
      }
    } else {
      unsigned int tmp[3];
      for (int d = 0; d < 3; d++) {
        tmp[d] = static_cast<unsigned int>(thiscoord[d] - minint[d]);
      }
      encodeints(bw, bitsize, sizeint, tmp);
    }
    std::copy(thiscoord, thiscoord + 3, prevcoord);
    thiscoord += 3;
    i++;

    int run = 0;
    if (!is_small && is_smaller == -1) {
      is_smaller = 0;
    }
    while (is_small && run < 8 * 3) {
      if (is_smaller == -1) {
        int64_t dist = 0;
        for (int d = 0; d < 3; d++) {
          int64_t delta = int64_t(thiscoord[d]) - prevcoord[d];
          dist += delta * delta;
        }
        if (dist >= int64_t(smaller) * smaller) {
          is_smaller = 0;
        }
      }
      for (int d = 0; d < 3; d++) {
        tmpcoord[run++] =
            static_cast<unsigned int>(thiscoord[d] - prevcoord[d] + smallnum);
      }
      std::copy(thiscoord, thiscoord + 3, prevcoord);
      i++;
      thiscoord += 3;
      is_small = i < natoms && all_below(thiscoord, prevcoord, smallnum);
    }

    if (run != prevrun || is_smaller != 0) {
      prevrun = run;
      bw.write_bits(1, 1); // run length changed
      bw.write_bits(static_cast<uint32_t>(run + is_smaller + 1), 5);
    } else {
      bw.write_bits(0, 1);
    }
    for (int k = 0; k < run; k += 3) {
      encodeints(bw, smallidx, sizesmall, &tmpcoord[k]);
    }
    if (is_smaller != 0) {
      smallidx += is_smaller;
      if (is_smaller < 0) {
        smallnum = smaller;
        smaller = magicints[smallidx - 1] / 2;
      } else {
        smaller = smallnum;
        smallnum = magicints[smallidx] / 2;
      }
      sizesmall[0] = sizesmall[1] = sizesmall[2] = magicints[smallidx];
    }
  }
  bw.flush();

  cp.nbytes = static_cast<int32_t>(packed_buffer.size());
  return cp;
}

void XTCCoordCodec::decompress(const CompressionParameters &cp,
                               uint32_t natoms, const uint8_t *data,
                               Vector3f *coords) {
  if (!(cp.precision > 0.0f) || !std::isfinite(cp.precision)) {
    throw make_error(ErrorKind::CorruptFrame, "invalid precision {}",
                     cp.precision);
  }
  if (cp.nbytes < 0) {
    throw make_error(ErrorKind::CorruptFrame,
                     "negative compressed block size {}", cp.nbytes);
  }

  unsigned int sizeint[3], bitsizeint[3] = {0, 0, 0};
  for (int d = 0; d < 3; d++) {
    if (cp.maxint[d] < cp.minint[d]) {
      throw make_error(ErrorKind::CorruptFrame,
                       "inverted bounds {}..{} on axis {}", cp.minint[d],
                       cp.maxint[d], d);
    }
    sizeint[d] =
        static_cast<unsigned int>(int64_t(cp.maxint[d]) - cp.minint[d] + 1);
    if (sizeint[d] == 0) {
      throw make_error(ErrorKind::CorruptFrame, "empty range on axis {}", d);
    }
  }

  int bitsize = 0;
  if (sizeint[0] > LARGE_RANGE || sizeint[1] > LARGE_RANGE ||
      sizeint[2] > LARGE_RANGE) {
    for (int d = 0; d < 3; d++) {
      bitsizeint[d] = sizeofint(sizeint[d]);
    }
  } else {
    bitsize = sizeofints(3, sizeint);
  }

  int smallidx = cp.smallidx;
  if (smallidx < FIRSTIDX || smallidx >= LASTIDX) {
    throw make_error(ErrorKind::CorruptFrame, "small index {} out of range",
                     smallidx);
  }
  int smaller = magicints[std::max(FIRSTIDX, smallidx - 1)] / 2;
  int smallnum = magicints[smallidx] / 2;
  unsigned int sizesmall[3];
  sizesmall[0] = sizesmall[1] = sizesmall[2] = magicints[smallidx];

  bit_reader br(data, static_cast<size_t>(cp.nbytes));
  const float inv_precision = static_cast<float>(1.0 / cp.precision);
  Vector3f *crd = coords;
  int run = 0;
  uint32_t i = 0;

  while (i < natoms) {
    int32_t thiscoord[3];
    if (bitsize == 0) {
      for (int d = 0; d < 3; d++) {
        thiscoord[d] = static_cast<int32_t>(
            br.read_bits(static_cast<int>(bitsizeint[d])));
      }
    } else {
      decodeints(br, bitsize, sizeint, thiscoord);
    }
    i++;
    for (int d = 0; d < 3; d++) {
      thiscoord[d] = wrap_add(thiscoord[d], cp.minint[d]);
    }
    int32_t prevcoord[3] = {thiscoord[0], thiscoord[1], thiscoord[2]};

    int is_smaller = 0;
    if (br.read_bits(1) == 1) {
      run = static_cast<int>(br.read_bits(5));
      is_smaller = run % 3;
      run -= is_smaller;
      is_smaller--;
    }

    if (run > 0) {
      if (i + uint32_t(run / 3) > natoms) {
        throw make_error(ErrorKind::CorruptFrame,
                         "run of {} atoms after atom {} exceeds the {} atoms "
                         "of the frame",
                         run / 3, i, natoms);
      }
      for (int k = 0; k < run; k += 3) {
        int32_t small[3];
        decodeints(br, smallidx, sizesmall, small);
        i++;
        for (int d = 0; d < 3; d++) {
          small[d] = wrap_add(small[d], int64_t(prevcoord[d]) - smallnum);
        }
        if (k == 0) {
          // first two atoms of a run are stored swapped
          std::swap(small, prevcoord);
          to_float(prevcoord, inv_precision, *crd++);
        } else {
          std::copy(small, small + 3, prevcoord);
        }
        to_float(small, inv_precision, *crd++);
      }
    } else {
      to_float(thiscoord, inv_precision, *crd++);
    }

    smallidx += is_smaller;
    if (smallidx < FIRSTIDX || smallidx >= LASTIDX) {
      throw make_error(ErrorKind::CorruptFrame,
                       "small index {} out of range at atom {}", smallidx, i);
    }
    if (is_smaller < 0) {
      smallnum = smaller;
      smaller = smallidx > FIRSTIDX ? magicints[smallidx - 1] / 2 : 0;
    } else if (is_smaller > 0) {
      smaller = smallnum;
      smallnum = magicints[smallidx] / 2;
    }
    sizesmall[0] = sizesmall[1] = sizesmall[2] = magicints[smallidx];
  }
}

CompressionParameters XTCCoordCodec::write_block(XDRBuffer &out,
                                                 const Vector3f *coords,
                                                 uint32_t natoms,
                                                 float precision, bool raw) {
  out.put_uint(natoms);
  if (raw) {
    for (uint32_t i = 0; i < natoms; i++) {
      out.put_float(coords[i][0]);
      out.put_float(coords[i][1]);
      out.put_float(coords[i][2]);
    }
    return CompressionParameters();
  }

  auto cp = compress(coords, natoms, precision);
  out.put_float(cp.precision);
  for (int d = 0; d < 3; d++) {
    out.put_int(cp.minint[d]);
  }
  for (int d = 0; d < 3; d++) {
    out.put_int(cp.maxint[d]);
  }
  out.put_int(cp.smallidx);
  out.put_int(cp.nbytes);
  out.put_opaque(packed_buffer.data(), packed_buffer.size());
  return cp;
}

CompressionParameters XTCCoordCodec::read_block(XDRFile &in, uint32_t natoms,
                                                Vector3f *coords, bool raw) {
  CompressionParameters cp;
  uint32_t lsize = in.read_uint();
  if (lsize != natoms) {
    throw make_error(ErrorKind::CorruptFrame,
                     "coordinate block of {} atoms in a frame of {} atoms",
                     lsize, natoms);
  }

  if (raw) {
    if (coords == nullptr) {
      in.skip(uint64_t(natoms) * 3 * sizeof(float));
      return cp;
    }
    raw_coords.resize(size_t(natoms) * 3);
    in.read_floats(raw_coords.data(), raw_coords.size());
    for (uint32_t i = 0; i < natoms; i++) {
      coords[i] = {raw_coords[3 * i], raw_coords[3 * i + 1],
                   raw_coords[3 * i + 2]};
    }
    return cp;
  }

  cp.precision = in.read_float();
  for (int d = 0; d < 3; d++) {
    cp.minint[d] = in.read_int();
  }
  for (int d = 0; d < 3; d++) {
    cp.maxint[d] = in.read_int();
  }
  cp.smallidx = in.read_int();
  cp.nbytes = in.read_int();
  if (cp.nbytes < 0) {
    throw make_error(ErrorKind::CorruptFrame,
                     "negative compressed block size {} in '{}'", cp.nbytes,
                     in.path());
  }
  for (int d = 0; d < 3; d++) {
    if (cp.maxint[d] >= cp.minint[d]) {
      cp.size_bits[d] = static_cast<uint32_t>(sizeofint(
          static_cast<unsigned int>(int64_t(cp.maxint[d]) - cp.minint[d])));
    }
  }

  if (coords == nullptr) {
    in.skip(align4(static_cast<uint64_t>(cp.nbytes)));
    return cp;
  }
  in.read_opaque(packed_buffer, static_cast<size_t>(cp.nbytes));
  decompress(cp, natoms, packed_buffer.data(), coords);
  return cp;
}

CompressionParameters compress_coords(const Vector3f *coords, uint32_t natoms,
                                      float precision,
                                      std::vector<uint8_t> &packed) {
  XTCCoordCodec codec;
  auto cp = codec.compress(coords, natoms, precision);
  packed = codec.packed();
  return cp;
}

void decompress_coords(const CompressionParameters &cp, uint32_t natoms,
                       const uint8_t *packed, Vector3f *coords) {
  XTCCoordCodec::decompress(cp, natoms, packed, coords);
}

} // namespace xdrtraj
