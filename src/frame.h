#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "bit_io.h"
#include "error.h"
#include "sha256.h"

namespace pngdata::frame
{
  // Frame layout (little-endian, LSB-first):
  //   magic "PNGD" | version u16 | comment_len u16 | comment | payload_len u64 |
  //   sha256(payload) 32 bytes | payload
  inline constexpr std::array<uint8_t, 4> kMagic = {'P', 'N', 'G', 'D'};
  inline constexpr uint16_t kVersion = 1;
  inline constexpr std::size_t kMaxCommentBytes = 0xFFFF;
  inline constexpr uint64_t kFixedHeaderBytes = 4 + 2 + 2 + 8 + 32;
  inline constexpr uint64_t kChecksumBits = 32 * 8;

  struct FrameHeader
  {
    uint16_t version = kVersion;
    std::string comment;
    uint64_t payload_length = 0;
  };

  struct Frame
  {
    FrameHeader header;
    detail::Sha256Digest checksum{};
    std::vector<uint8_t> payload;
  };

  uint64_t header_overhead(std::size_t comment_size);
  uint64_t frame_bits(uint64_t payload_size, std::size_t comment_size);

  bool is_valid_utf8(const uint8_t *data, std::size_t size);
  bool validate_comment(const std::string &comment, Error &err);

  // Appends the whole frame to `stream`.
  bool serialize(const std::string &comment,
                 const std::vector<uint8_t> &payload,
                 std::vector<uint8_t> &stream,
                 Error &err);

  // Reader は read(n, out) (n <= 32) と bits_remaining() を持つこと。
  template <typename Reader>
  bool read_bytes(Reader &reader, std::size_t count, std::vector<uint8_t> &out)
  {
    out.resize(count);
    for (std::size_t i = 0; i < count; ++i)
    {
      uint64_t v = 0;
      if (!reader.read(8, v))
        return false;
      out[i] = static_cast<uint8_t>(v);
    }
    return true;
  }

  // Stops after the payload length field. The length is still checked against
  // what is left of the carrier.
  template <typename Reader>
  bool read_header_only(Reader &reader, FrameHeader &out, Error &err)
  {
    uint64_t v = 0;
    std::vector<uint8_t> bytes;
    if (!read_bytes(reader, kMagic.size(), bytes))
      return fail(err, ErrorKind::CorruptFrame, "carrier too small for a frame header");
    for (std::size_t i = 0; i < kMagic.size(); ++i)
    {
      if (bytes[i] != kMagic[i])
        return fail(err, ErrorKind::CorruptFrame, "frame magic mismatch (wrong layout or seed?)");
    }

    if (!reader.read(16, v))
      return fail(err, ErrorKind::CorruptFrame, "truncated frame version");
    const uint16_t version = static_cast<uint16_t>(v);
    if (version != kVersion)
      return fail(err, ErrorKind::CorruptFrame, "unknown frame version " + std::to_string(version));

    if (!reader.read(16, v))
      return fail(err, ErrorKind::CorruptFrame, "truncated comment length");
    const std::size_t comment_length = static_cast<std::size_t>(v);
    if (static_cast<uint64_t>(comment_length) * 8u > reader.bits_remaining())
      return fail(err, ErrorKind::CorruptFrame, "comment length exceeds carrier capacity");
    if (!read_bytes(reader, comment_length, bytes))
      return fail(err, ErrorKind::CorruptFrame, "truncated comment");
    if (!is_valid_utf8(bytes.data(), bytes.size()))
      return fail(err, ErrorKind::CorruptFrame, "frame comment is not valid UTF-8");

    uint64_t lo = 0, hi = 0;
    if (!reader.read(32, lo) || !reader.read(32, hi))
      return fail(err, ErrorKind::CorruptFrame, "truncated payload length");
    const uint64_t payload_length = lo | (hi << 32);
    const uint64_t remaining = reader.bits_remaining();
    if (remaining < kChecksumBits || payload_length > (remaining - kChecksumBits) / 8u)
      return fail(err, ErrorKind::CorruptFrame,
                  "payload length " + std::to_string(payload_length) + " exceeds carrier capacity");

    out.version = version;
    out.comment.assign(bytes.begin(), bytes.end());
    out.payload_length = payload_length;
    return true;
  }

  // Reads the checksum and `length` payload bytes that follow a header.
  template <typename Reader>
  bool read_body(Reader &reader, uint64_t length, detail::Sha256Digest &checksum,
                 std::vector<uint8_t> &payload, Error &err)
  {
    std::vector<uint8_t> digest;
    if (!read_bytes(reader, checksum.size(), digest))
      return fail(err, ErrorKind::CorruptFrame, "truncated checksum");
    std::copy(digest.begin(), digest.end(), checksum.begin());

    if (!read_bytes(reader, static_cast<std::size_t>(length), payload))
      return fail(err, ErrorKind::CorruptFrame, "truncated payload");
    return true;
  }

  bool verify_checksum(const detail::Sha256Digest &expected, const std::vector<uint8_t> &payload, Error &err);

  template <typename Reader>
  bool deserialize(Reader &reader, Frame &out, Error &err)
  {
    Frame frame;
    if (!read_header_only(reader, frame.header, err))
      return false;
    if (!read_body(reader, frame.header.payload_length, frame.checksum, frame.payload, err))
      return false;
    if (!verify_checksum(frame.checksum, frame.payload, err))
      return false;

    out = std::move(frame);
    return true;
  }

  // Byte-buffer entry points.
  bool deserialize_bytes(const std::vector<uint8_t> &stream, Frame &out, Error &err);
  bool read_header_bytes(const std::vector<uint8_t> &stream, FrameHeader &out, Error &err);
}
