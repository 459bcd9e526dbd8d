#include "frame.h"

namespace pngdata::frame
{
  using detail::bitio::BitReader;
  using detail::bitio::BitWriter;

  uint64_t header_overhead(std::size_t comment_size)
  {
    return kFixedHeaderBytes + comment_size;
  }

  uint64_t frame_bits(uint64_t payload_size, std::size_t comment_size)
  {
    return (header_overhead(comment_size) + payload_size) * 8u;
  }

  bool is_valid_utf8(const uint8_t *data, std::size_t size)
  {
    std::size_t i = 0;
    while (i < size)
    {
      const uint8_t lead = data[i];
      std::size_t extra = 0;
      uint32_t cp = 0;
      uint32_t min_cp = 0;
      if (lead < 0x80u)
      {
        ++i;
        continue;
      }
      else if ((lead & 0xE0u) == 0xC0u)
      {
        extra = 1;
        cp = lead & 0x1Fu;
        min_cp = 0x80u;
      }
      else if ((lead & 0xF0u) == 0xE0u)
      {
        extra = 2;
        cp = lead & 0x0Fu;
        min_cp = 0x800u;
      }
      else if ((lead & 0xF8u) == 0xF0u)
      {
        extra = 3;
        cp = lead & 0x07u;
        min_cp = 0x10000u;
      }
      else
      {
        return false;
      }
      if (size - i <= extra)
        return false;
      for (std::size_t k = 1; k <= extra; ++k)
      {
        const uint8_t c = data[i + k];
        if ((c & 0xC0u) != 0x80u)
          return false;
        cp = (cp << 6) | (c & 0x3Fu);
      }
      // 冗長表現・サロゲート・範囲外を拒否する
      if (cp < min_cp || cp > 0x10FFFFu || (cp >= 0xD800u && cp <= 0xDFFFu))
        return false;
      i += extra + 1;
    }
    return true;
  }

  bool validate_comment(const std::string &comment, Error &err)
  {
    if (comment.size() > kMaxCommentBytes)
      return fail(err, ErrorKind::InvalidComment,
                  "comment is too long, maximum length: " + std::to_string(kMaxCommentBytes) +
                      ", got " + std::to_string(comment.size()));
    if (!is_valid_utf8(reinterpret_cast<const uint8_t *>(comment.data()), comment.size()))
      return fail(err, ErrorKind::InvalidComment, "comment is not valid UTF-8");
    return true;
  }

  bool serialize(const std::string &comment,
                 const std::vector<uint8_t> &payload,
                 std::vector<uint8_t> &stream,
                 Error &err)
  {
    if (!validate_comment(comment, err))
      return false;

    const detail::Sha256Digest checksum = detail::sha256(payload);
    stream.reserve(stream.size() + static_cast<std::size_t>(header_overhead(comment.size())) + payload.size());

    BitWriter writer(stream);
    writer.put_bytes(kMagic.data(), kMagic.size());
    writer.put_u16(kVersion);
    writer.put_u16(static_cast<uint16_t>(comment.size()));
    writer.put_bytes(reinterpret_cast<const uint8_t *>(comment.data()), comment.size());
    writer.put_u64(static_cast<uint64_t>(payload.size()));
    writer.put_bytes(checksum.data(), checksum.size());
    writer.put_bytes(payload.data(), payload.size());
    writer.finish();
    return true;
  }

  bool verify_checksum(const detail::Sha256Digest &expected, const std::vector<uint8_t> &payload, Error &err)
  {
    const detail::Sha256Digest actual = detail::sha256(payload);
    if (actual != expected)
      return fail(err, ErrorKind::ChecksumMismatch,
                  "payload checksum mismatch: header=" + detail::to_hex(expected.data(), 8) +
                      "... got=" + detail::to_hex(actual.data(), 8) + "...");
    return true;
  }

  bool deserialize_bytes(const std::vector<uint8_t> &stream, Frame &out, Error &err)
  {
    BitReader reader(stream.data(), stream.size());
    return deserialize(reader, out, err);
  }

  bool read_header_bytes(const std::vector<uint8_t> &stream, FrameHeader &out, Error &err)
  {
    BitReader reader(stream.data(), stream.size());
    return read_header_only(reader, out, err);
  }
}
