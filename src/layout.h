#pragma once

#include <cstdint>
#include <string>

#include "error.h"
#include "image_io.h"

namespace pngdata::layout
{
  enum class Mode : uint8_t
  {
    Dense = 0, // 画像全体をデータで埋める
    Embed = 1, // 既存画像の下位ビットに埋め込む
  };

  inline constexpr uint32_t kMaxEmbedBits = 7;

  // Fixed set of layouts. Dense layouts carry their channel count; an embed
  // layout (loN) gets it from the carrier through bind_carrier().
  struct Layout
  {
    Mode mode = Mode::Dense;
    uint32_t channels = 0;
    uint32_t bit_depth = 0; // dense: sample depth, embed: stolen low bits

    uint32_t channel_count() const noexcept { return channels; }
    uint32_t bits_per_pixel() const noexcept { return channels * bit_depth; }
    bool bound() const noexcept { return channels != 0; }

    uint16_t sample_mask() const noexcept
    {
      return static_cast<uint16_t>((1u << bit_depth) - 1u);
    }

    uint32_t read_channel(uint16_t sample) const noexcept
    {
      return sample & sample_mask();
    }

    // Dense mode replaces the whole sample; embed mode keeps the high bits.
    uint16_t write_channel(uint16_t sample, uint32_t bits) const noexcept
    {
      const uint16_t mask = sample_mask();
      if (mode == Mode::Dense)
        return static_cast<uint16_t>(bits & mask);
      return static_cast<uint16_t>((sample & ~mask) | (bits & mask));
    }
  };

  // "rgb8", "ga2", "lo3", ...
  bool parse_layout(const std::string &tag, Layout &out, Error &err);
  std::string layout_tag(const Layout &layout);

  // Depth of the PNG samples that hold a dense layout. PNG has no sub-byte
  // gray+alpha, so ga1/ga2/ga4 live in 8-bit samples.
  uint32_t container_depth(const Layout &layout);

  // Resolves the channel count of an embed layout from the carrier, or checks
  // that a dense layout matches the raster.
  bool bind_carrier(const Layout &layout, const RasterBuffer &raster, Layout &bound, Error &err);

  // Dense layout matching a raster's channels and depth.
  bool layout_from_raster(const RasterBuffer &raster, Layout &out, Error &err);

  uint64_t capacity_bits(const Layout &layout, uint32_t width, uint32_t height);
  uint64_t capacity_bytes(const Layout &layout, uint32_t width, uint32_t height);

  // Capacity by tag. Embed tags need the carrier's channel count.
  bool capacity_bits(const std::string &tag,
                     uint32_t width,
                     uint32_t height,
                     uint32_t carrier_channels,
                     uint64_t &bits,
                     Error &err);
}
