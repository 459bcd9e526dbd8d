// Raster buffer and PNG container I/O for pngdata
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pngdata
{
  // Width x height grid of samples. Each sample is held in a uint16_t regardless
  // of its significant width; bit_depth says how many low bits are meaningful.
  struct RasterBuffer
  {
    uint32_t width = 0;
    uint32_t height = 0;
    // 1 = gray, 2 = gray+alpha, 3 = RGB, 4 = RGBA
    uint32_t channels = 0;
    // 1, 2, 4, 8 or 16
    uint32_t bit_depth = 0;
    std::vector<uint16_t> samples; // row-major, channels interleaved

    size_t pixel_count() const
    {
      return static_cast<size_t>(width) * height;
    }

    size_t sample_count() const
    {
      return pixel_count() * channels;
    }

    uint16_t *pixel(size_t index)
    {
      return samples.data() + index * channels;
    }

    const uint16_t *pixel(size_t index) const
    {
      return samples.data() + index * channels;
    }

    void reset(uint32_t w, uint32_t h, uint32_t ch, uint32_t depth)
    {
      width = w;
      height = h;
      channels = ch;
      bit_depth = depth;
      samples.assign(static_cast<size_t>(w) * h * ch, 0);
    }
  };

  // Dispatch by extension helper
  bool has_ext(const std::string &path, const char *extLowerNoDot);

  // PNG I/O (system libpng). Palette images are expanded to RGB(A); gray images
  // below 8 bits keep their depth with one sample per entry.
  bool load_png(const std::string &path, RasterBuffer &out, std::string &err);
  bool save_png(const std::string &path, const RasterBuffer &src, std::string &err);
}
