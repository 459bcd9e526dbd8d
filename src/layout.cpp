#include "layout.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace pngdata::layout
{
  namespace
  {
    struct ColorEntry
    {
      std::string_view prefix;
      uint32_t channels;
      std::array<uint32_t, 5> depths; // 0 で終端
    };

    constexpr std::array<ColorEntry, 4> kColorTable = {{
        {"g", 1, {1, 2, 4, 8, 16}},
        {"ga", 2, {1, 2, 4, 8, 16}},
        {"rgb", 3, {8, 16, 0, 0, 0}},
        {"rgba", 4, {8, 16, 0, 0, 0}},
    }};

    const ColorEntry *find_color(std::string_view prefix)
    {
      for (const auto &entry : kColorTable)
      {
        if (entry.prefix == prefix)
          return &entry;
      }
      return nullptr;
    }

    const ColorEntry *find_color(uint32_t channels)
    {
      for (const auto &entry : kColorTable)
      {
        if (entry.channels == channels)
          return &entry;
      }
      return nullptr;
    }

    bool parse_depth(std::string_view digits, uint32_t &out)
    {
      if (digits.empty() || digits.size() > 2)
        return false;
      uint32_t v = 0;
      for (char c : digits)
      {
        if (!std::isdigit(static_cast<unsigned char>(c)))
          return false;
        v = v * 10 + static_cast<uint32_t>(c - '0');
      }
      out = v;
      return true;
    }
  }

  bool parse_layout(const std::string &tag, Layout &out, Error &err)
  {
    const auto digit = std::find_if(tag.begin(), tag.end(), [](unsigned char c)
                                    { return std::isdigit(c) != 0; });
    if (digit == tag.end())
      return fail(err, ErrorKind::UnsupportedLayout, "missing bit depth in layout `" + tag + "`");

    const std::string_view view(tag);
    const auto split = static_cast<std::size_t>(digit - tag.begin());
    const std::string_view prefix = view.substr(0, split);
    uint32_t depth = 0;
    if (!parse_depth(view.substr(split), depth))
      return fail(err, ErrorKind::UnsupportedLayout, "invalid bit depth in layout `" + tag + "`");

    if (prefix == "lo")
    {
      if (depth == 0 || depth > kMaxEmbedBits)
        return fail(err, ErrorKind::UnsupportedLayout,
                    "cannot take " + std::to_string(depth) + " bits with `lo`, must be within [1, 7]");
      out = Layout{Mode::Embed, 0, depth};
      return true;
    }

    const ColorEntry *entry = find_color(prefix);
    if (!entry)
      return fail(err, ErrorKind::UnsupportedLayout, "unknown layout `" + tag + "`");
    if (std::find(entry->depths.begin(), entry->depths.end(), depth) == entry->depths.end() || depth == 0)
      return fail(err, ErrorKind::UnsupportedLayout,
                  "color type `" + std::string(prefix) + "` cannot have bit depth " + std::to_string(depth));

    out = Layout{Mode::Dense, entry->channels, depth};
    return true;
  }

  std::string layout_tag(const Layout &layout)
  {
    if (layout.mode == Mode::Embed)
      return "lo" + std::to_string(layout.bit_depth);
    const ColorEntry *entry = find_color(layout.channels);
    if (!entry)
      return "?" + std::to_string(layout.bit_depth);
    return std::string(entry->prefix) + std::to_string(layout.bit_depth);
  }

  uint32_t container_depth(const Layout &layout)
  {
    if (layout.channels == 1 || layout.bit_depth >= 8)
      return layout.bit_depth;
    return 8;
  }

  bool bind_carrier(const Layout &layout, const RasterBuffer &raster, Layout &bound, Error &err)
  {
    if (raster.channels == 0 || raster.channels > 4)
      return fail(err, ErrorKind::UnsupportedLayout,
                  "carrier has " + std::to_string(raster.channels) + " channels");

    if (layout.mode == Mode::Embed)
    {
      if (raster.bit_depth != 8 && raster.bit_depth != 16)
        return fail(err, ErrorKind::UnsupportedLayout,
                    "layout " + layout_tag(layout) + " needs 8 or 16-bit samples, carrier has " +
                        std::to_string(raster.bit_depth));
      bound = layout;
      bound.channels = raster.channels;
      return true;
    }

    if (layout.channels != raster.channels || container_depth(layout) != raster.bit_depth)
    {
      Layout actual;
      Error ignored;
      const std::string found = layout_from_raster(raster, actual, ignored) ? layout_tag(actual) : "unknown";
      return fail(err, ErrorKind::UnsupportedLayout,
                  "layout " + layout_tag(layout) + " does not match image layout " + found);
    }
    bound = layout;
    return true;
  }

  bool layout_from_raster(const RasterBuffer &raster, Layout &out, Error &err)
  {
    const ColorEntry *entry = find_color(raster.channels);
    if (!entry || std::find(entry->depths.begin(), entry->depths.end(), raster.bit_depth) == entry->depths.end())
      return fail(err, ErrorKind::UnsupportedLayout,
                  "no dense layout for " + std::to_string(raster.channels) + " channels at " +
                      std::to_string(raster.bit_depth) + " bits");
    out = Layout{Mode::Dense, raster.channels, raster.bit_depth};
    return true;
  }

  uint64_t capacity_bits(const Layout &layout, uint32_t width, uint32_t height)
  {
    return static_cast<uint64_t>(width) * height * layout.bits_per_pixel();
  }

  uint64_t capacity_bytes(const Layout &layout, uint32_t width, uint32_t height)
  {
    return capacity_bits(layout, width, height) / 8;
  }

  bool capacity_bits(const std::string &tag,
                     uint32_t width,
                     uint32_t height,
                     uint32_t carrier_channels,
                     uint64_t &bits,
                     Error &err)
  {
    Layout layout;
    if (!parse_layout(tag, layout, err))
      return false;
    if (layout.mode == Mode::Embed)
    {
      if (carrier_channels == 0 || carrier_channels > 4)
        return fail(err, ErrorKind::UnsupportedLayout,
                    "layout " + tag + " needs a carrier with 1 to 4 channels");
      layout.channels = carrier_channels;
    }
    bits = capacity_bits(layout, width, height);
    return true;
  }
}
