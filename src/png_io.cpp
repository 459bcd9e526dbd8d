// PNG I/O using system libpng
#include "image_io.h"

#include <png.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <vector>

namespace pngdata
{
  namespace
  {
    void png_read_fn(png_structp png_ptr, png_bytep data, png_size_t length)
    {
      FILE *fp = static_cast<FILE *>(png_get_io_ptr(png_ptr));
      if (fread(data, 1, length, fp) != length)
        png_error(png_ptr, "read error");
    }

    void png_write_fn(png_structp png_ptr, png_bytep data, png_size_t length)
    {
      FILE *fp = static_cast<FILE *>(png_get_io_ptr(png_ptr));
      if (fwrite(data, 1, length, fp) != length)
        png_error(png_ptr, "write error");
    }

    void png_flush_fn(png_structp png_ptr)
    {
      FILE *fp = static_cast<FILE *>(png_get_io_ptr(png_ptr));
      fflush(fp);
    }

    int color_type_for(uint32_t channels)
    {
      switch (channels)
      {
      case 1:
        return PNG_COLOR_TYPE_GRAY;
      case 2:
        return PNG_COLOR_TYPE_GRAY_ALPHA;
      case 3:
        return PNG_COLOR_TYPE_RGB;
      case 4:
        return PNG_COLOR_TYPE_RGB_ALPHA;
      default:
        return -1;
      }
    }

    bool valid_depth(uint32_t channels, uint32_t depth)
    {
      if (depth == 8 || depth == 16)
        return true;
      // libpng accepts sub-byte depths for gray only
      return channels == 1 && (depth == 1 || depth == 2 || depth == 4);
    }
  }

  bool has_ext(const std::string &path, const char *extLowerNoDot)
  {
    auto pos = path.find_last_of('.');
    if (pos == std::string::npos)
      return false;
    std::string e = path.substr(pos + 1);
    std::transform(e.begin(), e.end(), e.begin(), [](unsigned char c)
                   { return (char)std::tolower(c); });
    return e == extLowerNoDot;
  }

  bool load_png(const std::string &path, RasterBuffer &out, std::string &err)
  {
    err.clear();
    FILE *fp = fopen(path.c_str(), "rb");
    if (!fp)
    {
      err = "cannot open file";
      return false;
    }

    png_structp png_ptr = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png_ptr)
    {
      fclose(fp);
      err = "png_create_read_struct failed";
      return false;
    }
    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr)
    {
      png_destroy_read_struct(&png_ptr, nullptr, nullptr);
      fclose(fp);
      err = "png_create_info_struct failed";
      return false;
    }

    std::vector<png_bytep> rows;
    std::vector<uint8_t> buffer;
    if (setjmp(png_jmpbuf(png_ptr)))
    {
      png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
      fclose(fp);
      if (err.empty())
        err = "libpng error";
      return false;
    }

    png_set_read_fn(png_ptr, fp, png_read_fn);
    png_read_info(png_ptr, info_ptr);

    png_uint_32 w, h;
    int bit_depth, color_type, interlace;
    png_get_IHDR(png_ptr, info_ptr, &w, &h, &bit_depth, &color_type, &interlace, nullptr, nullptr);

    // Keep the stored sample values; only palettes and tRNS are expanded.
    // Sub-byte gray keeps its depth, so its tRNS chunk is ignored.
    uint32_t depth = static_cast<uint32_t>(bit_depth);
    if (color_type == PNG_COLOR_TYPE_PALETTE)
    {
      png_set_palette_to_rgb(png_ptr);
      depth = 8;
    }
    if (png_get_valid(png_ptr, info_ptr, PNG_INFO_tRNS) && depth >= 8)
      png_set_tRNS_to_alpha(png_ptr);
    if (depth < 8)
      png_set_packing(png_ptr); // one sample per byte, values not rescaled
    if (interlace != PNG_INTERLACE_NONE)
      png_set_interlace_handling(png_ptr);

    png_read_update_info(png_ptr, info_ptr);

    // png_get_bit_depth reports 8 once packing is on, hence depth from IHDR
    const uint32_t channels = png_get_channels(png_ptr, info_ptr);
    const png_size_t rowbytes = png_get_rowbytes(png_ptr, info_ptr);
    rows.resize(h);
    buffer.resize(rowbytes * h);
    for (png_uint_32 y = 0; y < h; ++y)
      rows[y] = buffer.data() + y * rowbytes;
    png_read_image(png_ptr, rows.data());
    png_read_end(png_ptr, nullptr);

    png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
    fclose(fp);

    if (!valid_depth(channels, depth))
    {
      err = "unsupported PNG channel/depth combination";
      return false;
    }

    out.reset(w, h, channels, depth);
    const size_t row_samples = static_cast<size_t>(w) * channels;
    for (png_uint_32 y = 0; y < h; ++y)
    {
      const uint8_t *s = rows[y];
      uint16_t *d = out.samples.data() + y * row_samples;
      if (depth == 16)
      {
        for (size_t i = 0; i < row_samples; ++i)
          d[i] = static_cast<uint16_t>((s[i * 2] << 8) | s[i * 2 + 1]);
      }
      else
      {
        for (size_t i = 0; i < row_samples; ++i)
          d[i] = s[i];
      }
    }
    return true;
  }

  bool save_png(const std::string &path, const RasterBuffer &src, std::string &err)
  {
    err.clear();
    const int color_type = color_type_for(src.channels);
    if (color_type < 0)
    {
      err = "unsupported pixel channels";
      return false;
    }
    if (!valid_depth(src.channels, src.bit_depth))
    {
      err = "unsupported bit depth";
      return false;
    }
    if (src.samples.size() < src.sample_count())
    {
      err = "pixel buffer too small";
      return false;
    }

    // 行バッファは setjmp より前に確保する
    const size_t row_samples = static_cast<size_t>(src.width) * src.channels;
    const size_t row_bytes = src.bit_depth == 16 ? row_samples * 2 : row_samples;
    std::vector<uint8_t> buffer(row_bytes * src.height);
    std::vector<png_bytep> rows(src.height);
    for (uint32_t y = 0; y < src.height; ++y)
    {
      const uint16_t *s = src.samples.data() + y * row_samples;
      uint8_t *d = buffer.data() + y * row_bytes;
      if (src.bit_depth == 16)
      {
        for (size_t i = 0; i < row_samples; ++i)
        {
          d[i * 2 + 0] = static_cast<uint8_t>(s[i] >> 8);
          d[i * 2 + 1] = static_cast<uint8_t>(s[i] & 0xffu);
        }
      }
      else
      {
        for (size_t i = 0; i < row_samples; ++i)
          d[i] = static_cast<uint8_t>(s[i]);
      }
      rows[y] = d;
    }

    FILE *fp = fopen(path.c_str(), "wb");
    if (!fp)
    {
      err = "cannot open file";
      return false;
    }

    png_structp png_ptr = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png_ptr)
    {
      fclose(fp);
      err = "png_create_write_struct failed";
      return false;
    }
    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr)
    {
      png_destroy_write_struct(&png_ptr, nullptr);
      fclose(fp);
      err = "png_create_info_struct failed";
      return false;
    }
    if (setjmp(png_jmpbuf(png_ptr)))
    {
      png_destroy_write_struct(&png_ptr, &info_ptr);
      fclose(fp);
      if (err.empty())
        err = "libpng error";
      return false;
    }

    png_set_write_fn(png_ptr, fp, png_write_fn, png_flush_fn);
    png_set_compression_level(png_ptr, 9);
    png_set_IHDR(png_ptr, info_ptr, src.width, src.height, static_cast<int>(src.bit_depth), color_type,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);
    png_write_info(png_ptr, info_ptr);
    if (src.bit_depth < 8)
      png_set_packing(png_ptr);

    png_write_image(png_ptr, rows.data());
    png_write_end(png_ptr, nullptr);
    png_destroy_write_struct(&png_ptr, &info_ptr);
    if (fclose(fp) != 0)
    {
      err = "write error";
      return false;
    }
    return true;
  }
}
