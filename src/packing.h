#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "block_selector.h"
#include "error.h"
#include "image_io.h"
#include "layout.h"

namespace pngdata::packing
{
  // Position in the carrier bit stream, counted in payload bits.
  struct BitCursor
  {
    uint64_t position = 0;
  };

  // Order in which pixels (units) are visited. One unit holds
  // channels * bit_depth stream bits.
  class CarrierScan
  {
  public:
    // Row-major pixels [first, first + count)
    static CarrierScan linear(uint64_t first, uint64_t count);
    // Permutation order of a block selector
    static CarrierScan selected(select::BlockSelector &selector);
    // Explicit pixel list, e.g. the unused blocks of a selection
    static CarrierScan listed(select::BlockSpan span);

    uint64_t unit_count() const noexcept { return count_; }
    uint64_t pixel_at(uint64_t unit);

  private:
    enum class Kind : uint8_t
    {
      Linear,
      Selected,
      Listed,
    };

    Kind kind_ = Kind::Linear;
    uint64_t first_ = 0;
    uint64_t count_ = 0;
    select::BlockSelector *selector_ = nullptr;
    const uint32_t *list_ = nullptr;
  };

  // Writes stream bits into the raster unit by unit. Dense layouts replace the
  // sample, embed layouts only touch the low bit_depth bits.
  class StreamWriter
  {
  public:
    StreamWriter(RasterBuffer &raster, const layout::Layout &layout, CarrierScan scan);

    // n <= 32. Returns false when the carrier is full.
    bool put(uint64_t bits, unsigned n);
    bool put_bytes(const uint8_t *data, std::size_t size);

    // Zero-pads and stores a partially filled unit.
    void finish();

    uint64_t capacity_bits() const noexcept { return capacity_; }
    uint64_t bits_remaining() const noexcept { return capacity_ - cursor_.position; }
    uint64_t units_written() const noexcept { return unit_; }
    const BitCursor &cursor() const noexcept { return cursor_; }

  private:
    void store_unit();

    RasterBuffer &raster_;
    layout::Layout layout_;
    CarrierScan scan_;
    uint32_t unit_bits_;
    uint64_t capacity_;
    BitCursor cursor_;
    uint64_t unit_ = 0;
    uint64_t acc_ = 0;
    unsigned acc_bits_ = 0;
  };

  // Reads stream bits back. Bits past the frame (padding, filler) are simply
  // never requested.
  class StreamReader
  {
  public:
    StreamReader(const RasterBuffer &raster, const layout::Layout &layout, CarrierScan scan,
                 BitCursor start = BitCursor{});

    // n <= 32. Returns false past the end of the carrier.
    bool read(unsigned n, uint64_t &out);

    uint64_t capacity_bits() const noexcept { return capacity_; }
    uint64_t bits_remaining() const noexcept { return capacity_ - cursor_.position; }
    const BitCursor &cursor() const noexcept { return cursor_; }

  private:
    void load_unit(uint64_t unit);

    const RasterBuffer &raster_;
    layout::Layout layout_;
    CarrierScan scan_;
    uint32_t unit_bits_;
    uint64_t capacity_;
    BitCursor cursor_;
    uint64_t acc_ = 0;
    unsigned avail_ = 0;
  };

  // Writes `bit_count` bits of `stream` from the start of the scan.
  bool write_stream(RasterBuffer &raster,
                    const layout::Layout &layout,
                    CarrierScan scan,
                    const std::vector<uint8_t> &stream,
                    uint64_t bit_count,
                    uint64_t &units_used,
                    Error &err);

  // Reads `bit_count` bits starting at `cursor` and advances it. Output is
  // packed LSB-first; trailing bits of the last byte are zero.
  bool read_stream(const RasterBuffer &raster,
                   const layout::Layout &layout,
                   CarrierScan scan,
                   BitCursor &cursor,
                   uint64_t bit_count,
                   std::vector<uint8_t> &out,
                   Error &err);
}
