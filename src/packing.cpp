#include "packing.h"

#include <algorithm>
#include <string>

#include "bit_io.h"

namespace pngdata::packing
{
  using detail::bitio::low_mask;

  CarrierScan CarrierScan::linear(uint64_t first, uint64_t count)
  {
    CarrierScan scan;
    scan.kind_ = Kind::Linear;
    scan.first_ = first;
    scan.count_ = count;
    return scan;
  }

  CarrierScan CarrierScan::selected(select::BlockSelector &selector)
  {
    CarrierScan scan;
    scan.kind_ = Kind::Selected;
    scan.selector_ = &selector;
    scan.count_ = selector.block_count();
    return scan;
  }

  CarrierScan CarrierScan::listed(select::BlockSpan span)
  {
    CarrierScan scan;
    scan.kind_ = Kind::Listed;
    scan.list_ = span.data;
    scan.count_ = span.size;
    return scan;
  }

  uint64_t CarrierScan::pixel_at(uint64_t unit)
  {
    switch (kind_)
    {
    case Kind::Selected:
      return selector_->at(unit);
    case Kind::Listed:
      return list_[unit];
    case Kind::Linear:
    default:
      return first_ + unit;
    }
  }

  // -------- StreamWriter --------

  StreamWriter::StreamWriter(RasterBuffer &raster, const layout::Layout &layout, CarrierScan scan)
      : raster_(raster), layout_(layout), scan_(scan), unit_bits_(layout.bits_per_pixel()),
        capacity_(scan.unit_count() * layout.bits_per_pixel())
  {
  }

  void StreamWriter::store_unit()
  {
    uint16_t *px = raster_.pixel(static_cast<std::size_t>(scan_.pixel_at(unit_)));
    const uint32_t depth = layout_.bit_depth;
    for (uint32_t c = 0; c < layout_.channels; ++c)
    {
      const uint32_t bits = static_cast<uint32_t>((acc_ >> (c * depth)) & low_mask(depth));
      px[c] = layout_.write_channel(px[c], bits);
    }
    ++unit_;
    acc_ = 0;
    acc_bits_ = 0;
  }

  bool StreamWriter::put(uint64_t bits, unsigned n)
  {
    if (n > bits_remaining())
      return false;
    cursor_.position += n;
    while (n > 0)
    {
      const unsigned take = std::min(n, unit_bits_ - acc_bits_);
      acc_ |= (bits & low_mask(take)) << acc_bits_;
      acc_bits_ += take;
      bits >>= take;
      n -= take;
      if (acc_bits_ == unit_bits_)
        store_unit();
    }
    return true;
  }

  bool StreamWriter::put_bytes(const uint8_t *data, std::size_t size)
  {
    if (static_cast<uint64_t>(size) * 8u > bits_remaining())
      return false;
    for (std::size_t i = 0; i < size; ++i)
    {
      if (!put(data[i], 8))
        return false;
    }
    return true;
  }

  void StreamWriter::finish()
  {
    if (acc_bits_ > 0)
      store_unit();
  }

  // -------- StreamReader --------

  StreamReader::StreamReader(const RasterBuffer &raster, const layout::Layout &layout, CarrierScan scan,
                             BitCursor start)
      : raster_(raster), layout_(layout), scan_(scan), unit_bits_(layout.bits_per_pixel()),
        capacity_(scan.unit_count() * layout.bits_per_pixel()), cursor_(start)
  {
    // 途中から読む場合は該当ユニットを読み込んで端数を捨てておく
    if (cursor_.position > capacity_)
      cursor_.position = capacity_;
    const unsigned offset = static_cast<unsigned>(cursor_.position % unit_bits_);
    if (offset != 0)
    {
      load_unit(cursor_.position / unit_bits_);
      acc_ >>= offset;
      avail_ -= offset;
    }
  }

  void StreamReader::load_unit(uint64_t unit)
  {
    const uint16_t *px = raster_.pixel(static_cast<std::size_t>(scan_.pixel_at(unit)));
    const uint32_t depth = layout_.bit_depth;
    acc_ = 0;
    for (uint32_t c = 0; c < layout_.channels; ++c)
      acc_ |= static_cast<uint64_t>(layout_.read_channel(px[c])) << (c * depth);
    avail_ = unit_bits_;
  }

  bool StreamReader::read(unsigned n, uint64_t &out)
  {
    if (n > bits_remaining())
      return false;
    uint64_t value = 0;
    unsigned got = 0;
    while (got < n)
    {
      if (avail_ == 0)
        load_unit(cursor_.position / unit_bits_);
      const unsigned take = std::min(n - got, avail_);
      value |= (acc_ & low_mask(take)) << got;
      acc_ >>= take;
      avail_ -= take;
      got += take;
      cursor_.position += take;
    }
    out = value;
    return true;
  }

  // -------- helpers --------

  bool write_stream(RasterBuffer &raster,
                    const layout::Layout &layout,
                    CarrierScan scan,
                    const std::vector<uint8_t> &stream,
                    uint64_t bit_count,
                    uint64_t &units_used,
                    Error &err)
  {
    if (bit_count > static_cast<uint64_t>(stream.size()) * 8u)
      return fail(err, ErrorKind::CorruptFrame, "bit count exceeds stream size");

    StreamWriter writer(raster, layout, scan);
    if (bit_count > writer.capacity_bits())
      return fail(err, ErrorKind::CapacityExceeded,
                  "need " + std::to_string(bit_count) + " bits, carrier holds " +
                      std::to_string(writer.capacity_bits()));

    const uint64_t whole = bit_count / 8u;
    const unsigned tail = static_cast<unsigned>(bit_count % 8u);
    if (!writer.put_bytes(stream.data(), static_cast<std::size_t>(whole)) ||
        (tail != 0 && !writer.put(stream[static_cast<std::size_t>(whole)], tail)))
      return fail(err, ErrorKind::CapacityExceeded, "carrier filled up while writing the stream");
    writer.finish();
    units_used = writer.units_written();
    return true;
  }

  bool read_stream(const RasterBuffer &raster,
                   const layout::Layout &layout,
                   CarrierScan scan,
                   BitCursor &cursor,
                   uint64_t bit_count,
                   std::vector<uint8_t> &out,
                   Error &err)
  {
    StreamReader reader(raster, layout, scan, cursor);
    if (bit_count > reader.bits_remaining())
      return fail(err, ErrorKind::CorruptFrame,
                  "requested " + std::to_string(bit_count) + " bits, carrier has " +
                      std::to_string(reader.bits_remaining()) + " left");

    std::vector<uint8_t> bytes;
    bytes.reserve(static_cast<std::size_t>((bit_count + 7) / 8));
    detail::bitio::BitWriter writer(bytes);
    uint64_t left = bit_count;
    while (left > 0)
    {
      const unsigned n = static_cast<unsigned>(std::min<uint64_t>(left, 32));
      uint64_t v = 0;
      if (!reader.read(n, v))
        return fail(err, ErrorKind::CorruptFrame, "carrier ended while reading the stream");
      writer.put(v, n);
      left -= n;
    }
    writer.finish();
    out.swap(bytes);
    cursor = reader.cursor();
    return true;
  }
}
