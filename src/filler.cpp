#include "filler.h"

#include <algorithm>
#include <cmath>
#include <random>

namespace pngdata::filler
{
  ByteHistogram byte_histogram(const uint8_t *data, std::size_t size)
  {
    ByteHistogram histogram{};
    for (std::size_t i = 0; i < size; ++i)
      ++histogram[data[i]];
    return histogram;
  }

  double shannon_entropy(const ByteHistogram &histogram)
  {
    uint64_t total = 0;
    for (uint64_t count : histogram)
      total += count;
    if (total == 0)
      return 0.0;

    double entropy = 0.0;
    for (uint64_t count : histogram)
    {
      if (count == 0)
        continue;
      const double p = static_cast<double>(count) / static_cast<double>(total);
      entropy -= p * std::log2(p);
    }
    return entropy;
  }

  double shannon_entropy(const std::vector<uint8_t> &data)
  {
    return shannon_entropy(byte_histogram(data.data(), data.size()));
  }

  ByteSampler::ByteSampler(const ByteHistogram &histogram)
  {
    uint64_t running = 0;
    for (std::size_t i = 0; i < histogram.size(); ++i)
    {
      running += histogram[i];
      cumulative_[i] = running;
    }
    total_ = running;
    if (total_ == 0)
    {
      for (std::size_t i = 0; i < cumulative_.size(); ++i)
        cumulative_[i] = i + 1;
      total_ = cumulative_.size();
    }
  }

  ByteSampler ByteSampler::uniform()
  {
    return ByteSampler(ByteHistogram{});
  }

  uint8_t ByteSampler::next(select::Rng &rng) const
  {
    // cumulative_[b] > r となる最初の b を選ぶ
    const uint64_t r = select::uniform_below(rng, total_);
    const auto it = std::upper_bound(cumulative_.begin(), cumulative_.end(), r);
    return static_cast<uint8_t>(it - cumulative_.begin());
  }

  select::Rng make_filler_rng(const std::optional<uint64_t> &fixed_seed)
  {
    if (fixed_seed)
    {
      std::seed_seq seq{static_cast<uint32_t>(*fixed_seed), static_cast<uint32_t>(*fixed_seed >> 32)};
      return select::Rng(seq);
    }
    std::random_device device;
    std::seed_seq seq{device(), device(), device(), device(), device(), device(), device(), device()};
    return select::Rng(seq);
  }

  uint64_t fill_units(RasterBuffer &raster,
                      const layout::Layout &layout,
                      packing::CarrierScan scan,
                      const ByteSampler &sampler,
                      select::Rng &rng)
  {
    packing::StreamWriter writer(raster, layout, scan);
    while (writer.bits_remaining() >= 8)
    {
      if (!writer.put(sampler.next(rng), 8))
        break;
    }
    const unsigned tail = static_cast<unsigned>(writer.bits_remaining());
    if (tail != 0 && !writer.put(sampler.next(rng), tail))
      return writer.units_written();
    writer.finish();
    return writer.units_written();
  }
}
