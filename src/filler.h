#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "block_selector.h"
#include "image_io.h"
#include "layout.h"
#include "packing.h"

namespace pngdata::filler
{
  using ByteHistogram = std::array<uint64_t, 256>;

  ByteHistogram byte_histogram(const uint8_t *data, std::size_t size);

  // Order-0 Shannon entropy in bits per byte (0 for an empty histogram).
  double shannon_entropy(const ByteHistogram &histogram);
  double shannon_entropy(const std::vector<uint8_t> &data);

  // Draws bytes with the empirical distribution of a histogram.
  class ByteSampler
  {
  public:
    // An empty histogram yields the uniform distribution.
    explicit ByteSampler(const ByteHistogram &histogram);

    static ByteSampler uniform();

    uint8_t next(select::Rng &rng) const;
    uint64_t total() const noexcept { return total_; }

  private:
    std::array<uint64_t, 256> cumulative_{};
    uint64_t total_ = 0;
  };

  // Generator for filler bits. Without a fixed seed it is seeded from
  // std::random_device; either way it lives only for one call.
  select::Rng make_filler_rng(const std::optional<uint64_t> &fixed_seed);

  // Overwrites every unit of `scan` with sampled bytes. Returns the number of
  // units touched.
  uint64_t fill_units(RasterBuffer &raster,
                      const layout::Layout &layout,
                      packing::CarrierScan scan,
                      const ByteSampler &sampler,
                      select::Rng &rng);
}
