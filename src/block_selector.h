#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace pngdata::select
{
  // mt19937_64 and seed_seq are fully specified by the standard, so the same
  // seed gives the same permutation with every standard library.
  using Rng = std::mt19937_64;

  // SHA-256("pngdata block selector" + seed) -> seed_seq -> mt19937_64
  Rng make_rng(const std::string &seed);

  // Uniform value in [0, bound) by rejection; bound must be non-zero.
  uint64_t uniform_below(Rng &rng, uint64_t bound);

  // "{width}x{height}"
  std::string default_seed(uint32_t width, uint32_t height);

  struct BlockSpan
  {
    const uint32_t *data = nullptr;
    uint64_t size = 0;
  };

  // Seeded permutation of block (pixel) indices [0, block_count).
  // Forward Fisher-Yates: after k steps the first k entries are final, so the
  // shuffle only advances as far as positions are requested.
  class BlockSelector
  {
  public:
    BlockSelector(const std::string &seed, uint32_t block_count);

    uint32_t block_count() const noexcept { return static_cast<uint32_t>(order_.size()); }
    uint64_t settled() const noexcept { return settled_; }

    // Block at permutation position `position` (< block_count).
    uint32_t at(uint64_t position);

    // First `count` positions, in permutation order.
    std::vector<uint32_t> prefix(uint64_t count);

    // Blocks outside the first `carried` positions, in no particular order.
    BlockSpan unused(uint64_t carried);

  private:
    void settle(uint64_t count);

    Rng rng_;
    std::vector<uint32_t> order_;
    uint64_t settled_ = 0;
  };
}
