#include "block_selector.h"

#include <algorithm>
#include <array>
#include <cstring>
#include <numeric>
#include <utility>

#include "sha256.h"

namespace pngdata::select
{
  namespace
  {
    constexpr char kSeedSalt[] = "pngdata block selector";
  }

  Rng make_rng(const std::string &seed)
  {
    detail::Sha256 hash;
    hash.update(kSeedSalt, std::strlen(kSeedSalt));
    hash.update(seed.data(), seed.size());
    const detail::Sha256Digest &digest = hash.finish();

    std::array<uint32_t, 8> words{};
    for (std::size_t i = 0; i < words.size(); ++i)
    {
      words[i] = (static_cast<uint32_t>(digest[i * 4 + 0]) << 24) |
                 (static_cast<uint32_t>(digest[i * 4 + 1]) << 16) |
                 (static_cast<uint32_t>(digest[i * 4 + 2]) << 8) |
                 static_cast<uint32_t>(digest[i * 4 + 3]);
    }
    std::seed_seq seq(words.begin(), words.end());
    return Rng(seq);
  }

  uint64_t uniform_below(Rng &rng, uint64_t bound)
  {
    // 2^64 mod bound 未満の値を捨てれば剰余が偏らない
    const uint64_t threshold = (uint64_t(0) - bound) % bound;
    while (true)
    {
      const uint64_t r = rng();
      if (r >= threshold)
        return r % bound;
    }
  }

  std::string default_seed(uint32_t width, uint32_t height)
  {
    return std::to_string(width) + "x" + std::to_string(height);
  }

  BlockSelector::BlockSelector(const std::string &seed, uint32_t block_count)
      : rng_(make_rng(seed)), order_(block_count)
  {
    std::iota(order_.begin(), order_.end(), 0u);
  }

  void BlockSelector::settle(uint64_t count)
  {
    const uint64_t n = order_.size();
    count = std::min(count, n);
    while (settled_ < count)
    {
      const uint64_t j = settled_ + uniform_below(rng_, n - settled_);
      std::swap(order_[settled_], order_[j]);
      ++settled_;
    }
  }

  uint32_t BlockSelector::at(uint64_t position)
  {
    settle(position + 1);
    return order_[position];
  }

  std::vector<uint32_t> BlockSelector::prefix(uint64_t count)
  {
    settle(count);
    const uint64_t n = std::min<uint64_t>(count, order_.size());
    return std::vector<uint32_t>(order_.begin(), order_.begin() + static_cast<std::ptrdiff_t>(n));
  }

  BlockSpan BlockSelector::unused(uint64_t carried)
  {
    settle(carried);
    const uint64_t start = std::min<uint64_t>(carried, order_.size());
    return BlockSpan{order_.data() + start, order_.size() - start};
  }
}
