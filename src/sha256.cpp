#include "sha256.h"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace pngdata::detail
{
  namespace
  {
    constexpr std::array<uint32_t, 64> kRoundConstants = {
        0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu,
        0x59f111f1u, 0x923f82a4u, 0xab1c5ed5u, 0xd807aa98u, 0x12835b01u,
        0x243185beu, 0x550c7dc3u, 0x72be5d74u, 0x80deb1feu, 0x9bdc06a7u,
        0xc19bf174u, 0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu,
        0x2de92c6fu, 0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau, 0x983e5152u,
        0xa831c66du, 0xb00327c8u, 0xbf597fc7u, 0xc6e00bf3u, 0xd5a79147u,
        0x06ca6351u, 0x14292967u, 0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu,
        0x53380d13u, 0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u,
        0xa2bfe8a1u, 0xa81a664bu, 0xc24b8b70u, 0xc76c51a3u, 0xd192e819u,
        0xd6990624u, 0xf40e3585u, 0x106aa070u, 0x19a4c116u, 0x1e376c08u,
        0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu,
        0x682e6ff3u, 0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u,
        0x90befffau, 0xa4506cebu, 0xbef9a3f7u, 0xc67178f2u};

    constexpr std::array<uint32_t, 8> kInitialState = {
        0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au,
        0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u};

    inline uint32_t rotr(uint32_t value, uint32_t bits)
    {
      return (value >> bits) | (value << (32u - bits));
    }

    inline uint32_t load_be32(const uint8_t *p)
    {
      return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
             (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
    }

    inline void store_be32(uint8_t *p, uint32_t v)
    {
      p[0] = static_cast<uint8_t>(v >> 24);
      p[1] = static_cast<uint8_t>(v >> 16);
      p[2] = static_cast<uint8_t>(v >> 8);
      p[3] = static_cast<uint8_t>(v);
    }
  }

  Sha256::Sha256() : state_(kInitialState) {}

  void Sha256::update(const void *data, std::size_t length)
  {
    if (finished_)
      throw std::logic_error("SHA-256 は finish 後に update できません");

    if (length == 0)
      return;

    const uint8_t *ptr = static_cast<const uint8_t *>(data);
    total_bytes_ += length;

    if (pending_size_ > 0)
    {
      const std::size_t take = std::min<std::size_t>(length, pending_.size() - pending_size_);
      std::memcpy(pending_.data() + pending_size_, ptr, take);
      pending_size_ += take;
      ptr += take;
      length -= take;
      if (pending_size_ < pending_.size())
        return;
      compress(pending_.data());
      pending_size_ = 0;
    }

    // 64 バイト単位のブロックはバッファを経由せずに処理する。
    while (length >= 64)
    {
      compress(ptr);
      ptr += 64;
      length -= 64;
    }

    if (length > 0)
    {
      std::memcpy(pending_.data(), ptr, length);
      pending_size_ = length;
    }
  }

  const Sha256Digest &Sha256::finish()
  {
    if (finished_)
      return digest_;

    const std::uint64_t bit_length = total_bytes_ * 8u;
    pending_[pending_size_++] = 0x80u;
    if (pending_size_ > 56)
    {
      std::fill(pending_.begin() + static_cast<std::ptrdiff_t>(pending_size_), pending_.end(), 0u);
      compress(pending_.data());
      pending_size_ = 0;
    }
    std::fill(pending_.begin() + static_cast<std::ptrdiff_t>(pending_size_), pending_.begin() + 56, 0u);
    for (int i = 0; i < 8; ++i)
      pending_[56 + i] = static_cast<uint8_t>(bit_length >> (56 - i * 8));
    compress(pending_.data());

    for (std::size_t i = 0; i < state_.size(); ++i)
      store_be32(digest_.data() + i * 4, state_[i]);
    finished_ = true;
    return digest_;
  }

  std::string Sha256::hexdigest()
  {
    const Sha256Digest &bytes = finish();
    return to_hex(bytes.data(), bytes.size());
  }

  void Sha256::compress(const uint8_t *block)
  {
    std::array<uint32_t, 64> w{};
    for (std::size_t i = 0; i < 16; ++i)
      w[i] = load_be32(block + i * 4);
    for (std::size_t i = 16; i < 64; ++i)
    {
      const uint32_t s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
      const uint32_t s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
      w[i] = w[i - 16] + s0 + w[i - 7] + s1;
    }

    std::array<uint32_t, 8> v = state_;
    for (std::size_t i = 0; i < 64; ++i)
    {
      const uint32_t s1 = rotr(v[4], 6) ^ rotr(v[4], 11) ^ rotr(v[4], 25);
      const uint32_t ch = (v[4] & v[5]) ^ (~v[4] & v[6]);
      const uint32_t t1 = v[7] + s1 + ch + kRoundConstants[i] + w[i];
      const uint32_t s0 = rotr(v[0], 2) ^ rotr(v[0], 13) ^ rotr(v[0], 22);
      const uint32_t maj = (v[0] & v[1]) ^ (v[0] & v[2]) ^ (v[1] & v[2]);
      const uint32_t t2 = s0 + maj;
      // a..h を 1 つずつずらす
      for (std::size_t k = 7; k > 0; --k)
        v[k] = v[k - 1];
      v[4] += t1;
      v[0] = t1 + t2;
    }
    for (std::size_t i = 0; i < 8; ++i)
      state_[i] += v[i];
  }

  Sha256Digest sha256(const uint8_t *data, std::size_t length)
  {
    Sha256 h;
    h.update(data, length);
    return h.finish();
  }

  std::string to_hex(const uint8_t *data, std::size_t length)
  {
    static constexpr char kHexDigits[] = "0123456789abcdef";
    std::string result(length * 2, '0');
    for (std::size_t i = 0; i < length; ++i)
    {
      result[i * 2 + 0] = kHexDigits[(data[i] >> 4) & 0x0fu];
      result[i * 2 + 1] = kHexDigits[data[i] & 0x0fu];
    }
    return result;
  }
}
