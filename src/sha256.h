#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pngdata::detail
{
  using Sha256Digest = std::array<uint8_t, 32>;

  // SHA-256 ハッシュを計算するための簡易クラス。
  class Sha256
  {
  public:
    Sha256();

    // データをハッシュへ追加する。
    void update(const void *data, std::size_t length);

    // バイト配列としてハッシュ値を取得する。finish を複数回呼んでも同じ値を返す。
    const Sha256Digest &finish();

    // ハッシュ値を 16 進文字列として取得する。
    std::string hexdigest();

  private:
    void compress(const uint8_t *block);

    std::array<uint32_t, 8> state_{};
    std::array<uint8_t, 64> pending_{};
    std::size_t pending_size_ = 0;
    std::uint64_t total_bytes_ = 0;
    bool finished_ = false;
    Sha256Digest digest_{};
  };

  Sha256Digest sha256(const uint8_t *data, std::size_t length);

  inline Sha256Digest sha256(const std::vector<uint8_t> &data)
  {
    return sha256(data.data(), data.size());
  }

  std::string to_hex(const uint8_t *data, std::size_t length);
}
