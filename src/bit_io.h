// bit_io.h - LSB-first bit I/O over byte buffers.
// Notes:
// - Stream bit p is bit (p & 7) of byte (p >> 3).
// - The writer grows its own std::vector; the reader works on a borrowed span.
// - Fields up to 32 bits per call; put_u64 splits 64-bit values.

#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#ifndef PNGDATA_LIKELY
#if defined(__GNUC__) || defined(__clang__)
#define PNGDATA_LIKELY(x) __builtin_expect(!!(x), 1)
#define PNGDATA_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define PNGDATA_LIKELY(x) (x)
#define PNGDATA_UNLIKELY(x) (x)
#endif
#endif

namespace pngdata::detail::bitio
{
    inline uint64_t low_mask(unsigned n)
    {
        return n >= 64 ? ~uint64_t(0) : ((uint64_t(1) << n) - 1);
    }

    // -------- BitReader --------
    class BitReader
    {
    public:
        BitReader(const uint8_t *data, size_t size)
            : p_(data), end_(data + size), acc_(0), bits_(0) {}

        // Read n bits (n <= 32). Returns false once the buffer is exhausted.
        inline bool read(unsigned n, uint64_t &out)
        {
            if (PNGDATA_UNLIKELY(n == 0))
            {
                out = 0;
                return true;
            }
            fill(n);
            if (PNGDATA_UNLIKELY(bits_ < n))
                return false;
            out = acc_ & low_mask(n);
            acc_ >>= n;
            bits_ -= n;
            return true;
        }

        inline uint64_t bits_remaining() const
        {
            return static_cast<uint64_t>(end_ - p_) * 8u + bits_;
        }

    private:
        // Keep at least k bits in the accumulator while input lasts (k <= 32).
        inline void fill(unsigned k)
        {
            while (bits_ < k && bits_ <= 56 && p_ < end_)
            {
                acc_ |= static_cast<uint64_t>(*p_++) << bits_;
                bits_ += 8;
            }
        }

        const uint8_t *p_;
        const uint8_t *end_;
        uint64_t acc_;
        unsigned bits_;
    };

    // -------- BitWriter --------
    class BitWriter
    {
    public:
        explicit BitWriter(std::vector<uint8_t> &dst)
            : out_(dst), acc_(0), bits_(0) {}

        // Put n bits (lowest n bits of v), n <= 32
        inline void put(uint64_t v, unsigned n)
        {
            acc_ |= (v & low_mask(n)) << bits_;
            bits_ += n;
            flush_bytes();
        }

        // Optimized 1..8 bits
        inline void put_upto8(uint32_t v, unsigned n)
        {
            // precondition: 1 <= n <= 8
            acc_ |= static_cast<uint64_t>(v & ((1u << n) - 1u)) << bits_;
            bits_ += n;
            flush_bytes();
        }

        inline void put_u16(uint16_t v) { put(v, 16); }
        inline void put_u64(uint64_t v)
        {
            put(v & 0xFFFFFFFFu, 32);
            put(v >> 32, 32);
        }

        inline void put_bytes(const uint8_t *data, size_t size)
        {
            if (PNGDATA_LIKELY(bits_ == 0))
            {
                out_.insert(out_.end(), data, data + size);
                return;
            }
            for (size_t i = 0; i < size; ++i)
                put_upto8(data[i], 8);
        }

        // Finish writing: if leftover bits exist, zero-pad to the next byte.
        inline void finish()
        {
            if (bits_ > 0)
            {
                out_.push_back(static_cast<uint8_t>(acc_));
                acc_ = 0;
                bits_ = 0;
            }
        }

    private:
        inline void flush_bytes()
        {
            while (bits_ >= 8)
            {
                out_.push_back(static_cast<uint8_t>(acc_));
                acc_ >>= 8;
                bits_ -= 8;
            }
        }

        std::vector<uint8_t> &out_;
        uint64_t acc_;
        unsigned bits_;
    };

} // namespace pngdata::detail::bitio
