// minitest_filler.cpp - entropy estimate and filler sampling
#include <array>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "filler.h"

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

using namespace pngdata;

static bool near(double a, double b, double tol){ return std::fabs(a - b) <= tol; }

static bool test_entropy(){
    T_ASSERT(filler::shannon_entropy(std::vector<uint8_t>{}) == 0.0);
    T_ASSERT(filler::shannon_entropy(std::vector<uint8_t>(100, 7)) == 0.0);

    std::vector<uint8_t> all(256);
    for(int i=0;i<256;++i) all[i] = static_cast<uint8_t>(i);
    T_ASSERT(near(filler::shannon_entropy(all), 8.0, 1e-9));

    T_ASSERT(near(filler::shannon_entropy(std::vector<uint8_t>{1, 2, 1, 2}), 1.0, 1e-12));

    const auto h = filler::byte_histogram(all.data(), all.size());
    for(uint64_t c : h) T_ASSERT(c == 1);
    return true;
}

static bool test_sampler_distribution(){
    select::Rng rng = filler::make_filler_rng(1234);

    filler::ByteHistogram single{};
    single[0x41] = 9;
    const filler::ByteSampler only(single);
    for(int i=0;i<100;++i) T_ASSERT(only.next(rng) == 0x41);

    // a:b = 3:1
    filler::ByteHistogram skew{};
    skew['a'] = 3;
    skew['b'] = 1;
    const filler::ByteSampler sampler(skew);
    T_ASSERT(sampler.total() == 4);
    int na = 0, nb = 0;
    const int draws = 40000;
    for(int i=0;i<draws;++i){
        const uint8_t v = sampler.next(rng);
        T_ASSERT(v == 'a' || v == 'b');
        (v == 'a' ? na : nb)++;
    }
    T_ASSERT(near(static_cast<double>(na) / draws, 0.75, 0.02));

    // 空のヒストグラムは一様分布
    const filler::ByteSampler uniform = filler::ByteSampler::uniform();
    T_ASSERT(uniform.total() == 256);
    std::array<int, 256> counts{};
    for(int i=0;i<256*200;++i) counts[uniform.next(rng)]++;
    for(int c : counts) T_ASSERT(c > 100 && c < 320);
    return true;
}

static bool test_filler_rng(){
    select::Rng a = filler::make_filler_rng(77);
    select::Rng b = filler::make_filler_rng(77);
    select::Rng c = filler::make_filler_rng(78);
    const uint64_t va = a();
    T_ASSERT(va == b());
    T_ASSERT(va != c());

    select::Rng r1 = filler::make_filler_rng(std::nullopt);
    select::Rng r2 = filler::make_filler_rng(std::nullopt);
    bool differs = false;
    for(int i=0;i<4;++i) differs |= (r1() != r2());
    T_ASSERT(differs);
    return true;
}

static bool test_fill_units(){
    RasterBuffer r; r.reset(10, 1, 3, 8);
    for(size_t i=0;i<r.samples.size();++i) r.samples[i] = 0xF0;
    const layout::Layout lo2{layout::Mode::Embed, 3, 2};

    const std::vector<uint32_t> listed = {9, 2, 5};
    select::Rng rng = filler::make_filler_rng(5);
    filler::ByteHistogram ones{};
    ones[0xFF] = 1;
    const uint64_t n = filler::fill_units(r, lo2, packing::CarrierScan::listed(select::BlockSpan{listed.data(), listed.size()}),
                                          filler::ByteSampler(ones), rng);
    T_ASSERT(n == 3);
    for(uint32_t px=0;px<10;++px){
        const bool touched = px == 9 || px == 2 || px == 5;
        for(uint32_t c=0;c<3;++c){
            const uint16_t v = r.pixel(px)[c];
            T_ASSERT((v & 0xFCu) == 0xF0u);
            T_ASSERT(v == (touched ? 0xF3 : 0xF0));
        }
    }
    return true;
}

int main(){
    bool ok = true;

    ok &= test_entropy();
    std::cout << "[A] shannon entropy : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_sampler_distribution();
    ok &= test_filler_rng();
    std::cout << "[B] sampler : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_fill_units();
    std::cout << "[C] fill units : " << (ok? "OK":"FAIL") << "\n";

    std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok? 0 : 1;
}
