// minitest_selector.cpp - seeded block permutation
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <numeric>
#include <string>
#include <vector>

#include "block_selector.h"

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

using namespace pngdata::select;

static bool test_default_seed(){
    T_ASSERT(default_seed(100, 100) == "100x100");
    T_ASSERT(default_seed(1920, 1080) == "1920x1080");
    return true;
}

static bool test_rng_is_deterministic(){
    Rng a = make_rng("100x100");
    Rng b = make_rng("100x100");
    Rng c = make_rng("100x101");
    bool differs = false;
    for(int i=0;i<16;++i){
        const uint64_t va = a(), vb = b(), vc = c();
        T_ASSERT(va == vb);
        differs |= (va != vc);
    }
    T_ASSERT(differs);

    Rng r = make_rng("bounds");
    for(uint64_t bound : {uint64_t(1), uint64_t(2), uint64_t(3), uint64_t(1000), (uint64_t(1) << 63) + 5}){
        for(int i=0;i<200;++i) T_ASSERT(uniform_below(r, bound) < bound);
    }
    return true;
}

// 埋め込み済み画像との互換性: seed からの並びは固定値で確認する
static bool test_golden_vectors(){
    Rng r = make_rng("100x100");
    T_ASSERT(r() == 13443655906498337409ull);
    T_ASSERT(r() == 14909169551624082585ull);
    T_ASSERT(r() == 16705005939781377516ull);

    BlockSelector sel("100x100", 10000);
    T_ASSERT((sel.prefix(6) == std::vector<uint32_t>{7409, 1171, 8164, 4275, 920, 2430}));

    BlockSelector small("scan", 64);
    T_ASSERT((small.prefix(8) == std::vector<uint32_t>{17, 35, 2, 30, 24, 28, 18, 38}));

    BlockSelector named("pngdata", 1000);
    T_ASSERT((named.prefix(5) == std::vector<uint32_t>{630, 766, 125, 78, 11}));
    return true;
}

static bool test_permutation(){
    BlockSelector sel("perm", 1000);
    T_ASSERT(sel.block_count() == 1000);
    T_ASSERT(sel.settled() == 0);
    std::vector<uint32_t> all = sel.prefix(1000);
    T_ASSERT(all.size() == 1000);
    std::vector<uint32_t> sorted = all;
    std::sort(sorted.begin(), sorted.end());
    std::vector<uint32_t> ident(1000);
    std::iota(ident.begin(), ident.end(), 0u);
    T_ASSERT(sorted == ident);
    T_ASSERT(all != ident);

    // 要求より長い prefix は全体で打ち切る
    BlockSelector small("perm", 5);
    T_ASSERT(small.prefix(50).size() == 5);
    return true;
}

static bool test_prefix_stability(){
    BlockSelector lazy("stable", 10000);
    const std::vector<uint32_t> head = lazy.prefix(37);
    T_ASSERT(lazy.settled() == 37);

    BlockSelector full("stable", 10000);
    const std::vector<uint32_t> all = full.prefix(10000);
    T_ASSERT(std::equal(head.begin(), head.end(), all.begin()));

    BlockSelector one("stable", 10000);
    for(uint64_t i=0;i<37;++i) T_ASSERT(one.at(i) == head[i]);
    T_ASSERT(one.at(5000) == all[5000]);

    BlockSelector other("unstable", 10000);
    T_ASSERT(other.prefix(37) != head);
    return true;
}

static bool test_unused_partition(){
    BlockSelector sel("split", 300);
    const std::vector<uint32_t> carried = sel.prefix(120);
    const BlockSpan rest = sel.unused(120);
    T_ASSERT(rest.size == 180);

    std::vector<uint32_t> seen(carried);
    seen.insert(seen.end(), rest.data, rest.data + rest.size);
    std::sort(seen.begin(), seen.end());
    for(uint32_t i=0;i<300;++i) T_ASSERT(seen[i] == i);

    const BlockSpan none = sel.unused(400);
    T_ASSERT(none.size == 0);
    return true;
}

int main(){
    bool ok = true;

    ok &= test_default_seed();
    ok &= test_rng_is_deterministic();
    ok &= test_golden_vectors();
    std::cout << "[A] seeded rng : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_permutation();
    ok &= test_prefix_stability();
    std::cout << "[B] permutation : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_unused_partition();
    std::cout << "[C] carrier / filler split : " << (ok? "OK":"FAIL") << "\n";

    std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok? 0 : 1;
}
