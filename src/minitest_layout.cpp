// minitest_layout.cpp - layout tags, capacity, carrier binding
#include <cstdint>
#include <iostream>
#include <string>

#include "layout.h"

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

using namespace pngdata;
using namespace pngdata::layout;

static bool test_parse_known_tags(){
    const char* tags[] = {"g1","g2","g4","g8","g16","ga1","ga2","ga4","ga8","ga16",
                          "rgb8","rgb16","rgba8","rgba16","lo1","lo2","lo3","lo4","lo5","lo6","lo7"};
    for(const char* t : tags){
        Layout l; Error err;
        T_ASSERT(parse_layout(t, l, err));
        T_ASSERT(err.kind == ErrorKind::None);
        T_ASSERT(layout_tag(l) == t);
    }
    Layout l; Error err;
    T_ASSERT(parse_layout("rgba16", l, err));
    T_ASSERT(l.mode == Mode::Dense && l.channels == 4 && l.bit_depth == 16);
    T_ASSERT(l.bits_per_pixel() == 64);
    T_ASSERT(parse_layout("lo3", l, err));
    T_ASSERT(l.mode == Mode::Embed && !l.bound() && l.bit_depth == 3);
    return true;
}

static bool test_reject_unknown_tags(){
    const char* bad[] = {"", "rgb", "rgb4", "rgba1", "g3", "ga32", "lo0", "lo8", "lo", "xyz8", "8", "rgb8x"};
    for(const char* t : bad){
        Layout l; Error err;
        T_ASSERT(!parse_layout(t, l, err));
        T_ASSERT(err.kind == ErrorKind::UnsupportedLayout);
        T_ASSERT(!err.message.empty());
    }
    return true;
}

static bool test_capacity(){
    Layout l; Error err;
    T_ASSERT(parse_layout("rgb8", l, err));
    T_ASSERT(capacity_bits(l, 10, 10) == 10u*10u*24u);
    T_ASSERT(capacity_bytes(l, 10, 10) == 300u);

    // lo2 on a 100x100 RGBA carrier
    uint64_t bits = 0;
    T_ASSERT(capacity_bits("lo2", 100, 100, 4, bits, err));
    T_ASSERT(bits == 80000u);
    T_ASSERT(parse_layout("lo2", l, err));
    l.channels = 4;
    T_ASSERT(capacity_bytes(l, 100, 100) == 10000u);

    // 切り捨て
    T_ASSERT(parse_layout("g1", l, err));
    T_ASSERT(capacity_bits(l, 3, 3) == 9u);
    T_ASSERT(capacity_bytes(l, 3, 3) == 1u);

    T_ASSERT(!capacity_bits("lo2", 10, 10, 0, bits, err));
    T_ASSERT(err.kind == ErrorKind::UnsupportedLayout);
    err.clear();
    T_ASSERT(!capacity_bits("bogus", 10, 10, 3, bits, err));
    T_ASSERT(err.kind == ErrorKind::UnsupportedLayout);
    return true;
}

static bool test_channel_access(){
    Layout dense{Mode::Dense, 1, 4};
    T_ASSERT(dense.write_channel(0xFFFF, 0x5) == 0x5);
    T_ASSERT(dense.read_channel(0x5) == 0x5);

    Layout embed{Mode::Embed, 3, 3};
    T_ASSERT(embed.write_channel(0xA8, 0x7) == 0xAF);
    T_ASSERT(embed.write_channel(0xAF, 0x0) == 0xA8);
    T_ASSERT(embed.read_channel(0xAD) == 0x5);
    // 16-bit samples keep all 13 high bits
    T_ASSERT(embed.write_channel(0xBEEF, 0x2) == 0xBEEA);
    return true;
}

static bool test_bind_carrier(){
    Error err;
    Layout lo2, bound;
    T_ASSERT(parse_layout("lo2", lo2, err));

    RasterBuffer rgba; rgba.reset(4, 4, 4, 8);
    T_ASSERT(bind_carrier(lo2, rgba, bound, err));
    T_ASSERT(bound.channels == 4 && bound.bit_depth == 2 && bound.mode == Mode::Embed);

    RasterBuffer gray16; gray16.reset(4, 4, 1, 16);
    T_ASSERT(bind_carrier(lo2, gray16, bound, err));
    T_ASSERT(bound.channels == 1);

    RasterBuffer gray4; gray4.reset(4, 4, 1, 4);
    T_ASSERT(!bind_carrier(lo2, gray4, bound, err));
    T_ASSERT(err.kind == ErrorKind::UnsupportedLayout);

    Layout rgb8;
    err.clear();
    T_ASSERT(parse_layout("rgb8", rgb8, err));
    T_ASSERT(!bind_carrier(rgb8, rgba, bound, err));
    T_ASSERT(err.kind == ErrorKind::UnsupportedLayout);
    T_ASSERT(err.message.find("rgba8") != std::string::npos);

    // ga1 lives in 8-bit samples
    Layout ga1;
    T_ASSERT(parse_layout("ga1", ga1, err));
    T_ASSERT(container_depth(ga1) == 8);
    RasterBuffer ga; ga.reset(2, 2, 2, 8);
    T_ASSERT(bind_carrier(ga1, ga, bound, err));
    Layout g2;
    T_ASSERT(parse_layout("g2", g2, err));
    T_ASSERT(container_depth(g2) == 2);
    return true;
}

static bool test_layout_from_raster(){
    RasterBuffer r; Layout l; Error err;
    r.reset(1, 1, 3, 16);
    T_ASSERT(layout_from_raster(r, l, err));
    T_ASSERT(layout_tag(l) == "rgb16");
    r.reset(1, 1, 1, 4);
    T_ASSERT(layout_from_raster(r, l, err));
    T_ASSERT(layout_tag(l) == "g4");
    r.reset(1, 1, 5, 8);
    T_ASSERT(!layout_from_raster(r, l, err));
    T_ASSERT(err.kind == ErrorKind::UnsupportedLayout);
    return true;
}

int main(){
    bool ok = true;

    ok &= test_parse_known_tags();
    ok &= test_reject_unknown_tags();
    std::cout << "[A] layout tags : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_capacity();
    std::cout << "[B] capacity : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_channel_access();
    std::cout << "[C] channel access : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_bind_carrier();
    ok &= test_layout_from_raster();
    std::cout << "[D] carrier binding : " << (ok? "OK":"FAIL") << "\n";

    std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok? 0 : 1;
}
