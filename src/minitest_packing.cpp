// minitest_packing.cpp - bit packing over dense and embed scans
#include <cstdint>
#include <iostream>
#include <vector>

#include "block_selector.h"
#include "layout.h"
#include "packing.h"

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

using namespace pngdata;
using layout::Layout;
using layout::Mode;
using packing::BitCursor;
using packing::CarrierScan;

static bool test_dense_bytes_verbatim(){
    RasterBuffer r; r.reset(4, 4, 1, 8);
    const Layout g8{Mode::Dense, 1, 8};
    std::vector<uint8_t> stream;
    for(int i=0;i<10;++i) stream.push_back(static_cast<uint8_t>(i + 1));

    Error err; uint64_t units = 0;
    T_ASSERT(packing::write_stream(r, g8, CarrierScan::linear(0, 16), stream, 80, units, err));
    T_ASSERT(units == 10);
    for(int i=0;i<10;++i) T_ASSERT(r.samples[i] == i + 1);
    for(int i=10;i<16;++i) T_ASSERT(r.samples[i] == 0);

    BitCursor cur;
    std::vector<uint8_t> back;
    T_ASSERT(packing::read_stream(r, g8, CarrierScan::linear(0, 16), cur, 80, back, err));
    T_ASSERT(back == stream);
    T_ASSERT(cur.position == 80);

    // ユニットの途中から読む: bits 12..19 = (3 << 4) | (2 >> 4)
    BitCursor mid{12};
    T_ASSERT(packing::read_stream(r, g8, CarrierScan::linear(0, 16), mid, 8, back, err));
    T_ASSERT(back.size() == 1 && back[0] == 0x30);
    T_ASSERT(mid.position == 20);
    return true;
}

static bool test_dense_sub_byte(){
    RasterBuffer r; r.reset(3, 3, 1, 1);
    const Layout g1{Mode::Dense, 1, 1};
    const std::vector<uint8_t> stream = {0xB2};
    Error err; uint64_t units = 0;
    T_ASSERT(packing::write_stream(r, g1, CarrierScan::linear(0, 9), stream, 8, units, err));
    T_ASSERT(units == 8);
    const uint16_t expect[] = {0,1,0,0,1,1,0,1,0};
    for(int i=0;i<9;++i) T_ASSERT(r.samples[i] == expect[i]);

    // ga2 in 8-bit samples: 4 bits per pixel, first bit to bit 0 of channel 0
    RasterBuffer ga; ga.reset(2, 1, 2, 8);
    const Layout ga2{Mode::Dense, 2, 2};
    T_ASSERT(packing::write_stream(ga, ga2, CarrierScan::linear(0, 2), std::vector<uint8_t>{0xE4}, 8, units, err));
    T_ASSERT(ga.samples[0] == 0 && ga.samples[1] == 1 && ga.samples[2] == 2 && ga.samples[3] == 3);
    return true;
}

static bool test_embed_preserves_high_bits(){
    RasterBuffer r; r.reset(4, 1, 3, 8);
    for(size_t i=0;i<r.samples.size();++i) r.samples[i] = static_cast<uint16_t>(0xA0 + i * 3);
    const RasterBuffer original = r;
    const Layout lo3{Mode::Embed, 3, 3};
    const std::vector<uint8_t> stream = {0x5A, 0xC3};

    Error err; uint64_t units = 0;
    T_ASSERT(packing::write_stream(r, lo3, CarrierScan::linear(0, 4), stream, 16, units, err));
    T_ASSERT(units == 2); // 16 bits -> two 9-bit units, last one padded
    for(size_t i=0;i<r.samples.size();++i)
        T_ASSERT((r.samples[i] & ~0x7u) == (original.samples[i] & ~0x7u));
    for(size_t i=6;i<r.samples.size();++i)
        T_ASSERT(r.samples[i] == original.samples[i]);
    // bit 15 of the stream, then two zero padding bits
    T_ASSERT((r.samples[5] & 0x7u) == 0x1u);

    BitCursor cur;
    std::vector<uint8_t> back;
    T_ASSERT(packing::read_stream(r, lo3, CarrierScan::linear(0, 4), cur, 16, back, err));
    T_ASSERT(back == stream);

    RasterBuffer deep; deep.reset(1, 1, 2, 16);
    deep.samples = {0xFFFF, 0x1234};
    const Layout lo7{Mode::Embed, 2, 7};
    T_ASSERT(packing::write_stream(deep, lo7, CarrierScan::linear(0, 1), std::vector<uint8_t>{0, 0}, 14, units, err));
    T_ASSERT(deep.samples[0] == 0xFF80);
    T_ASSERT(deep.samples[1] == 0x1200);
    return true;
}

static bool test_selected_scan(){
    RasterBuffer a; a.reset(8, 8, 4, 8);
    RasterBuffer b = a;
    const Layout lo1{Mode::Embed, 4, 1};
    std::vector<uint8_t> stream(20);
    for(size_t i=0;i<stream.size();++i) stream[i] = static_cast<uint8_t>(0x9D * (i + 1));

    Error err; uint64_t units = 0;
    select::BlockSelector sel("scan", 64);
    T_ASSERT(packing::write_stream(a, lo1, CarrierScan::selected(sel), stream, 160, units, err));
    T_ASSERT(units == 40);

    select::BlockSelector same("scan", 64);
    const std::vector<uint32_t> order = same.prefix(40);
    T_ASSERT(packing::write_stream(b, lo1, CarrierScan::listed(select::BlockSpan{order.data(), order.size()}),
                                   stream, 160, units, err));
    T_ASSERT(a.samples == b.samples);

    // 未使用ブロックは触らない
    const select::BlockSpan rest = same.unused(40);
    for(uint64_t i=0;i<rest.size;++i){
        const uint16_t* px = a.pixel(rest.data[i]);
        T_ASSERT(px[0] == 0 && px[1] == 0 && px[2] == 0 && px[3] == 0);
    }

    select::BlockSelector reader_sel("scan", 64);
    BitCursor cur;
    std::vector<uint8_t> back;
    T_ASSERT(packing::read_stream(a, lo1, CarrierScan::selected(reader_sel), cur, 160, back, err));
    T_ASSERT(back == stream);
    return true;
}

static bool test_capacity_errors(){
    RasterBuffer r; r.reset(4, 4, 1, 8);
    const RasterBuffer original = r;
    const Layout g8{Mode::Dense, 1, 8};
    Error err; uint64_t units = 0;
    std::vector<uint8_t> stream(17, 0xFF);
    T_ASSERT(!packing::write_stream(r, g8, CarrierScan::linear(0, 16), stream, 17 * 8, units, err));
    T_ASSERT(err.kind == ErrorKind::CapacityExceeded);
    T_ASSERT(r.samples == original.samples);

    err.clear();
    T_ASSERT(packing::write_stream(r, g8, CarrierScan::linear(0, 16), stream, 16 * 8, units, err));

    err.clear();
    BitCursor cur{8};
    std::vector<uint8_t> out = {42};
    T_ASSERT(!packing::read_stream(r, g8, CarrierScan::linear(0, 16), cur, 16 * 8, out, err));
    T_ASSERT(err.kind == ErrorKind::CorruptFrame);
    T_ASSERT(out.size() == 1 && out[0] == 42);
    T_ASSERT(cur.position == 8);

    packing::StreamWriter w(r, g8, CarrierScan::linear(0, 1));
    T_ASSERT(w.capacity_bits() == 8);
    T_ASSERT(w.put(0x3, 2));
    T_ASSERT(!w.put(0x7F, 7));
    T_ASSERT(w.put(0x3F, 6));
    w.finish();
    T_ASSERT(r.samples[0] == 0xFF);
    return true;
}

int main(){
    bool ok = true;

    ok &= test_dense_bytes_verbatim();
    ok &= test_dense_sub_byte();
    std::cout << "[A] dense packing : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_embed_preserves_high_bits();
    std::cout << "[B] embed packing : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_selected_scan();
    std::cout << "[C] selected scan : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_capacity_errors();
    std::cout << "[D] capacity : " << (ok? "OK":"FAIL") << "\n";

    std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok? 0 : 1;
}
