// minitest_codec.cpp - encode / decode / read_header over whole rasters
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "block_selector.h"
#include "codec.h"
#include "layout.h"

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

using namespace pngdata;

static std::vector<uint8_t> make_payload(size_t n, uint32_t salt = 1){
    std::vector<uint8_t> p(n);
    uint32_t x = 0x12345678u ^ salt;
    for(size_t i=0;i<n;++i){ x = x * 1664525u + 1013904223u; p[i] = static_cast<uint8_t>(x >> 24); }
    return p;
}

// 適当な模様の搬送画像
static RasterBuffer make_carrier(uint32_t w, uint32_t h, uint32_t ch, uint32_t depth){
    RasterBuffer r; r.reset(w, h, ch, depth);
    const uint32_t maxv = (1u << depth) - 1u;
    for(size_t i=0;i<r.samples.size();++i)
        r.samples[i] = static_cast<uint16_t>((i * 2654435761u >> 7) & maxv);
    return r;
}

static layout::Layout L(const char* tag){
    layout::Layout l; Error err;
    layout::parse_layout(tag, l, err);
    return l;
}

static bool test_lo2_scenario(){
    RasterBuffer carrier = make_carrier(100, 100, 4, 8);
    const auto payload = make_payload(50);
    CodecOptions opt;
    Error err;
    EncodeReport rep;
    T_ASSERT(encode(carrier, L("lo2"), payload, "test", opt, err, &rep));
    T_ASSERT(rep.stage == CodecStage::Done);
    T_ASSERT(rep.seed == "100x100");
    T_ASSERT(rep.capacity_bits == 80000u);
    T_ASSERT(rep.frame_bits == (48u + 4u + 50u) * 8u);
    T_ASSERT(rep.carrier_blocks == (rep.frame_bits + 7u) / 8u);
    T_ASSERT(rep.filler_blocks == 0);

    std::vector<uint8_t> out;
    HeaderInfo header;
    T_ASSERT(decode(carrier, L("lo2"), opt, out, err, &header));
    T_ASSERT(out == payload);
    T_ASSERT(header.comment == "test");
    T_ASSERT(header.payload_length == 50);

    CodecOptions explicit_seed;
    explicit_seed.seed = "100x100";
    out.clear();
    T_ASSERT(decode(carrier, L("lo2"), explicit_seed, out, err));
    T_ASSERT(out == payload);

    CodecOptions wrong;
    wrong.seed = "wrong";
    std::vector<uint8_t> untouched = {1, 2, 3};
    err.clear();
    T_ASSERT(!decode(carrier, L("lo2"), wrong, untouched, err));
    T_ASSERT(err.kind == ErrorKind::ChecksumMismatch || err.kind == ErrorKind::CorruptFrame);
    T_ASSERT((untouched == std::vector<uint8_t>{1, 2, 3}));
    return true;
}

static bool test_embed_preservation(){
    for(const char* tag : {"lo1", "lo3", "lo7"}){
        for(uint32_t depth : {8u, 16u}){
            const RasterBuffer original = make_carrier(32, 24, 3, depth);
            RasterBuffer enc = original;
            CodecOptions opt; opt.seed = "keep";
            Error err; EncodeReport rep;
            const auto payload = make_payload(60);
            T_ASSERT(encode(enc, L(tag), payload, "", opt, err, &rep));

            const layout::Layout l = L(tag);
            const uint32_t low = (1u << l.bit_depth) - 1u;
            for(size_t i=0;i<enc.samples.size();++i)
                T_ASSERT((enc.samples[i] & ~low) == (original.samples[i] & ~low));

            select::BlockSelector sel("keep", 32 * 24);
            const auto carried = sel.prefix(rep.carrier_blocks);
            const std::set<uint32_t> carried_set(carried.begin(), carried.end());
            for(uint32_t px=0; px<32u*24u; ++px){
                if(carried_set.count(px)) continue;
                for(uint32_t c=0;c<3;++c) T_ASSERT(enc.pixel(px)[c] == original.pixel(px)[c]);
            }

            std::vector<uint8_t> out;
            T_ASSERT(decode(enc, L(tag), opt, out, err));
            T_ASSERT(out == payload);
        }
    }
    return true;
}

static bool test_capacity_boundary(){
    // lo1 on 40x40 gray: 1600 bits = 200 bytes, 48 bytes of header
    const RasterBuffer original = make_carrier(40, 40, 1, 8);
    RasterBuffer exact = original;
    Error err;
    CodecOptions opt;
    const auto fits = make_payload(152);
    T_ASSERT(encode(exact, L("lo1"), fits, "", opt, err));
    std::vector<uint8_t> out;
    T_ASSERT(decode(exact, L("lo1"), opt, out, err));
    T_ASSERT(out == fits);

    RasterBuffer over = original;
    T_ASSERT(!encode(over, L("lo1"), make_payload(153), "", opt, err));
    T_ASSERT(err.kind == ErrorKind::CapacityExceeded);
    T_ASSERT(over.samples == original.samples);

    // dense g8 10x10: 100 bytes
    RasterBuffer dense; dense.reset(10, 10, 1, 8);
    err.clear();
    T_ASSERT(encode(dense, L("g8"), make_payload(50), "ab", opt, err));
    err.clear();
    T_ASSERT(!encode(dense, L("g8"), make_payload(51), "ab", opt, err));
    T_ASSERT(err.kind == ErrorKind::CapacityExceeded);
    return true;
}

static bool test_seed_sensitivity(){
    RasterBuffer carrier = make_carrier(64, 64, 4, 8);
    CodecOptions opt; opt.seed = "right seed";
    Error err;
    T_ASSERT(encode(carrier, L("lo2"), make_payload(300, 9), "seeded", opt, err));
    for(int i=0;i<20;++i){
        CodecOptions bad; bad.seed = "guess-" + std::to_string(i);
        std::vector<uint8_t> out;
        err.clear();
        T_ASSERT(!decode(carrier, L("lo2"), bad, out, err));
        T_ASSERT(err.kind == ErrorKind::ChecksumMismatch || err.kind == ErrorKind::CorruptFrame);
        T_ASSERT(out.empty());
    }
    return true;
}

static bool test_header_only(){
    RasterBuffer carrier = make_carrier(50, 40, 3, 8);
    CodecOptions opt;
    Error err;
    T_ASSERT(encode(carrier, L("lo4"), make_payload(123), "ヘッダ", opt, err));

    HeaderInfo h;
    T_ASSERT(read_header(carrier, L("lo4"), opt, h, err));
    HeaderInfo full;
    std::vector<uint8_t> out;
    T_ASSERT(decode(carrier, L("lo4"), opt, out, err, &full));
    T_ASSERT(h.comment == full.comment && h.comment == "ヘッダ");
    T_ASSERT(h.payload_length == full.payload_length && h.payload_length == 123);
    T_ASSERT(h.version == 1);

    // ペイロード末尾を壊してもヘッダは読める
    RasterBuffer damaged = carrier;
    select::BlockSelector sel("50x40", 2000);
    const uint64_t units = (frame::frame_bits(123, std::string("ヘッダ").size()) + 11) / 12;
    const uint32_t last = sel.at(units - 1);
    damaged.pixel(last)[0] ^= 0x1;
    damaged.pixel(last)[1] ^= 0x1;
    damaged.pixel(last)[2] ^= 0x1;
    HeaderInfo dh;
    T_ASSERT(read_header(damaged, L("lo4"), opt, dh, err));
    T_ASSERT(dh.payload_length == 123);
    err.clear();
    T_ASSERT(!decode(damaged, L("lo4"), opt, out, err));
    T_ASSERT(err.kind == ErrorKind::ChecksumMismatch);
    return true;
}

static bool test_decode_stages(){
    RasterBuffer carrier = make_carrier(40, 30, 3, 8);
    CodecOptions opt;
    Error err;
    T_ASSERT(encode(carrier, L("lo2"), make_payload(80), "stage", opt, err));

    DecodeReport rep;
    std::vector<uint8_t> out;
    T_ASSERT(decode(carrier, L("lo2"), opt, out, err, nullptr, &rep));
    T_ASSERT(rep.stage == CodecStage::Done);
    T_ASSERT(rep.seed == "40x30");
    T_ASSERT(rep.capacity_bits == 40u * 30u * 6u);

    HeaderInfo h;
    T_ASSERT(read_header(carrier, L("lo2"), opt, h, err, &rep));
    T_ASSERT(rep.stage == CodecStage::Done);

    // ペイロードの最後のユニットを壊す: ヘッダと本体は読めて checksum で止まる
    RasterBuffer damaged = carrier;
    select::BlockSelector sel("40x30", 1200);
    const uint64_t units = (frame::frame_bits(80, 5) + 5) / 6;
    damaged.pixel(sel.at(units - 1))[0] ^= 0x1;
    err.clear();
    T_ASSERT(!decode(damaged, L("lo2"), opt, out, err, nullptr, &rep));
    T_ASSERT(err.kind == ErrorKind::ChecksumMismatch);
    T_ASSERT(rep.stage == CodecStage::PayloadRead);

    // seed 違いはヘッダの時点で止まる
    CodecOptions wrong; wrong.seed = "not it";
    err.clear();
    T_ASSERT(!decode(carrier, L("lo2"), wrong, out, err, nullptr, &rep));
    T_ASSERT(rep.seed == "not it");
    T_ASSERT(rep.stage == CodecStage::Idle || rep.stage == CodecStage::HeaderRead || rep.stage == CodecStage::PayloadRead);
    T_ASSERT(rep.stage != CodecStage::Done);
    return true;
}

static bool test_entropy_flag_irrelevant(){
    const RasterBuffer original = make_carrier(60, 60, 4, 8);
    const auto payload = make_payload(400, 3);
    Error err;

    RasterBuffer plain = original;
    CodecOptions a; a.seed = "same";
    T_ASSERT(encode(plain, L("lo2"), payload, "e", a, err));

    RasterBuffer filled = original;
    CodecOptions b = a; b.entropy_fill = true; b.filler_seed = 99;
    EncodeReport rep;
    T_ASSERT(encode(filled, L("lo2"), payload, "e", b, err, &rep));
    T_ASSERT(rep.stage == CodecStage::Done);
    T_ASSERT(rep.carrier_blocks + rep.filler_blocks == 3600u);
    T_ASSERT(rep.payload_entropy > 7.0 && rep.payload_entropy <= 8.0);
    T_ASSERT(filled.samples != plain.samples);
    for(size_t i=0;i<filled.samples.size();++i)
        T_ASSERT((filled.samples[i] & 0xFCu) == (original.samples[i] & 0xFCu));

    std::vector<uint8_t> out_a, out_b;
    T_ASSERT(decode(plain, L("lo2"), a, out_a, err));
    T_ASSERT(decode(filled, L("lo2"), a, out_b, err));
    T_ASSERT(out_a == payload && out_b == payload);

    // filler_seed 固定なら出力も固定
    RasterBuffer again = original;
    T_ASSERT(encode(again, L("lo2"), payload, "e", b, err));
    T_ASSERT(again.samples == filled.samples);

    // 空ペイロードでも filler は動く
    RasterBuffer empty = original;
    T_ASSERT(encode(empty, L("lo2"), std::vector<uint8_t>{}, "", b, err, &rep));
    T_ASSERT(rep.filler_blocks > 0);
    T_ASSERT(decode(empty, L("lo2"), a, out_a, err));
    T_ASSERT(out_a.empty());
    return true;
}

static bool test_dense_roundtrips(){
    const char* tags[] = {"g1","g2","g4","g8","g16","ga1","ga2","ga4","ga8","ga16","rgb8","rgb16","rgba8","rgba16"};
    for(const char* tag : tags){
        const layout::Layout l = L(tag);
        const auto payload = make_payload(333, l.bits_per_pixel());
        RasterBuffer canvas;
        Error err;
        T_ASSERT(make_dense_canvas(l, payload.size(), 5, canvas, err));
        T_ASSERT(canvas.channels == l.channels);
        T_ASSERT(canvas.bit_depth == layout::container_depth(l));
        const uint64_t units = (frame::frame_bits(payload.size(), 5) + l.bits_per_pixel() - 1) / l.bits_per_pixel();
        T_ASSERT(canvas.pixel_count() >= units);
        T_ASSERT(canvas.width <= canvas.height);

        CodecOptions opt;
        T_ASSERT(encode(canvas, l, payload, "dense", opt, err));
        std::vector<uint8_t> out;
        HeaderInfo h;
        T_ASSERT(decode(canvas, l, opt, out, err, &h));
        T_ASSERT(out == payload);
        T_ASSERT(h.comment == "dense");

        // 推定したレイアウトでも読める (ga1/2/4 は ga8 に見える)
        layout::Layout inferred;
        T_ASSERT(layout::layout_from_raster(canvas, inferred, err));
        if(inferred.bit_depth == l.bit_depth) T_ASSERT(layout::layout_tag(inferred) == tag);
    }

    RasterBuffer canvas; Error err;
    T_ASSERT(make_dense_canvas(L("rgb8"), 100, 0, canvas, err));
    T_ASSERT(canvas.width == 7 && canvas.height == 8);
    T_ASSERT(!make_dense_canvas(L("lo2"), 100, 0, canvas, err));
    T_ASSERT(err.kind == ErrorKind::UnsupportedLayout);
    return true;
}

static bool test_dense_fill(){
    RasterBuffer canvas; Error err;
    T_ASSERT(make_dense_canvas(L("g8"), 10, 0, canvas, err));
    std::fill(canvas.samples.begin(), canvas.samples.end(), 0xAA);
    const size_t used = 58;
    CodecOptions zero; zero.dense_fill = DenseFill::Zero;
    EncodeReport rep;
    T_ASSERT(encode(canvas, L("g8"), make_payload(10), "", zero, err, &rep));
    T_ASSERT(rep.carrier_blocks == used);
    T_ASSERT(rep.filler_blocks == canvas.pixel_count() - used);
    for(size_t i=used;i<canvas.samples.size();++i) T_ASSERT(canvas.samples[i] == 0);

    CodecOptions rnd; rnd.filler_seed = 4;
    RasterBuffer a = canvas, b = canvas;
    T_ASSERT(encode(a, L("g8"), make_payload(10), "", rnd, err));
    T_ASSERT(encode(b, L("g8"), make_payload(10), "", rnd, err));
    T_ASSERT(a.samples == b.samples);
    return true;
}

static bool test_rejections(){
    Error err;
    CodecOptions opt;
    std::vector<uint8_t> out;

    RasterBuffer gray4 = make_carrier(16, 16, 1, 4);
    T_ASSERT(!encode(gray4, L("lo1"), make_payload(4), "", opt, err));
    T_ASSERT(err.kind == ErrorKind::UnsupportedLayout);

    err.clear();
    RasterBuffer rgb = make_carrier(16, 16, 3, 8);
    T_ASSERT(!decode(rgb, L("rgba8"), opt, out, err));
    T_ASSERT(err.kind == ErrorKind::UnsupportedLayout);

    err.clear();
    const RasterBuffer before = rgb;
    T_ASSERT(!encode(rgb, L("lo2"), make_payload(4), std::string("\xFF\xFE", 2), opt, err));
    T_ASSERT(err.kind == ErrorKind::InvalidComment);
    T_ASSERT(rgb.samples == before.samples);

    err.clear();
    RasterBuffer broken = rgb;
    broken.samples.pop_back();
    T_ASSERT(!encode(broken, L("lo2"), make_payload(4), "", opt, err));
    T_ASSERT(err.kind == ErrorKind::UnsupportedLayout);

    // 何も埋め込まれていない画像
    err.clear();
    T_ASSERT(!decode(rgb, L("lo2"), opt, out, err));
    T_ASSERT(err.kind == ErrorKind::CorruptFrame || err.kind == ErrorKind::ChecksumMismatch);
    HeaderInfo h;
    err.clear();
    T_ASSERT(!read_header(rgb, L("rgb8"), opt, h, err));
    T_ASSERT(err.is_codec_error());
    return true;
}

int main(){
    bool ok = true;

    ok &= test_lo2_scenario();
    std::cout << "[A] lo2 100x100 scenario : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_embed_preservation();
    ok &= test_capacity_boundary();
    std::cout << "[B] embed preservation / capacity : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_seed_sensitivity();
    ok &= test_header_only();
    ok &= test_decode_stages();
    std::cout << "[C] seed / header-only : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_entropy_flag_irrelevant();
    std::cout << "[D] entropy filler : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_dense_roundtrips();
    ok &= test_dense_fill();
    std::cout << "[E] dense mode : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_rejections();
    std::cout << "[F] rejections : " << (ok? "OK":"FAIL") << "\n";

    std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok? 0 : 1;
}
