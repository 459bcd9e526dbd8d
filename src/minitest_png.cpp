// minitest_png.cpp - PNG container round trips through libpng
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "codec.h"
#include "image_io.h"
#include "layout.h"

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

using namespace pngdata;
namespace fs = std::filesystem;

static std::string temp_png(const std::string& name){
    return (fs::temp_directory_path() / ("pngdata_minitest_" + name + ".png")).string();
}

static RasterBuffer make_raster(uint32_t w, uint32_t h, uint32_t ch, uint32_t depth){
    RasterBuffer r; r.reset(w, h, ch, depth);
    const uint32_t maxv = (1u << depth) - 1u;
    for(size_t i=0;i<r.samples.size();++i) r.samples[i] = static_cast<uint16_t>((i * 40503u + 7u) & maxv);
    return r;
}

static bool test_container_roundtrip(){
    struct Shape { uint32_t ch, depth; };
    const Shape shapes[] = {{1,1},{1,2},{1,4},{1,8},{1,16},{2,8},{2,16},{3,8},{3,16},{4,8},{4,16}};
    for(const Shape& s : shapes){
        const RasterBuffer src = make_raster(13, 7, s.ch, s.depth);
        const std::string path = temp_png("rt_" + std::to_string(s.ch) + "_" + std::to_string(s.depth));
        std::string err;
        T_ASSERT(save_png(path, src, err));
        RasterBuffer back;
        T_ASSERT(load_png(path, back, err));
        std::remove(path.c_str());
        T_ASSERT(back.width == 13 && back.height == 7);
        T_ASSERT(back.channels == s.ch);
        T_ASSERT(back.bit_depth == s.depth);
        T_ASSERT(back.samples == src.samples);
    }
    return true;
}

static bool test_rejects(){
    RasterBuffer r; std::string err;
    T_ASSERT(!load_png(temp_png("does_not_exist"), r, err));
    T_ASSERT(!err.empty());

    const std::string path = temp_png("not_png");
    FILE* fp = std::fopen(path.c_str(), "wb");
    T_ASSERT(fp != nullptr);
    std::fputs("definitely not a png", fp);
    std::fclose(fp);
    err.clear();
    T_ASSERT(!load_png(path, r, err));
    std::remove(path.c_str());

    // libpng has no 2-bit RGB
    const RasterBuffer bad = make_raster(2, 2, 3, 2);
    err.clear();
    T_ASSERT(!save_png(temp_png("bad_depth"), bad, err));

    T_ASSERT(has_ext("a/b/c.PNG", "png"));
    T_ASSERT(!has_ext("a.png.bin", "png"));
    T_ASSERT(!has_ext("noext", "png"));
    return true;
}

static bool test_embed_through_png(){
    RasterBuffer carrier = make_raster(100, 100, 4, 8);
    std::vector<uint8_t> payload(50);
    for(size_t i=0;i<payload.size();++i) payload[i] = static_cast<uint8_t>(255 - i);

    layout::Layout lo2; Error cerr;
    T_ASSERT(layout::parse_layout("lo2", lo2, cerr));
    CodecOptions opt; opt.entropy_fill = true;
    T_ASSERT(encode(carrier, lo2, payload, "test", opt, cerr));

    const std::string path = temp_png("embed");
    std::string err;
    T_ASSERT(save_png(path, carrier, err));
    RasterBuffer loaded;
    T_ASSERT(load_png(path, loaded, err));
    std::remove(path.c_str());

    std::vector<uint8_t> out;
    HeaderInfo h;
    T_ASSERT(decode(loaded, lo2, CodecOptions{}, out, cerr, &h));
    T_ASSERT(out == payload);
    T_ASSERT(h.comment == "test");
    return true;
}

static bool test_dense_through_png(){
    for(const char* tag : {"ga2", "g4", "rgb16"}){
        layout::Layout l; Error cerr;
        T_ASSERT(layout::parse_layout(tag, l, cerr));
        std::vector<uint8_t> payload(777);
        for(size_t i=0;i<payload.size();++i) payload[i] = static_cast<uint8_t>(i * 13u);
        RasterBuffer canvas;
        T_ASSERT(make_dense_canvas(l, payload.size(), 0, canvas, cerr));
        T_ASSERT(encode(canvas, l, payload, "", CodecOptions{}, cerr));

        const std::string path = temp_png(std::string("dense_") + tag);
        std::string err;
        T_ASSERT(save_png(path, canvas, err));
        RasterBuffer loaded;
        T_ASSERT(load_png(path, loaded, err));
        std::remove(path.c_str());

        std::vector<uint8_t> out;
        T_ASSERT(decode(loaded, l, CodecOptions{}, out, cerr));
        T_ASSERT(out == payload);
    }
    return true;
}

int main(){
    bool ok = true;

    ok &= test_container_roundtrip();
    std::cout << "[A] png container : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_rejects();
    std::cout << "[B] png rejects : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_embed_through_png();
    ok &= test_dense_through_png();
    std::cout << "[C] codec through png : " << (ok? "OK":"FAIL") << "\n";

    std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok? 0 : 1;
}
