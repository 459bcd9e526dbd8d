// minitest_cli.cpp - pngdata command line: outputs and exit codes
// Usage: minitest_cli <path to pngdata>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "image_io.h"

#ifndef _WIN32
#include <sys/wait.h>
#endif

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

using namespace pngdata;
namespace fs = std::filesystem;

static std::string g_tool;
static fs::path g_dir;

static std::string q(const fs::path& p){ return "\"" + p.string() + "\""; }

static int run(const std::string& args){
    const std::string cmd = "\"" + g_tool + "\" " + args;
    const int rc = std::system(cmd.c_str());
#ifdef _WIN32
    return rc;
#else
    if(rc == -1 || !WIFEXITED(rc)) return -1;
    return WEXITSTATUS(rc);
#endif
}

static std::vector<uint8_t> read_all(const fs::path& p){
    std::ifstream in(p, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

static bool setup(){
    std::vector<uint8_t> payload(50);
    for(size_t i=0;i<payload.size();++i) payload[i] = static_cast<uint8_t>(i * 7u + 3u);
    std::ofstream out(g_dir / "payload.bin", std::ios::binary);
    out.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
    out.close();
    T_ASSERT(out.good());

    RasterBuffer carrier; carrier.reset(100, 100, 4, 8);
    for(size_t i=0;i<carrier.samples.size();++i) carrier.samples[i] = static_cast<uint16_t>((i * 31u) & 0xFFu);
    std::string err;
    T_ASSERT(save_png((g_dir / "carrier.png").string(), carrier, err));
    return true;
}

static bool test_embed_roundtrip(){
    T_ASSERT(run("encode --layout=lo2 --payload=" + q(g_dir / "payload.bin") + " --carrier=" + q(g_dir / "carrier.png") +
                 " --output=" + q(g_dir / "embedded.png") + " --comment=test --entropy --filler-seed=1") == 0);
    T_ASSERT(run("decode --layout=lo2 --input=" + q(g_dir / "embedded.png") + " -o " + q(g_dir / "out.bin")) == 0);
    T_ASSERT(read_all(g_dir / "out.bin") == read_all(g_dir / "payload.bin"));

    T_ASSERT(run("info --layout=lo2 --json --input=" + q(g_dir / "embedded.png") + " > " + q(g_dir / "header.json")) == 0);
    std::ifstream in(g_dir / "header.json");
    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << e.what() << "\n";
        return false;
    }
    T_ASSERT(j.at("comment").get<std::string>() == "test");
    T_ASSERT(j.at("payload_length").get<uint64_t>() == 50u);
    T_ASSERT(j.at("seed").get<std::string>() == "100x100");
    return true;
}

static bool test_dense_roundtrip(){
    T_ASSERT(run("encode --layout=rgb8 --payload=" + q(g_dir / "payload.bin") + " --output=" + q(g_dir / "dense.png") +
                 " --dense-fill=zero") == 0);
    // レイアウト省略時は PNG から推定する
    T_ASSERT(run("decode --input=" + q(g_dir / "dense.png") + " --output=" + q(g_dir / "dense.bin")) == 0);
    T_ASSERT(read_all(g_dir / "dense.bin") == read_all(g_dir / "payload.bin"));
    return true;
}

static bool test_exit_codes(){
    // codec errors: 3
    T_ASSERT(run("decode --layout=lo2 --seed=wrong --input=" + q(g_dir / "embedded.png") + " --output=" + q(g_dir / "x.bin")) == 3);
    T_ASSERT(run("decode --layout=lo9 --input=" + q(g_dir / "embedded.png") + " --output=" + q(g_dir / "x.bin")) == 3);
    std::vector<uint8_t> big(20000, 0x55);
    {
        std::ofstream out(g_dir / "big.bin", std::ios::binary);
        out.write(reinterpret_cast<const char*>(big.data()), static_cast<std::streamsize>(big.size()));
    }
    T_ASSERT(run("encode --layout=lo2 --payload=" + q(g_dir / "big.bin") + " --carrier=" + q(g_dir / "carrier.png") +
                 " --output=" + q(g_dir / "big.png")) == 3);
    T_ASSERT(!fs::exists(g_dir / "big.png"));

    // I/O errors: 1
    T_ASSERT(run("decode --layout=lo2 --input=" + q(g_dir / "missing.png") + " --output=" + q(g_dir / "x.bin")) == 1);
    T_ASSERT(run("encode --layout=lo2 --payload=" + q(g_dir / "missing.bin") + " --carrier=" + q(g_dir / "carrier.png") +
                 " --output=" + q(g_dir / "x.png")) == 1);

    // usage errors: 2
    T_ASSERT(run("") == 2);
    T_ASSERT(run("frobnicate") == 2);
    T_ASSERT(run("decode --bogus") == 2);
    T_ASSERT(run("encode --layout=lo2 --filler-seed=18446744073709551616 --payload=" + q(g_dir / "payload.bin") +
                 " --carrier=" + q(g_dir / "carrier.png") + " --output=" + q(g_dir / "x.png")) == 2);
    T_ASSERT(run("encode --layout=lo2 --payload=" + q(g_dir / "payload.bin") + " --output=" + q(g_dir / "x.png")) == 2);
    {
        std::ofstream cfg(g_dir / "bad.json");
        cfg << "{\"layuot\": \"lo2\"}";
    }
    T_ASSERT(run("info --config=" + q(g_dir / "bad.json") + " --input=" + q(g_dir / "embedded.png")) == 2);

    T_ASSERT(run("--version") == 0);
    T_ASSERT(run("--help") == 0);
    return true;
}

int main(int argc, char** argv){
    if(argc < 2){
        std::cerr << "usage: minitest_cli <pngdata>\n";
        return 2;
    }
    g_tool = argv[1];
    g_dir = fs::temp_directory_path() / "pngdata_minitest_cli";
    std::error_code ec;
    fs::remove_all(g_dir, ec);
    fs::create_directories(g_dir, ec);
    if(ec){
        std::cerr << "cannot create " << g_dir << ": " << ec.message() << "\n";
        return 1;
    }

    bool ok = true;

    ok &= setup();
    ok &= test_embed_roundtrip();
    std::cout << "[A] embed via cli : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_dense_roundtrip();
    std::cout << "[B] dense via cli : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_exit_codes();
    std::cout << "[C] exit codes : " << (ok? "OK":"FAIL") << "\n";

    fs::remove_all(g_dir, ec);
    std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok? 0 : 1;
}
