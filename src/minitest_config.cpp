// minitest_config.cpp - JSON config and header dump
#include <cstdint>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "config.h"

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

using namespace pngdata;

static bool test_full_config(){
    ToolConfig cfg; std::string err;
    T_ASSERT(parse_config(R"({"layout":"lo2","comment":"hi","seed":"s","entropy":true,
                              "dense_fill":"zero","filler_seed":42,"verbose":false})", cfg, err));
    T_ASSERT(cfg.layout && *cfg.layout == "lo2");
    T_ASSERT(cfg.comment && *cfg.comment == "hi");
    T_ASSERT(cfg.seed && *cfg.seed == "s");
    T_ASSERT(cfg.entropy && *cfg.entropy);
    T_ASSERT(cfg.dense_fill && *cfg.dense_fill == DenseFill::Zero);
    T_ASSERT(cfg.filler_seed && *cfg.filler_seed == 42u);
    T_ASSERT(cfg.verbose && !*cfg.verbose);

    ToolConfig empty;
    T_ASSERT(parse_config("{}", empty, err));
    T_ASSERT(!empty.layout && !empty.seed && !empty.entropy && !empty.filler_seed);
    return true;
}

static bool test_bad_config(){
    const char* bad[] = {
        "{",                                 // not JSON
        "[1,2]",                             // not an object
        R"({"layuot":"lo2"})",               // unknown key
        R"({"entropy":"yes"})",              // wrong type
        R"({"seed":12})",
        R"({"dense_fill":"noise"})",
        R"({"filler_seed":-1})",
        R"({"filler_seed":1.5})",
    };
    for(const char* text : bad){
        ToolConfig cfg; std::string err;
        cfg.seed = "kept";
        T_ASSERT(!parse_config(text, cfg, err));
        T_ASSERT(!err.empty());
        T_ASSERT(cfg.seed && *cfg.seed == "kept");
    }
    ToolConfig cfg; std::string err;
    T_ASSERT(!load_config("/nonexistent/pngdata.json", cfg, err));
    T_ASSERT(!err.empty());
    return true;
}

static bool test_dense_fill_names(){
    DenseFill f = DenseFill::Zero;
    T_ASSERT(parse_dense_fill("random", f) && f == DenseFill::Random);
    T_ASSERT(parse_dense_fill("zero", f) && f == DenseFill::Zero);
    T_ASSERT(!parse_dense_fill("Zero", f));
    T_ASSERT(std::string(dense_fill_name(DenseFill::Random)) == "random");
    return true;
}

static bool test_filler_seed_text(){
    uint64_t v = 7;
    T_ASSERT(parse_filler_seed("0", v) && v == 0u);
    T_ASSERT(parse_filler_seed("42", v) && v == 42u);
    T_ASSERT(parse_filler_seed("18446744073709551615", v) && v == 18446744073709551615ull);
    v = 7;
    // 2^64 は範囲外
    T_ASSERT(!parse_filler_seed("18446744073709551616", v));
    T_ASSERT(!parse_filler_seed("99999999999999999999999", v));
    T_ASSERT(!parse_filler_seed("", v));
    T_ASSERT(!parse_filler_seed("-1", v));
    T_ASSERT(!parse_filler_seed("+1", v));
    T_ASSERT(!parse_filler_seed(" 1", v));
    T_ASSERT(!parse_filler_seed("12a", v));
    T_ASSERT(v == 7u);
    return true;
}

static bool test_header_json(){
    HeaderInfo h;
    h.version = 1;
    h.comment = "test";
    h.payload_length = 50;
    const nlohmann::json j = header_to_json(h, "lo2", "100x100");
    T_ASSERT(j.at("version").get<int>() == 1);
    T_ASSERT(j.at("comment").get<std::string>() == "test");
    T_ASSERT(j.at("payload_length").get<uint64_t>() == 50u);
    T_ASSERT(j.at("layout").get<std::string>() == "lo2");
    T_ASSERT(j.at("seed").get<std::string>() == "100x100");

    const nlohmann::json dense = header_to_json(h, "rgb8", "");
    T_ASSERT(!dense.contains("seed"));
    return true;
}

int main(){
    bool ok = true;

    ok &= test_full_config();
    ok &= test_bad_config();
    std::cout << "[A] config file : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_dense_fill_names();
    ok &= test_filler_seed_text();
    ok &= test_header_json();
    std::cout << "[B] names / header json : " << (ok? "OK":"FAIL") << "\n";

    std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok? 0 : 1;
}
