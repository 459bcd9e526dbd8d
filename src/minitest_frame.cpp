// minitest_frame.cpp - frame serialization, error kinds, SHA-256
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "frame.h"
#include "sha256.h"

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

using namespace pngdata;

static std::vector<uint8_t> make_payload(size_t n){
    std::vector<uint8_t> p(n);
    for(size_t i=0;i<n;++i) p[i] = static_cast<uint8_t>(i * 37u + 11u);
    return p;
}

static bool test_sha256_vectors(){
    const std::string abc = "abc";
    T_ASSERT(detail::to_hex(detail::sha256(reinterpret_cast<const uint8_t*>(abc.data()), abc.size()).data(), 32) ==
             "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    T_ASSERT(detail::to_hex(detail::sha256(std::vector<uint8_t>{}).data(), 32) ==
             "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    // 分割して与えても同じ
    const std::string msg = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";
    detail::Sha256 h;
    h.update(msg.data(), 10);
    h.update(msg.data() + 10, msg.size() - 10);
    T_ASSERT(h.hexdigest() == "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
    return true;
}

static bool test_layout_of_stream(){
    Error err;
    std::vector<uint8_t> stream;
    const auto payload = make_payload(50);
    T_ASSERT(frame::serialize("test", payload, stream, err));
    T_ASSERT(stream.size() == frame::header_overhead(4) + 50);
    T_ASSERT(frame::header_overhead(4) == 52);
    T_ASSERT(frame::frame_bits(50, 4) == 102u * 8u);

    T_ASSERT(stream[0] == 'P' && stream[1] == 'N' && stream[2] == 'G' && stream[3] == 'D');
    T_ASSERT(stream[4] == 1 && stream[5] == 0);   // version
    T_ASSERT(stream[6] == 4 && stream[7] == 0);   // comment length
    T_ASSERT(std::string(stream.begin() + 8, stream.begin() + 12) == "test");
    T_ASSERT(stream[12] == 50);
    for(int i=13;i<20;++i) T_ASSERT(stream[i] == 0);
    const auto digest = detail::sha256(payload);
    T_ASSERT(std::equal(digest.begin(), digest.end(), stream.begin() + 20));
    T_ASSERT(std::equal(payload.begin(), payload.end(), stream.begin() + 52));
    return true;
}

static bool test_roundtrip(){
    for(size_t n : {size_t(0), size_t(1), size_t(50), size_t(1000)}){
        Error err;
        std::vector<uint8_t> stream;
        const auto payload = make_payload(n);
        T_ASSERT(frame::serialize("日本語のコメント", payload, stream, err));
        frame::Frame f;
        T_ASSERT(frame::deserialize_bytes(stream, f, err));
        T_ASSERT(f.payload == payload);
        T_ASSERT(f.header.comment == "日本語のコメント");
        T_ASSERT(f.header.version == frame::kVersion);
        T_ASSERT(f.header.payload_length == n);

        frame::FrameHeader h;
        T_ASSERT(frame::read_header_bytes(stream, h, err));
        T_ASSERT(h.comment == f.header.comment);
        T_ASSERT(h.payload_length == n);
    }
    return true;
}

static bool test_corrupt_frames(){
    Error err;
    std::vector<uint8_t> stream;
    T_ASSERT(frame::serialize("c", make_payload(20), stream, err));

    frame::Frame untouched;
    untouched.payload = {9, 9, 9};

    auto bad_magic = stream; bad_magic[1] ^= 0x40;
    T_ASSERT(!frame::deserialize_bytes(bad_magic, untouched, err));
    T_ASSERT(err.kind == ErrorKind::CorruptFrame);
    T_ASSERT((untouched.payload == std::vector<uint8_t>{9, 9, 9}));

    err.clear();
    auto bad_version = stream; bad_version[4] = 2;
    T_ASSERT(!frame::deserialize_bytes(bad_version, untouched, err));
    T_ASSERT(err.kind == ErrorKind::CorruptFrame);

    err.clear();
    auto truncated = stream; truncated.resize(truncated.size() - 1);
    T_ASSERT(!frame::deserialize_bytes(truncated, untouched, err));
    T_ASSERT(err.kind == ErrorKind::CorruptFrame);

    err.clear();
    auto huge_length = stream; huge_length[9 + 7] = 0x80; // payload_length の最上位バイト
    T_ASSERT(!frame::deserialize_bytes(huge_length, untouched, err));
    T_ASSERT(err.kind == ErrorKind::CorruptFrame);

    err.clear();
    auto bad_comment = stream; bad_comment[8] = 0xFF;
    T_ASSERT(!frame::deserialize_bytes(bad_comment, untouched, err));
    T_ASSERT(err.kind == ErrorKind::CorruptFrame);

    err.clear();
    auto flipped = stream; flipped.back() ^= 1;
    T_ASSERT(!frame::deserialize_bytes(flipped, untouched, err));
    T_ASSERT(err.kind == ErrorKind::ChecksumMismatch);
    T_ASSERT((untouched.payload == std::vector<uint8_t>{9, 9, 9}));

    err.clear();
    T_ASSERT(!frame::deserialize_bytes(std::vector<uint8_t>{}, untouched, err));
    T_ASSERT(err.kind == ErrorKind::CorruptFrame);
    return true;
}

static bool test_invalid_comments(){
    Error err;
    std::vector<uint8_t> stream;
    T_ASSERT(!frame::serialize(std::string("\xC0\x80", 2), make_payload(4), stream, err));
    T_ASSERT(err.kind == ErrorKind::InvalidComment);
    T_ASSERT(stream.empty());

    err.clear();
    T_ASSERT(!frame::serialize(std::string(frame::kMaxCommentBytes + 1, 'a'), make_payload(4), stream, err));
    T_ASSERT(err.kind == ErrorKind::InvalidComment);

    err.clear();
    T_ASSERT(frame::serialize(std::string(frame::kMaxCommentBytes, 'a'), make_payload(4), stream, err));

    auto utf8 = [](const std::string& s){
        return frame::is_valid_utf8(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    };
    T_ASSERT(utf8(""));
    T_ASSERT(utf8("plain ascii"));
    T_ASSERT(utf8("\xE6\x97\xA5\xE6\x9C\xAC"));           // 日本
    T_ASSERT(utf8("\xF0\x9F\x98\x80"));                   // U+1F600
    T_ASSERT(!utf8("\xED\xA0\x80"));                      // surrogate
    T_ASSERT(!utf8("\xE0\x80\xAF"));                      // overlong
    T_ASSERT(!utf8("\xF4\x90\x80\x80"));                  // > U+10FFFF
    T_ASSERT(!utf8("\xE6\x97"));                          // truncated
    T_ASSERT(!utf8("\x80"));
    return true;
}

int main(){
    bool ok = true;

    ok &= test_sha256_vectors();
    std::cout << "[A] sha256 : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_layout_of_stream();
    ok &= test_roundtrip();
    std::cout << "[B] frame roundtrip : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_corrupt_frames();
    std::cout << "[C] corrupt frames : " << (ok? "OK":"FAIL") << "\n";

    ok &= test_invalid_comments();
    std::cout << "[D] comments : " << (ok? "OK":"FAIL") << "\n";

    std::cout << (ok? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok? 0 : 1;
}
