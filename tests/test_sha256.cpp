#include <catch2/catch.hpp>
#include <pmat/sha256.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace pmat;

TEST_CASE("SHA256 empty string", "[sha256]") {
    REQUIRE(SHA256::hash_hex("") ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("SHA256 'abc' (NIST vector)", "[sha256]") {
    REQUIRE(SHA256::hash_hex("abc") ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("SHA256 448-bit message (NIST vector)", "[sha256]") {
    REQUIRE(SHA256::hash_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq") ==
            "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST_CASE("SHA256 incremental update matches one-shot", "[sha256]") {
    SHA256 ctx;
    ctx.update(reinterpret_cast<const uint8_t*>("a"), 1);
    ctx.update(std::string("bc"));
    REQUIRE(SHA256::hex(ctx.finalize()) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("SHA256 field separation distinguishes splits", "[sha256]") {
    SHA256 a;
    a.update_field("ab");
    a.update_field("c");
    SHA256 b;
    b.update_field("a");
    b.update_field("bc");
    REQUIRE(SHA256::hex(a.finalize()) != SHA256::hex(b.finalize()));
}

TEST_CASE("SHA256 large input (10000 bytes of 'a')", "[sha256]") {
    REQUIRE(SHA256::hash_hex(std::string(10000, 'a')) ==
            "27dd1f61b867b6a0f6e9d8a41c43231de52107e53ae424de8f847b821db4b711");
}

TEST_CASE("SHA256 hash_file matches hash_hex of same content", "[sha256]") {
    auto path = fs::temp_directory_path() / "pmat_test_sha256.txt";
    std::string content = "fn main() {}\n";
    std::ofstream(path) << content;
    auto r = SHA256::hash_file(path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == SHA256::hash_hex(content));
    fs::remove(path);
}

TEST_CASE("SHA256 hash_file on a missing file is an IO error", "[sha256]") {
    auto r = SHA256::hash_file("/nonexistent/pmat/file.rs");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PmatError::IO);
}
