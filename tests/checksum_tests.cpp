// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/core/checksum.hpp>
#include "support/temp_dir.hpp"
#include <string_view>

using namespace surge::core;
using surge::test::TempDir;

namespace {

std::span<const std::byte> bytes_of(std::string_view s) {
    return std::as_bytes(std::span(s.data(), s.size()));
}

} // namespace

TEST_CASE("Hasher - known digests", "[checksum]") {
    SECTION("SHA-256 of abc") {
        Hasher h(HashAlgo::sha256);
        REQUIRE(!h.update(bytes_of("abc")));
        auto digest = h.finish();
        REQUIRE(digest);
        CHECK(*digest == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    }

    SECTION("MD5 of empty input") {
        Hasher h(HashAlgo::md5);
        auto digest = h.finish();
        REQUIRE(digest);
        CHECK(*digest == "d41d8cd98f00b204e9800998ecf8427e");
    }

    SECTION("Incremental updates match one-shot") {
        Hasher a(HashAlgo::sha512);
        Hasher b(HashAlgo::sha512);
        REQUIRE(!a.update(bytes_of("hello ")));
        REQUIRE(!a.update(bytes_of("world")));
        REQUIRE(!b.update(bytes_of("hello world")));
        CHECK(*a.finish() == *b.finish());
    }

    SECTION("No updates after finish") {
        Hasher h(HashAlgo::sha256);
        REQUIRE(h.finish());
        CHECK(h.update(bytes_of("x")) == DownloadErrc::invalid_state);
        CHECK_FALSE(h.finish());
    }
}

TEST_CASE("hash_file", "[checksum]") {
    TempDir dir;
    surge::test::write_text(dir / "abc.txt", "abc");

    auto digest = hash_file(dir / "abc.txt", HashAlgo::sha256);
    REQUIRE(digest);
    CHECK(digest_equals(*digest, "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD"));

    auto missing = hash_file(dir / "nope", HashAlgo::sha256);
    REQUIRE_FALSE(missing);
    CHECK(missing.error() == ErrorKind::filesystem);
}

TEST_CASE("parse_hash_algo", "[checksum]") {
    CHECK(parse_hash_algo("sha256") == HashAlgo::sha256);
    CHECK(parse_hash_algo("SHA-512") == HashAlgo::sha512);
    CHECK(parse_hash_algo("md5") == HashAlgo::md5);
    auto bad = parse_hash_algo("crc32");
    REQUIRE_FALSE(bad);
    CHECK(bad.error() == DownloadErrc::invalid_argument);
    CHECK(to_string(HashAlgo::sha512) == "sha512");
    CHECK_FALSE(digest_equals("abcd", "abc"));
}
