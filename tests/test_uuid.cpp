#include <catch2/catch.hpp>
#include <sortid/random.hpp>
#include <sortid/uuid.hpp>

using namespace sortid;

TEST_CASE("UUID bytes 01..10 survive a ULID round trip", "[uuid]") {
    Uuid u;
    for (int i = 0; i < 16; ++i) u.bytes[i] = static_cast<uint8_t>(i + 1);

    Ulid id = u.to_ulid();
    REQUIRE(id.to_string() == "01081G81860W40J2GB1G6GW3RG");
    REQUIRE(id.msb() == 0x0102030405060708ULL);
    REQUIRE(id.lsb() == 0x090A0B0C0D0E0F10ULL);

    Uuid back = Uuid::from_ulid(id);
    REQUIRE(back == u);
    REQUIRE(back.bytes == u.bytes);
}

TEST_CASE("UUID text maps to the matching ULID text", "[uuid]") {
    auto u = Uuid::from_string("771a3bce-02e9-4428-a68e-b1e7e82b7f9f");
    REQUIRE(u.is_ok());
    Ulid id = u.value().to_ulid();
    REQUIRE(id.to_string() == "3Q38XWW0Q98GMAD3NHWZM2PZWZ");
    REQUIRE(Uuid::from_ulid(id).to_string() == "771a3bce-02e9-4428-a68e-b1e7e82b7f9f");
}

TEST_CASE("ULID to UUID keeps every bit", "[uuid]") {
    SeededRandom rng(3);
    for (int i = 0; i < 50; ++i) {
        Ulid id = Ulid::from_u128(rng.random_bits(128));
        REQUIRE(Uuid::from_ulid(id).to_ulid() == id);
    }
}

TEST_CASE("UUID from_string accepts uppercase", "[uuid]") {
    auto r = Uuid::from_string("771A3BCE-02E9-4428-A68E-B1E7E82B7F9F");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().to_string() == "771a3bce-02e9-4428-a68e-b1e7e82b7f9f");
}

TEST_CASE("UUID from_string rejects wrong length", "[uuid]") {
    auto r = Uuid::from_string("too-short");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SortidError::Parse);
}

TEST_CASE("UUID from_string rejects missing dashes", "[uuid]") {
    auto r = Uuid::from_string("550e8400e29b41d4a716446655440000abcd");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SortidError::Parse);
}

TEST_CASE("UUID from_string rejects invalid hex", "[uuid]") {
    auto r = Uuid::from_string("550e8400-e29b-41d4-a716-44665544gggg");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SortidError::Parse);
}

TEST_CASE("UUID equality compares all bytes", "[uuid]") {
    Ulid id = Ulid::from_halves(0x01563E3AB5D3D676ULL, 0x4C61EFB99302BD5BULL);
    Uuid a = Uuid::from_ulid(id);
    Uuid b = a;
    REQUIRE(a == b);
    REQUIRE_FALSE(a != b);

    b.bytes[15] ^= 0x01;
    REQUIRE(a != b);
    REQUIRE_FALSE(a == b);
}
