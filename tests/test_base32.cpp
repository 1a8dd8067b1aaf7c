#include <catch2/catch.hpp>
#include <sortid/base32.hpp>
#include <sortid/random.hpp>
#include <sortid/ulid.hpp>
#include <algorithm>
#include <cstring>

using namespace sortid;
using base32::CaseMode;

TEST_CASE("published reference vector decodes to its parts", "[base32]") {
    auto r = decode("01ARZ3NDEKTSV4RRFFQ69G5FAV");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().timestamp_ms() == 1469922850259ULL);
    REQUIRE(r.value().randomness() == Uint128(0xD676, 0x4C61EFB99302BD5BULL));
    REQUIRE(encode(r.value()) == "01ARZ3NDEKTSV4RRFFQ69G5FAV");
}

TEST_CASE("from_parts vector encodes and decodes back", "[base32]") {
    auto id = Ulid::from_parts(1469918176385ULL, Uint128(0x0F0E, 0x9A6C4B0D9C3E2A1BULL)).value();
    REQUIRE(encode(id) == "01ARYZ6S411W79MV2B1PE3WAGV");

    auto back = decode("01ARYZ6S411W79MV2B1PE3WAGV");
    REQUIRE(back.is_ok());
    REQUIRE(back.value().timestamp_ms() == 1469918176385ULL);
    REQUIRE(back.value().randomness() == Uint128(0x0F0E, 0x9A6C4B0D9C3E2A1BULL));
}

TEST_CASE("fixed encodings", "[base32]") {
    REQUIRE(base32::encode(Uint128()) == "00000000000000000000000000");
    REQUIRE(base32::encode(Uint128(0, 1)) == "00000000000000000000000001");
    REQUIRE(base32::encode(Uint128::max()) == "7ZZZZZZZZZZZZZZZZZZZZZZZZZ");
    REQUIRE(base32::encode(Uint128(0x4141414141414141ULL, 0x4141414141414141ULL))
            == "21850M2GA1850M2GA1850M2GA1");
    REQUIRE(base32::encode(Uint128(0x4D4E385051444A59ULL, 0x454234335A413756ULL))
            == "2D9RW50MA499CMAGHM6DD42DTP");
    // Maximum timestamp fills exactly the first 10 symbols
    REQUIRE(base32::encode(Uint128::low_mask(48).shl(80)) == "7ZZZZZZZZZ0000000000000000");
}

TEST_CASE("encode_to fills a fixed buffer", "[base32]") {
    char buf[base32::ENCODED_LEN];
    base32::encode_to(Uint128(0x4141414141414141ULL, 0x4141414141414141ULL), buf);
    REQUIRE(std::string(buf, base32::ENCODED_LEN) == "21850M2GA1850M2GA1850M2GA1");
}

TEST_CASE("encoded text uses only the alphabet", "[base32]") {
    SeededRandom rng(17);
    for (int i = 0; i < 100; ++i) {
        auto s = base32::encode(rng.random_bits(128));
        REQUIRE(s.size() == 26);
        for (char c : s) {
            REQUIRE(std::strchr(base32::ALPHABET, c) != nullptr);
        }
        REQUIRE(s[0] <= '7');
    }
}

TEST_CASE("decode inverts encode", "[base32]") {
    SeededRandom rng(2024);
    for (int i = 0; i < 200; ++i) {
        Ulid id = Ulid::from_u128(rng.random_bits(128));
        auto back = decode(encode(id));
        REQUIRE(back.is_ok());
        REQUIRE(back.value() == id);
    }
}

TEST_CASE("decode rejects wrong lengths", "[base32]") {
    auto empty = decode("");
    REQUIRE(empty.is_err());
    REQUIRE(empty.error().code == SortidError::InvalidLength);

    auto short25 = decode("01ARZ3NDEKTSV4RRFFQ69G5FA");
    REQUIRE(short25.is_err());
    REQUIRE(short25.error().code == SortidError::InvalidLength);

    auto long27 = decode("01ARZ3NDEKTSV4RRFFQ69G5FAVV");
    REQUIRE(long27.is_err());
    REQUIRE(long27.error().code == SortidError::InvalidLength);
}

TEST_CASE("decode rejects the excluded letters I L O U", "[base32]") {
    for (char bad : {'I', 'L', 'O', 'U', 'i', 'l', 'o', 'u'}) {
        std::string s = "01ARZ3NDEKTSV4RRFFQ69G5FAV";
        s[7] = bad;
        auto r = decode(s);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == SortidError::InvalidCharacter);
    }
}

TEST_CASE("decode rejects punctuation and non-ASCII bytes", "[base32]") {
    auto bracket = decode("2D9RW50[A499CMAGHM6DD42DTP");
    REQUIRE(bracket.is_err());
    REQUIRE(bracket.error().code == SortidError::InvalidCharacter);

    std::string high = "01ARZ3NDEKTSV4RRFFQ69G5FAV";
    high[3] = static_cast<char>(0xC3);
    auto r = decode(high);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SortidError::InvalidCharacter);
}

TEST_CASE("decode reports overflow past 128 bits", "[base32]") {
    auto r = decode("80000000000000000000000000");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SortidError::Overflow);

    auto zz = decode("ZZZZZZZZZZZZZZZZZZZZZZZZZZ");
    REQUIRE(zz.is_err());
    REQUIRE(zz.error().code == SortidError::Overflow);

    REQUIRE(decode("7ZZZZZZZZZZZZZZZZZZZZZZZZZ").is_ok());
}

TEST_CASE("invalid characters take precedence over overflow", "[base32]") {
    auto r = decode("8000000000000000000000000U");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SortidError::InvalidCharacter);
}

TEST_CASE("lowercase is accepted by default and normalizes on re-encode", "[base32]") {
    auto lower = decode("01arz3ndektsv4rrffq69g5fav");
    REQUIRE(lower.is_ok());
    REQUIRE(encode(lower.value()) == "01ARZ3NDEKTSV4RRFFQ69G5FAV");

    auto mixed = sortid::decode("01ArZ3nDeKtSv4RrFfQ69g5FaV", CaseMode::Insensitive);
    REQUIRE(mixed.is_ok());
    REQUIRE(mixed.value() == lower.value());
}

TEST_CASE("UpperOnly rejects lowercase input", "[base32]") {
    auto upper = sortid::decode("01ARZ3NDEKTSV4RRFFQ69G5FAV", CaseMode::UpperOnly);
    REQUIRE(upper.is_ok());

    auto lower = sortid::decode("01arz3ndektsv4rrffq69g5fav", CaseMode::UpperOnly);
    REQUIRE(lower.is_err());
    REQUIRE(lower.error().code == SortidError::InvalidCharacter);
    REQUIRE(lower.error().hint.find("lowercase") != std::string::npos);
}

TEST_CASE("symbol_value maps the alphabet in order", "[base32]") {
    for (int i = 0; i < 32; ++i) {
        REQUIRE(base32::symbol_value(base32::ALPHABET[i], CaseMode::UpperOnly) == i);
    }
    REQUIRE(base32::symbol_value('z', CaseMode::Insensitive) == 31);
    REQUIRE(base32::symbol_value('z', CaseMode::UpperOnly) == -1);
    REQUIRE(base32::symbol_value('I', CaseMode::Insensitive) == -1);
}

TEST_CASE("decode from pointer and length", "[base32]") {
    const char text[] = "01ARZ3NDEKTSV4RRFFQ69G5FAVtrailing";
    auto r = base32::decode(text, 26);
    REQUIRE(r.is_ok());
    REQUIRE(Ulid::from_u128(r.value()).to_string() == "01ARZ3NDEKTSV4RRFFQ69G5FAV");
}
