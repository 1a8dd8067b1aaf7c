#include <catch2/catch.hpp>
#include <sortid/serialize.hpp>
#include <sstream>

using namespace sortid;
using serialize::SerialForm;

static Ulid reference_id() {
    return Ulid::parse("01ARZ3NDEKTSV4RRFFQ69G5FAV").value();
}

TEST_CASE("to_field renders each form", "[serialize]") {
    auto id = reference_id();
    REQUIRE(serialize::to_field(id) == "01ARZ3NDEKTSV4RRFFQ69G5FAV");
    REQUIRE(serialize::to_field(id, SerialForm::Integer)
            == "1777027686520646174104517696511196507");
    REQUIRE(serialize::to_field(id, SerialForm::Uuid)
            == "01563e3a-b5d3-d676-4c61-efb99302bd5b");
}

TEST_CASE("from_field inverts to_field for every form", "[serialize]") {
    SeededRandom rng(8);
    for (auto form : {SerialForm::Text, SerialForm::Integer, SerialForm::Uuid}) {
        for (int i = 0; i < 20; ++i) {
            Ulid id = Ulid::from_u128(rng.random_bits(128));
            auto back = serialize::from_field(serialize::to_field(id, form), form);
            REQUIRE(back.is_ok());
            REQUIRE(back.value() == id);
        }
    }
}

TEST_CASE("from_field uses the decode taxonomy", "[serialize]") {
    auto short_text = serialize::from_field("01ARZ3", SerialForm::Text);
    REQUIRE(short_text.is_err());
    REQUIRE(short_text.error().code == SortidError::InvalidLength);

    auto bad_char = serialize::from_field("01ARZ3NDEKTSV4RRFFQ69G5FAU", SerialForm::Text);
    REQUIRE(bad_char.is_err());
    REQUIRE(bad_char.error().code == SortidError::InvalidCharacter);

    auto overflow = serialize::from_field("90000000000000000000000000", SerialForm::Text);
    REQUIRE(overflow.is_err());
    REQUIRE(overflow.error().code == SortidError::Overflow);

    auto int_overflow = serialize::from_field(
        "340282366920938463463374607431768211456", SerialForm::Integer);
    REQUIRE(int_overflow.is_err());
    REQUIRE(int_overflow.error().code == SortidError::Overflow);

    auto int_char = serialize::from_field("12x4", SerialForm::Integer);
    REQUIRE(int_char.is_err());
    REQUIRE(int_char.error().code == SortidError::InvalidCharacter);

    auto int_padded = serialize::from_field("0007", SerialForm::Integer);
    REQUIRE(int_padded.is_err());
    REQUIRE(int_padded.error().code == SortidError::InvalidCharacter);

    auto int_zero = serialize::from_field("0", SerialForm::Integer);
    REQUIRE(int_zero.is_ok());
    REQUIRE(int_zero.value().is_nil());
}

TEST_CASE("forms do not accept each other's output", "[serialize]") {
    auto id = reference_id();
    auto text_as_int = serialize::from_field(serialize::to_field(id), SerialForm::Integer);
    REQUIRE(text_as_int.is_err());
    REQUIRE(text_as_int.error().is_decode_error());

    auto uuid_as_text = serialize::from_field(
        serialize::to_field(id, SerialForm::Uuid), SerialForm::Text);
    REQUIRE(uuid_as_text.is_err());
    REQUIRE(uuid_as_text.error().code == SortidError::InvalidLength);

    auto text_as_uuid = serialize::from_field(serialize::to_field(id), SerialForm::Uuid);
    REQUIRE(text_as_uuid.is_err());
    REQUIRE(text_as_uuid.error().code == SortidError::Parse);
}

TEST_CASE("write and read a TOML table", "[serialize]") {
    auto id = reference_id();
    toml::table tbl;
    serialize::write(tbl, "id", id);
    serialize::write(tbl, "raw", id, SerialForm::Integer);

    std::ostringstream out;
    out << tbl;
    auto reparsed = toml::parse(out.str());

    auto text = serialize::read(reparsed, "id");
    REQUIRE(text.is_ok());
    REQUIRE(text.value() == id);

    auto raw = serialize::read(reparsed, "raw", SerialForm::Integer);
    REQUIRE(raw.is_ok());
    REQUIRE(raw.value() == id);
}

TEST_CASE("read accepts lowercase text", "[serialize]") {
    auto tbl = toml::parse(R"(id = "01arz3ndektsv4rrffq69g5fav")");
    auto r = serialize::read(tbl, "id");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == reference_id());
}

TEST_CASE("read reports missing keys and wrong types", "[serialize]") {
    auto tbl = toml::parse(R"(
num = 42
bad = "01ARZ3NDEKTSV4RRFFQ69G5FA"
)");

    auto missing = serialize::read(tbl, "id");
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == SortidError::NotFound);

    auto number = serialize::read(tbl, "num");
    REQUIRE(number.is_err());
    REQUIRE(number.error().code == SortidError::Parse);

    auto bad = serialize::read(tbl, "bad");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == SortidError::InvalidLength);
    REQUIRE(bad.error().message.find("field 'bad'") != std::string::npos);
}

TEST_CASE("form names round trip", "[serialize]") {
    for (auto form : {SerialForm::Text, SerialForm::Integer, SerialForm::Uuid}) {
        auto parsed = serialize::parse_form(serialize::form_name(form));
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed.value() == form);
    }
    auto bad = serialize::parse_form("binary");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == SortidError::Config);
}
