#pragma once

#include <sortid/result.hpp>
#include <sortid/ulid.hpp>
#include <tomlplusplus/toml.hpp>
#include <string>

namespace sortid::serialize {

// How a Ulid field is stored in a TOML document. TOML integers are signed
// 64-bit, so the integer form is a string of decimal digits.
enum class SerialForm {
    Text,     // "01ARZ3NDEKTSV4RRFFQ69G5FAV"
    Integer,  // "1777027686520646174104517696511196507"
    Uuid      // "01563e3a-b5d3-d676-4c61-efb99302bd5b"
};

const char* form_name(SerialForm form);
Result<SerialForm> parse_form(const std::string& name);

// String representation of `id` in `form`
std::string to_field(const Ulid& id, SerialForm form = SerialForm::Text);

// Inverse of to_field. Text and Integer forms fail with the decode taxonomy
// (InvalidLength, InvalidCharacter, Overflow); the Uuid form fails with Parse.
// Text is read case-insensitively.
Result<Ulid> from_field(const std::string& field, SerialForm form = SerialForm::Text);

void write(toml::table& tbl, const std::string& key, const Ulid& id,
           SerialForm form = SerialForm::Text);

// NotFound if `key` is absent, Parse if its value is not a string
Result<Ulid> read(const toml::table& tbl, const std::string& key,
                  SerialForm form = SerialForm::Text);

} // namespace sortid::serialize
