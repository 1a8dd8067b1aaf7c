#include <sortid/serialize.hpp>
#include <sortid/uuid.hpp>

namespace sortid::serialize {

const char* form_name(SerialForm form) {
    switch (form) {
        case SerialForm::Text:    return "text";
        case SerialForm::Integer: return "integer";
        case SerialForm::Uuid:    return "uuid";
    }
    return "unknown";
}

Result<SerialForm> parse_form(const std::string& name) {
    if (name == "text") return Result<SerialForm>::ok(SerialForm::Text);
    if (name == "integer") return Result<SerialForm>::ok(SerialForm::Integer);
    if (name == "uuid") return Result<SerialForm>::ok(SerialForm::Uuid);
    return SortidError(SortidError::Config,
        "unknown serialization form '" + name + "'",
        "expected one of: text, integer, uuid");
}

std::string to_field(const Ulid& id, SerialForm form) {
    switch (form) {
        case SerialForm::Text:    return id.to_string();
        case SerialForm::Integer: return id.to_u128().to_decimal();
        case SerialForm::Uuid:    return Uuid::from_ulid(id).to_string();
    }
    return id.to_string();
}

Result<Ulid> from_field(const std::string& field, SerialForm form) {
    switch (form) {
        case SerialForm::Text:
            return Ulid::parse(field);
        case SerialForm::Integer:
            return Uint128::parse_decimal(field).map([](Uint128& v) {
                return Ulid::from_u128(v);
            });
        case SerialForm::Uuid:
            return Uuid::from_string(field).map([](Uuid& u) {
                return u.to_ulid();
            });
    }
    return SortidError(SortidError::InvalidArg, "unknown serialization form");
}

void write(toml::table& tbl, const std::string& key, const Ulid& id, SerialForm form) {
    tbl.insert_or_assign(key, to_field(id, form));
}

Result<Ulid> read(const toml::table& tbl, const std::string& key, SerialForm form) {
    const toml::node* node = tbl.get(key);
    if (!node) {
        return SortidError(SortidError::NotFound,
            "missing ULID field '" + key + "'");
    }
    auto s = node->value<std::string>();
    if (!node->is_string() || !s) {
        return SortidError(SortidError::Parse,
            "ULID field '" + key + "' must be a string",
            std::string("stored as ") + form_name(form));
    }

    auto result = from_field(*s, form);
    if (result.is_err()) {
        auto& err = result.error();
        err.message = "field '" + key + "': " + err.message;
    }
    return result;
}

} // namespace sortid::serialize
