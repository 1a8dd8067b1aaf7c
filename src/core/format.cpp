#include <sortid/format.hpp>
#include <sortid/serialize.hpp>
#include <sortid/uuid.hpp>
#include <sstream>

namespace sortid {

std::string format_ulid(const Ulid& id, OutputFormat format) {
    switch (format) {
        case OutputFormat::Text:
            return id.to_string();
        case OutputFormat::Integer:
            return serialize::to_field(id, serialize::SerialForm::Integer);
        case OutputFormat::Uuid:
            return serialize::to_field(id, serialize::SerialForm::Uuid);
        case OutputFormat::Hex:
            return id.to_u128().to_hex();
    }
    return id.to_string();
}

std::string describe(const Ulid& id) {
    // The payload is the low 80 bits: the last 20 of 32 hex digits
    std::string payload = id.randomness().to_hex().substr(12);

    std::ostringstream out;
    out << "REPRESENTATION:\n"
        << "     String: " << id.to_string() << "\n"
        << "        Raw: " << id.to_u128().to_hex() << "\n"
        << "       UUID: " << Uuid::from_ulid(id).to_string() << "\n"
        << "COMPONENTS:\n"
        << "       Time: " << clock::format_iso8601(id.timestamp_ms()) << "\n"
        << "  Timestamp: " << id.timestamp_ms() << "\n"
        << "    Payload: " << payload << "\n";
    return out.str();
}

} // namespace sortid
