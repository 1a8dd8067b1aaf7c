#pragma once

#include <sortid/result.hpp>
#include <sortid/ulid.hpp>
#include <array>
#include <cstdint>
#include <string>

namespace sortid {

// 16-byte UUID. A Ulid converts to and from it byte for byte; no version or
// variant bits are touched by the conversion.
struct Uuid {
    std::array<uint8_t, 16> bytes{};

    static Uuid from_ulid(const Ulid& id);
    Ulid to_ulid() const;

    // xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, lowercase hex
    std::string to_string() const;
    static Result<Uuid> from_string(const std::string& s);

    bool operator==(const Uuid& other) const;
    bool operator!=(const Uuid& other) const;
};

} // namespace sortid
