#include <sortid/uuid.hpp>

namespace sortid {

// ---- Hex helpers ----

static const char hex_chars[] = "0123456789abcdef";

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// ---- ULID interop ----

Uuid Uuid::from_ulid(const Ulid& id) {
    Uuid u;
    u.bytes = id.to_bytes();
    return u;
}

Ulid Uuid::to_ulid() const {
    return Ulid::from_bytes(bytes);
}

// ---- to_string: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx ----

std::string Uuid::to_string() const {
    std::string out;
    out.reserve(36);
    for (int i = 0; i < 16; ++i) {
        out += hex_chars[bytes[i] >> 4];
        out += hex_chars[bytes[i] & 0x0F];
        if (i == 3 || i == 5 || i == 7 || i == 9) {
            out += '-';
        }
    }
    return out;
}

// ---- from_string ----

Result<Uuid> Uuid::from_string(const std::string& s) {
    if (s.size() != 36) {
        return SortidError(SortidError::Parse,
            "UUID string must be 36 characters", "Expected format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx");
    }
    if (s[8] != '-' || s[13] != '-' || s[18] != '-' || s[23] != '-') {
        return SortidError(SortidError::Parse,
            "UUID string has invalid dash positions",
            "Expected dashes at positions 8, 13, 18, 23");
    }

    Uuid u;
    int byte_idx = 0;
    for (int i = 0; i < 36; ) {
        if (s[i] == '-') { ++i; continue; }
        int hi = hex_val(s[i]);
        int lo = hex_val(s[i + 1]);
        if (hi < 0 || lo < 0) {
            return SortidError(SortidError::Parse,
                "UUID string contains invalid hex character",
                std::string("Invalid char at position ") + std::to_string(hi < 0 ? i : i + 1));
        }
        u.bytes[byte_idx++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return Result<Uuid>::ok(u);
}

bool Uuid::operator==(const Uuid& other) const {
    return bytes == other.bytes;
}

bool Uuid::operator!=(const Uuid& other) const {
    return bytes != other.bytes;
}

} // namespace sortid
