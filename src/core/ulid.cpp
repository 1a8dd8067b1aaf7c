#include <sortid/ulid.hpp>

namespace sortid {

Result<Ulid> Ulid::from_parts(uint64_t timestamp_ms, const Uint128& randomness) {
    if (timestamp_ms > MAX_TIMESTAMP) {
        return SortidError(SortidError::Range,
            "timestamp " + std::to_string(timestamp_ms) + " does not fit in 48 bits",
            "Maximum timestamp is " + std::to_string(MAX_TIMESTAMP) + " ms");
    }
    Uint128 time_part = Uint128::from_u64(timestamp_ms).shl(RAND_BITS);
    Uint128 rand_part = randomness & Uint128::low_mask(RAND_BITS);
    return Result<Ulid>::ok(Ulid(time_part | rand_part));
}

Ulid Ulid::from_bytes(const std::array<uint8_t, 16>& bytes) {
    return Ulid(Uint128::from_be_bytes(bytes));
}

Result<Ulid> Ulid::parse(const std::string& text, base32::CaseMode mode) {
    return base32::decode(text, mode).map([](Uint128& v) { return Ulid(v); });
}

uint64_t Ulid::timestamp_ms() const {
    return value_.shr(RAND_BITS).lo;
}

Uint128 Ulid::randomness() const {
    return value_ & Uint128::low_mask(RAND_BITS);
}

std::optional<Ulid> Ulid::increment() const {
    Uint128 max_random = Uint128::low_mask(RAND_BITS);
    if ((value_ & max_random) == max_random) {
        return std::nullopt;
    }
    return Ulid(value_.plus_one());
}

clock::MillisTimePoint Ulid::datetime() const {
    return clock::from_unix_ms(timestamp_ms());
}

std::string Ulid::to_string() const {
    return base32::encode(value_);
}

std::string encode(const Ulid& id) {
    return id.to_string();
}

Result<Ulid> decode(const std::string& text, base32::CaseMode mode) {
    return Ulid::parse(text, mode);
}

std::ostream& operator<<(std::ostream& os, const Ulid& id) {
    char buf[base32::ENCODED_LEN];
    base32::encode_to(id.to_u128(), buf);
    return os.write(buf, base32::ENCODED_LEN);
}

} // namespace sortid
