#include <sortid/random.hpp>
#include <sortid/config.hpp>
#include <sortid/log.hpp>

namespace sortid {

// ---- RandomSource helpers ----

uint64_t RandomSource::next_u64() {
    uint8_t buf[8];
    fill(buf, sizeof(buf));
    uint64_t v = 0;
    for (uint8_t b : buf) v = (v << 8) | b;
    return v;
}

Uint128 RandomSource::random_bits(unsigned bits) {
    if (bits == 0) return Uint128();
    if (bits > 128) bits = 128;

    size_t nbytes = (bits + 7) / 8;
    std::array<uint8_t, 16> bytes{};
    fill(bytes.data() + (16 - nbytes), nbytes);
    return Uint128::from_be_bytes(bytes) & Uint128::low_mask(bits);
}

// ---- SystemRandom: /dev/urandom with mt19937_64 fallback ----

SystemRandom::SystemRandom()
    : urandom_("/dev/urandom", std::ios::binary) {
    if (!urandom_.is_open()) {
        log::debug("/dev/urandom unavailable, using std::mt19937_64");
    }
}

void SystemRandom::fill(uint8_t* buf, size_t len) {
    if (!fallback_active_ && urandom_.is_open()) {
        urandom_.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
        if (static_cast<size_t>(urandom_.gcount()) == len) return;
        log::debug("short read from /dev/urandom, switching to std::mt19937_64");
        fallback_active_ = true;
    }

    if (!fallback_seeded_) {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd()};
        fallback_.seed(seq);
        fallback_seeded_ = true;
    }
    fallback_active_ = true;

    std::uniform_int_distribution<unsigned> dist(0, 255);
    for (size_t i = 0; i < len; ++i) {
        buf[i] = static_cast<uint8_t>(dist(fallback_));
    }
}

// ---- SeededRandom ----

SeededRandom::SeededRandom(uint64_t seed)
    : seed_(seed), engine_(seed) {}

void SeededRandom::fill(uint8_t* buf, size_t len) {
    size_t i = 0;
    while (i < len) {
        uint64_t word = engine_();
        for (int b = 0; b < 8 && i < len; ++b, ++i) {
            buf[i] = static_cast<uint8_t>(word >> (56 - 8 * b));
        }
    }
}

std::unique_ptr<RandomSource> make_random_source(const RandomConfig& cfg) {
    if (cfg.source == RandomKind::Seeded) {
        log::debug("using seeded random source (seed %llu)",
                   static_cast<unsigned long long>(cfg.seed));
        return std::make_unique<SeededRandom>(cfg.seed);
    }
    return std::make_unique<SystemRandom>();
}

} // namespace sortid
