// cpp/common/content_hash.h
#pragma once

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <string_view>

// Streaming 64-bit content hash (xxhash64 round structure, little-endian lanes).
// Used as the freshness token of a master file: feeding the same bytes in any
// chunking yields the same digest.
class ContentHash64 {
public:
    explicit ContentHash64(std::uint64_t seed = 0) : seed_(seed) {
        acc_[0] = seed + P1 + P2;
        acc_[1] = seed + P2;
        acc_[2] = seed;
        acc_[3] = seed - P1;
    }

    void update(const void* data, std::size_t len) {
        const auto* p = static_cast<const std::uint8_t*>(data);
        total_ += len;

        if (tail_len_ + len < STRIPE) {
            if (len > 0) std::memcpy(tail_ + tail_len_, p, len);
            tail_len_ += len;
            return;
        }

        if (tail_len_ > 0) {
            const std::size_t need = STRIPE - tail_len_;
            std::memcpy(tail_ + tail_len_, p, need);
            consume_stripe(tail_);
            p += need;
            len -= need;
            tail_len_ = 0;
        }

        while (len >= STRIPE) {
            consume_stripe(p);
            p += STRIPE;
            len -= STRIPE;
        }

        if (len > 0) {
            std::memcpy(tail_, p, len);
            tail_len_ = len;
        }
    }

    void update(std::string_view s) { update(s.data(), s.size()); }

    std::uint64_t digest() const {
        std::uint64_t h;
        if (total_ >= STRIPE) {
            h = rotl(acc_[0], 1) + rotl(acc_[1], 7) + rotl(acc_[2], 12) + rotl(acc_[3], 18);
            for (std::uint64_t a : acc_) h = merge_lane(h, a);
        } else {
            h = seed_ + P5;
        }
        h += total_;

        const std::uint8_t* p = tail_;
        std::size_t len = tail_len_;
        while (len >= 8) {
            h ^= round(0, load64(p));
            h = rotl(h, 27) * P1 + P4;
            p += 8;
            len -= 8;
        }
        if (len >= 4) {
            std::uint32_t k;
            std::memcpy(&k, p, 4);
            h ^= static_cast<std::uint64_t>(k) * P1;
            h = rotl(h, 23) * P2 + P3;
            p += 4;
            len -= 4;
        }
        while (len > 0) {
            h ^= (*p) * P5;
            h = rotl(h, 11) * P1;
            ++p;
            --len;
        }

        h ^= h >> 33;
        h *= P2;
        h ^= h >> 29;
        h *= P3;
        h ^= h >> 32;
        return h;
    }

    std::uint64_t bytes() const { return total_; }

    // 16 lowercase hex digits
    static std::string to_hex(std::uint64_t h) {
        char buf[17];
        std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(h));
        return std::string(buf, 16);
    }

private:
    static constexpr std::uint64_t P1 = 11400714785074694791ULL;
    static constexpr std::uint64_t P2 = 14029467366897019727ULL;
    static constexpr std::uint64_t P3 =  1609587929392839161ULL;
    static constexpr std::uint64_t P4 =  9650029242287828579ULL;
    static constexpr std::uint64_t P5 =  2870177450012600261ULL;
    static constexpr std::size_t STRIPE = 32;

    static inline std::uint64_t rotl(std::uint64_t x, int r) { return (x << r) | (x >> (64 - r)); }

    static inline std::uint64_t load64(const std::uint8_t* p) {
        std::uint64_t v;
        std::memcpy(&v, p, 8);
        return v;
    }

    static inline std::uint64_t round(std::uint64_t acc, std::uint64_t lane) {
        acc += lane * P2;
        acc = rotl(acc, 31);
        return acc * P1;
    }

    static inline std::uint64_t merge_lane(std::uint64_t h, std::uint64_t acc) {
        h ^= round(0, acc);
        return h * P1 + P4;
    }

    void consume_stripe(const std::uint8_t* p) {
        for (int i = 0; i < 4; ++i) acc_[i] = round(acc_[i], load64(p + 8 * i));
    }

    std::uint64_t seed_;
    std::uint64_t acc_[4];
    std::uint64_t total_ = 0;

    std::uint8_t tail_[STRIPE];
    std::size_t  tail_len_ = 0;
};
