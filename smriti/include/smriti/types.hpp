#pragma once
// Core types: the atoms of recall
//
// Every entry has a string id. Every embedding has the same width.
// Time is UTC and stored as ISO-8601 text.

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>
#include <vector>

namespace smriti {

// Embedding dimension (vocabulary width)
constexpr size_t EMBED_DIM = 768;

// Timestamp as Unix millis
using Timestamp = int64_t;

constexpr Timestamp MILLIS_PER_DAY = 86400000LL;

// Current time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// Format as "YYYY-MM-DDTHH:MM:SS.mmmZ"
inline std::string format_iso8601(Timestamp ts) {
    std::time_t secs = static_cast<std::time_t>(ts / 1000);
    int millis = static_cast<int>(ts % 1000);
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
    return buf;
}

// Parse "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS" or with fractional seconds / Z.
// Returns false when the prefix is not a date.
inline bool parse_iso8601(const std::string& s, Timestamp& out) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0, ms = 0;
    int n = std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3d",
                        &y, &mo, &d, &h, &mi, &sec, &ms);
    if (n < 3) return false;
    if (mo < 1 || mo > 12 || d < 1 || d > 31) return false;

    std::tm tm{};
    tm.tm_year = y - 1900;
    tm.tm_mon = mo - 1;
    tm.tm_mday = d;
    tm.tm_hour = n >= 4 ? h : 0;
    tm.tm_min = n >= 5 ? mi : 0;
    tm.tm_sec = n >= 6 ? sec : 0;
    out = static_cast<Timestamp>(timegm(&tm)) * 1000 + (n >= 7 ? ms : 0);
    return true;
}

// Fixed-width dense embedding
class Embedding {
public:
    Embedding() { data_.fill(0.0f); }

    float& operator[](size_t i) { return data_[i]; }
    float operator[](size_t i) const { return data_[i]; }

    const float* data() const { return data_.data(); }
    float* data() { return data_.data(); }
    static constexpr size_t size() { return EMBED_DIM; }
    static constexpr size_t byte_size() { return EMBED_DIM * sizeof(float); }

    float norm_sq() const {
        float sum = 0.0f;
        for (float v : data_) sum += v * v;
        return sum;
    }

    float norm() const { return std::sqrt(norm_sq()); }

    bool is_zero() const {
        for (float v : data_) {
            if (v != 0.0f) return false;
        }
        return true;
    }

    // Scale to unit length; the zero vector stays zero
    void normalize() {
        float n = norm();
        if (n > 0.0f) {
            for (float& v : data_) v /= n;
        }
    }

    float l2_distance(const Embedding& other) const {
        float sum = 0.0f;
        for (size_t i = 0; i < EMBED_DIM; ++i) {
            float d = data_[i] - other.data_[i];
            sum += d * d;
        }
        return std::sqrt(sum);
    }

    bool operator==(const Embedding& other) const { return data_ == other.data_; }

private:
    std::array<float, EMBED_DIM> data_;
};

} // namespace smriti
