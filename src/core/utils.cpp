#include <sandforge/core/utils.hpp>
#include <algorithm>
#include <numeric>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <unistd.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace sandforge {

// ============ Time utilities ============

void sleep_ms(int milliseconds) {
    if (milliseconds <= 0) return;
    usleep(static_cast<useconds_t>(milliseconds) * 1000);
}

int64_t current_timestamp_ms() {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

int64_t monotonic_ms() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

long remaining_ms(int64_t deadline, long fallback) {
    if (deadline == 0) {
        return fallback;
    }
    int64_t left = deadline - monotonic_ms();
    return left > 0 ? static_cast<long>(left) : 0;
}

std::string format_timestamp(int64_t timestamp) {
    time_t t = static_cast<time_t>(timestamp);
    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return std::string(buf);
}

// ============ String utilities ============

std::string trim(const std::string& s) {
    return rtrim(ltrim(s));
}

std::string ltrim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    return s.substr(start);
}

std::string rtrim(const std::string& s) {
    size_t end = s.find_last_not_of(" \t\n\r");
    if (end == std::string::npos) return "";
    return s.substr(0, end + 1);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() &&
           std::equal(prefix.begin(), prefix.end(), s.begin());
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           std::equal(suffix.rbegin(), suffix.rend(), s.rbegin());
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(s);
    std::string part;
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> parts;
    std::istringstream iss(s);
    std::string part;
    while (iss >> part) {
        parts.push_back(part);
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    if (parts.empty()) return "";
    return std::accumulate(
        std::next(parts.begin()), parts.end(), parts[0],
        [&](const std::string& a, const std::string& b) {
            return a + delimiter + b;
        });
}

std::string truncate_safe(const std::string& s, size_t max_len) {
    if (s.size() <= max_len) return s;

    // Find a safe truncation point (don't break UTF-8 multi-byte sequences)
    size_t len = max_len;
    while (len > 0 && (static_cast<unsigned char>(s[len]) & 0xC0) == 0x80) {
        --len;  // Back up if in the middle of a multi-byte sequence
    }
    return s.substr(0, len);
}

// ============ Path utilities ============

std::string join_path(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;
    if (b[0] == '/') return b;
    if (a[a.size() - 1] == '/') return a + b;
    return a + "/" + b;
}

// ============ Random / encoding utilities ============

std::string random_base36(size_t length) {
    static const char ALPHABET[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::string out;
    out.reserve(length);

    unsigned char buf[32];
    while (out.size() < length) {
        if (RAND_bytes(buf, sizeof(buf)) != 1) {
            throw std::runtime_error("RAND_bytes failed");
        }
        for (size_t i = 0; i < sizeof(buf) && out.size() < length; ++i) {
            // 252 = 36 * 7; rejecting the tail keeps the distribution uniform
            if (buf[i] >= 252) continue;
            out.push_back(ALPHABET[buf[i] % 36]);
        }
    }
    return out;
}

std::string base64_encode(const std::string& data) {
    if (data.empty()) return "";
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            reinterpret_cast<const unsigned char*>(data.data()),
                            static_cast<int>(data.size()));
    out.resize(n > 0 ? static_cast<size_t>(n) : 0);
    return out;
}

bool base64_decode(const std::string& encoded, std::string& out) {
    out.clear();
    if (encoded.empty()) return true;
    if (encoded.size() % 4 != 0) return false;

    std::string buf(3 * (encoded.size() / 4) + 1, '\0');
    int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&buf[0]),
                            reinterpret_cast<const unsigned char*>(encoded.data()),
                            static_cast<int>(encoded.size()));
    if (n < 0) return false;

    // EVP_DecodeBlock counts padding as zero bytes
    size_t padding = 0;
    if (encoded[encoded.size() - 1] == '=') ++padding;
    if (encoded[encoded.size() - 2] == '=') ++padding;
    buf.resize(static_cast<size_t>(n) - padding);
    out.swap(buf);
    return true;
}

} // namespace sandforge
