#ifndef sandforge_CORE_UTILS_HPP
#define sandforge_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace sandforge {

// ============ Time utilities ============

// Sleep for the specified number of milliseconds
void sleep_ms(int milliseconds);

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Milliseconds on a clock that never jumps; only differences are meaningful
int64_t monotonic_ms();

// Timeout for one request of a call bounded by a monotonic_ms() deadline:
// the time left, or fallback when deadline is 0. Returns 0 once it has passed.
long remaining_ms(int64_t deadline, long fallback);

// Format timestamp as ISO 8601 string (YYYY-MM-DDTHH:MM:SSZ)
std::string format_timestamp(int64_t timestamp);

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Trim whitespace from left side
std::string ltrim(const std::string& s);

// Trim whitespace from right side
std::string rtrim(const std::string& s);

// Convert string to lowercase
std::string to_lower(const std::string& s);

// Check if string starts with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Check if string ends with suffix
bool ends_with(const std::string& s, const std::string& suffix);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Split on runs of spaces/tabs/newlines, dropping empty tokens.
// No quoting or escaping is recognised.
std::vector<std::string> split_whitespace(const std::string& s);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Truncate string safely (UTF-8 aware, doesn't break multi-byte chars)
std::string truncate_safe(const std::string& s, size_t max_len);

// ============ Path utilities ============

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// ============ Random / encoding utilities ============

// Random lowercase base36 string of the given length (OpenSSL RNG)
std::string random_base36(size_t length);

// Standard base64 (RFC 4648) with padding
std::string base64_encode(const std::string& data);

// Decode standard base64; returns false on malformed input
bool base64_decode(const std::string& encoded, std::string& out);

} // namespace sandforge

#endif // sandforge_CORE_UTILS_HPP
