#ifndef scriptcell_CORE_UTILS_HPP
#define scriptcell_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace scriptcell {

// ============ Time utilities ============

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Milliseconds on the monotonic clock (for deadlines and durations)
int64_t monotonic_ms();

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Truncate string safely (UTF-8 aware, doesn't break multi-byte chars)
std::string truncate_safe(const std::string& s, size_t max_len);

// "1.5" for 1.5, "30" for 30.0
std::string format_seconds(double seconds);

// ============ Path utilities ============

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Directory holding the running executable ("" if it cannot be resolved)
std::string executable_dir();

// ============ UUID utilities ============

// Generate a random UUID v4
std::string generate_uuid();

// 128 random bits from the CSPRNG as hex. Throws std::runtime_error if
// the generator fails; there is no weaker fallback.
std::string secure_token();

// ============ Hashing utilities ============

// Lowercase hex SHA-256 of the input
std::string sha256_hex(const std::string& data);

} // namespace scriptcell

#endif // scriptcell_CORE_UTILS_HPP
