/*
 * HiveMem C++ - Shared helpers
 */
#ifndef hivemem_CORE_UTILS_HPP
#define hivemem_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace hivemem {

template<typename T>
T clamp(T value, T min_val, T max_val) {
    if (value < min_val) return min_val;
    if (value > max_val) return max_val;
    return value;
}

// Wall clock in unix milliseconds
int64_t current_timestamp_ms();

// ============ Strings ============

std::string trim(const std::string& s);
std::string to_lower(const std::string& s);
bool starts_with(const std::string& s, const std::string& prefix);

// Empty fields are kept: split("a..b", '.') -> a, "", b
std::vector<std::string> split(const std::string& s, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Lowercased alphanumeric words ("Retry-with backoff2" -> retry, with, backoff2).
// Bytes >= 0x80 count as word characters so UTF-8 text stays intact.
std::vector<std::string> tokenize_words(const std::string& text);

// '*' / '?' glob to a SQL LIKE pattern using '\' as the escape character
std::string glob_to_like(const std::string& glob);

// ============ Filesystem ============

// mkdir -p for the directory part of filepath
bool create_parent_directory(const std::string& filepath);

// ============ Identifiers and hashing ============

// Random UUID v4 from the OpenSSL CSPRNG
std::string generate_uuid();

// SHA-256 digest of data (32 raw bytes)
std::vector<unsigned char> sha256_bytes(const std::string& data);

} // namespace hivemem

#endif // hivemem_CORE_UTILS_HPP
