/*
 * HiveMem C++ - Shared helpers Implementation
 */
#include <hivemem/core/utils.hpp>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <random>
#include <sys/stat.h>
#include <sys/types.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace hivemem {

int64_t current_timestamp_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// ============================================================================
// Strings
// ============================================================================

std::string trim(const std::string& s) {
    static const char* ws = " \t\r\n";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return std::string();
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::string to_lower(const std::string& s) {
    std::string out(s);
    for (auto& ch : out) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return out;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    if (s.empty()) return parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(delimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += delimiter;
        out += parts[i];
    }
    return out;
}

std::vector<std::string> tokenize_words(const std::string& text) {
    std::vector<std::string> words;
    std::string word;
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c >= 0x80) {
            word.push_back(static_cast<char>(std::tolower(c)));
            continue;
        }
        if (!word.empty()) {
            words.push_back(word);
            word.clear();
        }
    }
    if (!word.empty()) words.push_back(word);
    return words;
}

std::string glob_to_like(const std::string& glob) {
    std::string like;
    like.reserve(glob.size() + 4);
    for (char c : glob) {
        if (c == '*') {
            like.push_back('%');
        } else if (c == '?') {
            like.push_back('_');
        } else {
            if (c == '%' || c == '_' || c == '\\') like.push_back('\\');
            like.push_back(c);
        }
    }
    return like;
}

// ============================================================================
// Filesystem
// ============================================================================

bool create_parent_directory(const std::string& filepath) {
    size_t slash = filepath.rfind('/');
    if (slash == std::string::npos || slash == 0) return true;

    std::string dir = filepath.substr(0, slash);
    for (size_t pos = 1; pos <= dir.size(); ++pos) {
        if (pos != dir.size() && dir[pos] != '/') continue;
        std::string prefix = dir.substr(0, pos);
        if (::mkdir(prefix.c_str(), 0755) != 0 && errno != EEXIST) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Identifiers and hashing
// ============================================================================

std::string generate_uuid() {
    unsigned char b[16];
    if (RAND_bytes(b, sizeof(b)) != 1) {
        // Entropy pool unavailable; ids only need to be unique, not secret
        std::random_device rd;
        for (auto& byte : b) byte = static_cast<unsigned char>(rd());
    }
    b[6] = static_cast<unsigned char>((b[6] & 0x0F) | 0x40);
    b[8] = static_cast<unsigned char>((b[8] & 0x3F) | 0x80);

    char out[37];
    snprintf(out, sizeof(out),
             "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
             b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
             b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
    return std::string(out);
}

std::vector<unsigned char> sha256_bytes(const std::string& data) {
    std::vector<unsigned char> digest(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest.data());
    return digest;
}

} // namespace hivemem
