/*
 * HiveMem C++ - Feature-hashing embeddings Implementation
 */
#include <hivemem/patterns/embedding.hpp>
#include <hivemem/core/utils.hpp>
#include <cmath>
#include <cstdint>
#include <cstring>

namespace hivemem {

HashEmbedder::HashEmbedder(int dim) : dim_(dim > 0 ? dim : 256) {}

Embedding HashEmbedder::embed(const std::string& text) const {
    Embedding v(static_cast<size_t>(dim_), 0.0f);
    std::vector<std::string> words = tokenize_words(text);

    for (size_t i = 0; i < words.size(); ++i) {
        add_feature(v, "w:" + words[i], 1.0f);
        if (i + 1 < words.size()) {
            add_feature(v, "b:" + words[i] + " " + words[i + 1], 0.5f);
        }
    }

    normalize(v);
    return v;
}

void HashEmbedder::add_feature(Embedding& v, const std::string& feature, float weight) const {
    std::vector<unsigned char> digest = sha256_bytes(feature);
    if (digest.size() < 5) return;

    uint32_t bucket = (static_cast<uint32_t>(digest[0]) << 24) |
                      (static_cast<uint32_t>(digest[1]) << 16) |
                      (static_cast<uint32_t>(digest[2]) << 8) |
                      static_cast<uint32_t>(digest[3]);
    float sign = (digest[4] & 1) ? -1.0f : 1.0f;
    v[bucket % static_cast<uint32_t>(dim_)] += sign * weight;
}

std::string HashEmbedder::to_blob(const Embedding& v) {
    std::string blob;
    blob.reserve(v.size() * 4);
    for (float f : v) {
        uint32_t bits;
        std::memcpy(&bits, &f, sizeof(bits));
        blob.push_back(static_cast<char>(bits & 0xff));
        blob.push_back(static_cast<char>((bits >> 8) & 0xff));
        blob.push_back(static_cast<char>((bits >> 16) & 0xff));
        blob.push_back(static_cast<char>((bits >> 24) & 0xff));
    }
    return blob;
}

Embedding HashEmbedder::from_blob(const std::string& blob) {
    Embedding v;
    v.reserve(blob.size() / 4);
    for (size_t i = 0; i + 3 < blob.size(); i += 4) {
        uint32_t bits = static_cast<uint32_t>(static_cast<unsigned char>(blob[i])) |
                        (static_cast<uint32_t>(static_cast<unsigned char>(blob[i + 1])) << 8) |
                        (static_cast<uint32_t>(static_cast<unsigned char>(blob[i + 2])) << 16) |
                        (static_cast<uint32_t>(static_cast<unsigned char>(blob[i + 3])) << 24);
        float f;
        std::memcpy(&f, &bits, sizeof(f));
        v.push_back(f);
    }
    return v;
}

float cosine_similarity(const Embedding& a, const Embedding& b) {
    size_t n = a.size() < b.size() ? a.size() : b.size();
    float dot = 0.0f;
    for (size_t i = 0; i < n; ++i) {
        dot += a[i] * b[i];
    }
    return dot;
}

void normalize(Embedding& v) {
    float norm = 0.0f;
    for (float f : v) norm += f * f;
    if (norm <= 0.0f) return;
    norm = std::sqrt(norm);
    for (float& f : v) f /= norm;
}

} // namespace hivemem
