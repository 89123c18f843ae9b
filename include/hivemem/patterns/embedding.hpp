/*
 * HiveMem C++ - Feature-hashing embeddings
 *
 * Deterministic bag-of-features embedding: words and word bigrams are
 * hashed (SHA-256) into a fixed number of signed buckets, then the vector
 * is L2-normalized. Identical text always yields the identical vector on
 * every node.
 */
#ifndef hivemem_PATTERNS_EMBEDDING_HPP
#define hivemem_PATTERNS_EMBEDDING_HPP

#include <hivemem/patterns/types.hpp>
#include <string>

namespace hivemem {

class HashEmbedder {
public:
    explicit HashEmbedder(int dim = 256);

    int dim() const { return dim_; }

    // Unit vector; all zeros only for text without any word characters
    Embedding embed(const std::string& text) const;

    // Serialized little-endian float32 blob for the patterns table
    static std::string to_blob(const Embedding& v);
    static Embedding from_blob(const std::string& blob);

private:
    void add_feature(Embedding& v, const std::string& feature, float weight) const;

    int dim_;
};

// Dot product; equals cosine similarity for unit vectors
float cosine_similarity(const Embedding& a, const Embedding& b);

void normalize(Embedding& v);

} // namespace hivemem

#endif // hivemem_PATTERNS_EMBEDDING_HPP
