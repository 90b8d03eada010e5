#pragma once
#include "../memory.hpp"
#include <cstddef>
#include <string>

namespace taleweave {

// Cosine of the angle between two embeddings, in [-1, 1].
// 0.0 when either side is empty or zero-length, or when dimensions disagree.
double cosine_similarity(const Embedding& a, const Embedding& b);

// [-1,1] cosine onto the [0,1] scale used in ranking.
inline double normalized_similarity(double cosine) {
    return (cosine + 1.0) / 2.0;
}

// True when a JSON number can be narrowed to an embedding component.
bool representable_as_float(double value);

// Raw native-endian float bytes, as stored in the sqlite embedding column.
std::string embedding_to_blob(const Embedding& embedding);
Embedding embedding_from_blob(const void* data, size_t bytes);

} // namespace taleweave
