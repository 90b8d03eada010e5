#include "vector.hpp"
#include <cmath>
#include <cstring>
#include <functional>
#include <limits>
#include <numeric>

namespace taleweave {

namespace {

double widened_dot(const Embedding& a, const Embedding& b) {
    return std::inner_product(a.begin(), a.end(), b.begin(), 0.0,
                              std::plus<double>(),
                              [](float x, float y) {
                                  return static_cast<double>(x) * static_cast<double>(y);
                              });
}

} // namespace

double cosine_similarity(const Embedding& a, const Embedding& b) {
    if (a.size() != b.size() || a.empty()) return 0.0;

    const double magnitude = std::sqrt(widened_dot(a, a) * widened_dot(b, b));
    if (magnitude < 1e-12) return 0.0;
    return widened_dot(a, b) / magnitude;
}

bool representable_as_float(double value) {
    return std::isfinite(value) &&
           std::fabs(value) <= static_cast<double>(std::numeric_limits<float>::max());
}

std::string embedding_to_blob(const Embedding& embedding) {
    const auto* bytes = reinterpret_cast<const char*>(embedding.data());
    return std::string(bytes, bytes + embedding.size() * sizeof(float));
}

Embedding embedding_from_blob(const void* data, size_t bytes) {
    if (data == nullptr || bytes == 0 || bytes % sizeof(float) != 0) return {};

    Embedding embedding(bytes / sizeof(float));
    std::memcpy(embedding.data(), data, bytes);
    return embedding;
}

} // namespace taleweave
