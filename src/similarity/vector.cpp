#include "vector.hpp"
#include "../errors.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>

namespace sift {

static void require_same_length(const Embedding& a, const Embedding& b) {
    if (a.size() != b.size()) {
        throw DimensionMismatch(a.size(), b.size());
    }
}

std::string algorithm_to_string(Algorithm algo) {
    switch (algo) {
        case Algorithm::Cosine:     return "cosine";
        case Algorithm::Euclidean:  return "euclidean";
        case Algorithm::DotProduct: return "dot_product";
        case Algorithm::Manhattan:  return "manhattan";
    }
    return "cosine";
}

std::optional<Algorithm> algorithm_from_string(const std::string& s) {
    if (s == "cosine")      return Algorithm::Cosine;
    if (s == "euclidean")   return Algorithm::Euclidean;
    if (s == "dot_product") return Algorithm::DotProduct;
    if (s == "manhattan")   return Algorithm::Manhattan;
    return std::nullopt;
}

double cosine(const Embedding& a, const Embedding& b) {
    require_same_length(a, b);

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;

    for (size_t i = 0; i < a.size(); i++) {
        dot    += static_cast<double>(a[i]) * static_cast<double>(b[i]);
        norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
        norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
    }

    if (norm_a == 0.0 || norm_b == 0.0) return 0.0;

    // sqrt of the product keeps cosine(v, v) exactly 1.0
    double sim = dot / std::sqrt(norm_a * norm_b);
    return std::clamp(sim, -1.0, 1.0);
}

double dot_product(const Embedding& a, const Embedding& b) {
    require_same_length(a, b);

    double dot = 0.0;
    for (size_t i = 0; i < a.size(); i++) {
        dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    }
    return dot;
}

double euclidean_distance(const Embedding& a, const Embedding& b) {
    require_same_length(a, b);

    double sum = 0.0;
    for (size_t i = 0; i < a.size(); i++) {
        double d = static_cast<double>(a[i]) - static_cast<double>(b[i]);
        sum += d * d;
    }
    return std::sqrt(sum);
}

double manhattan_distance(const Embedding& a, const Embedding& b) {
    require_same_length(a, b);

    double sum = 0.0;
    for (size_t i = 0; i < a.size(); i++) {
        sum += std::abs(static_cast<double>(a[i]) - static_cast<double>(b[i]));
    }
    return sum;
}

double euclidean_similarity(const Embedding& a, const Embedding& b) {
    return 1.0 / (1.0 + euclidean_distance(a, b));
}

double manhattan_similarity(const Embedding& a, const Embedding& b) {
    return 1.0 / (1.0 + manhattan_distance(a, b));
}

double similarity(const Embedding& a, const Embedding& b, Algorithm algo) {
    switch (algo) {
        case Algorithm::Cosine:     return cosine(a, b);
        case Algorithm::Euclidean:  return euclidean_similarity(a, b);
        case Algorithm::DotProduct: return dot_product(a, b);
        case Algorithm::Manhattan:  return manhattan_similarity(a, b);
    }
    return cosine(a, b);
}

std::string serialize_vector(const Embedding& vec) {
    if (vec.empty()) return {};

    std::string data(sizeof(float) * vec.size(), '\0');
    std::memcpy(data.data(), vec.data(), sizeof(float) * vec.size());
    return data;
}

Embedding deserialize_vector(const std::string& data) {
    if (data.empty() || data.size() % sizeof(float) != 0) return {};

    Embedding vec(data.size() / sizeof(float));
    std::memcpy(vec.data(), data.data(), data.size());
    return vec;
}

} // namespace sift
