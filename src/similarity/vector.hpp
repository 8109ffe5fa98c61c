#pragma once
#include <optional>
#include <string>
#include <vector>

namespace sift {

using Embedding = std::vector<float>;

enum class Algorithm { Cosine, Euclidean, DotProduct, Manhattan };

std::string algorithm_to_string(Algorithm algo);
std::optional<Algorithm> algorithm_from_string(const std::string& s);

// All functions below throw DimensionMismatch when a.size() != b.size().

// Cosine of the angle between a and b, in [-1, 1].
// Returns 0.0 when either vector has zero magnitude.
double cosine(const Embedding& a, const Embedding& b);

double dot_product(const Embedding& a, const Embedding& b);

double euclidean_distance(const Embedding& a, const Embedding& b);
double manhattan_distance(const Embedding& a, const Embedding& b);

// 1 / (1 + distance), mapping [0, inf) onto (0, 1].
double euclidean_similarity(const Embedding& a, const Embedding& b);
double manhattan_similarity(const Embedding& a, const Embedding& b);

// Dispatch to one of the functions above.
double similarity(const Embedding& a, const Embedding& b, Algorithm algo);

// Serialize a float vector to a binary string (for DB storage).
std::string serialize_vector(const Embedding& vec);

// Deserialize a binary string back to a float vector.
Embedding deserialize_vector(const std::string& data);

} // namespace sift
