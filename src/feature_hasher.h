#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace pefeat {

// MurmurHash3 x86 32-bit. Bucket assignment in the hashing trick is
// murmurhash3_x86_32(utf8, 0) % k; changing it changes every trained model.
std::uint32_t murmurhash3_x86_32(const void* data, std::size_t len, std::uint32_t seed);

std::size_t hash_bucket(const std::string& item, std::size_t buckets);

// Each item adds 1.0 to its bucket. Throws std::invalid_argument if buckets == 0.
std::vector<float> hash_strings(const std::vector<std::string>& items, std::size_t buckets);

// Each (name, weight) adds weight to the bucket of name.
std::vector<float> hash_pairs(const std::vector<std::pair<std::string, double>>& items, std::size_t buckets);

}
