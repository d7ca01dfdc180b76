#include "feature_hasher.h"

#include <stdexcept>

namespace pefeat {

static inline std::uint32_t rotl32(std::uint32_t x, int r) {
  return (x << r) | (x >> (32 - r));
}

static inline std::uint32_t fmix32(std::uint32_t h) {
  h ^= h >> 16;
  h *= 0x85ebca6bu;
  h ^= h >> 13;
  h *= 0xc2b2ae35u;
  h ^= h >> 16;
  return h;
}

std::uint32_t murmurhash3_x86_32(const void* data, std::size_t len, std::uint32_t seed) {
  const auto* bytes = static_cast<const std::uint8_t*>(data);
  const std::size_t nblocks = len / 4;
  std::uint32_t h1 = seed;

  static constexpr std::uint32_t c1 = 0xcc9e2d51u;
  static constexpr std::uint32_t c2 = 0x1b873593u;

  for (std::size_t i = 0; i < nblocks; ++i) {
    // little-endian block read regardless of host order
    const std::uint8_t* p = bytes + i * 4;
    std::uint32_t k1 = static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
                       (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
    k1 *= c1;
    k1 = rotl32(k1, 15);
    k1 *= c2;

    h1 ^= k1;
    h1 = rotl32(h1, 13);
    h1 = h1 * 5 + 0xe6546b64u;
  }

  const std::uint8_t* tail = bytes + nblocks * 4;
  std::uint32_t k1 = 0;
  switch (len & 3) {
    case 3:
      k1 ^= static_cast<std::uint32_t>(tail[2]) << 16;
      [[fallthrough]];
    case 2:
      k1 ^= static_cast<std::uint32_t>(tail[1]) << 8;
      [[fallthrough]];
    case 1:
      k1 ^= static_cast<std::uint32_t>(tail[0]);
      k1 *= c1;
      k1 = rotl32(k1, 15);
      k1 *= c2;
      h1 ^= k1;
      break;
    default:
      break;
  }

  h1 ^= static_cast<std::uint32_t>(len);
  return fmix32(h1);
}

std::size_t hash_bucket(const std::string& item, std::size_t buckets) {
  if (buckets == 0) {
    throw std::invalid_argument("feature hasher bucket count must be greater than zero");
  }
  std::uint32_t h = murmurhash3_x86_32(item.data(), item.size(), 0);
  return static_cast<std::size_t>(h % static_cast<std::uint64_t>(buckets));
}

std::vector<float> hash_strings(const std::vector<std::string>& items, std::size_t buckets) {
  if (buckets == 0) {
    throw std::invalid_argument("feature hasher bucket count must be greater than zero");
  }
  std::vector<double> acc(buckets, 0.0);
  for (const std::string& s : items) {
    acc[hash_bucket(s, buckets)] += 1.0;
  }
  return std::vector<float>(acc.begin(), acc.end());
}

std::vector<float> hash_pairs(const std::vector<std::pair<std::string, double>>& items, std::size_t buckets) {
  if (buckets == 0) {
    throw std::invalid_argument("feature hasher bucket count must be greater than zero");
  }
  std::vector<double> acc(buckets, 0.0);
  for (const auto& p : items) {
    acc[hash_bucket(p.first, buckets)] += p.second;
  }
  return std::vector<float>(acc.begin(), acc.end());
}

}
