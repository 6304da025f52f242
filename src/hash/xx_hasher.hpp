#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <xxhash.h>

// Seeded 64-bit xxHash functor for unordered containers. Distribution counting
// does not need a cryptographically secure hash, so this is the default.
template <typename K, typename Enable = void> struct XXHasher;

namespace xx_hasher_detail {

inline uint64_t hash_bytes(const void *data, std::size_t length, uint64_t seed) { return XXH64(data, length, seed); }

// Bytes of K that carry its value. x87 extended precision long double stores
// 10 value bytes followed by padding that is never written.
template <typename K> constexpr std::size_t value_size() {
    if constexpr (std::is_same_v<K, long double>) {
        if constexpr (std::numeric_limits<long double>::digits == 64) return 10;
    }
    return sizeof(K);
}

// Boost-style mixing, used for composite keys.
inline uint64_t combine(uint64_t seed, uint64_t h) { return seed ^ (h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2)); }

}   // namespace xx_hasher_detail

template <typename K> struct XXHasher<K, std::enable_if_t<std::is_arithmetic_v<K> || std::is_enum_v<K>>> {
    XXHasher() = default;
    explicit XXHasher(uint64_t seed) : m_seed(seed) {}

    std::size_t operator()(const K &key) const {
        // +0.0 and -0.0 compare equal and must hash equal
        if constexpr (std::is_floating_point_v<K>) {
            if (key == K(0)) {
                K zero = K(0);
                return static_cast<std::size_t>(xx_hasher_detail::hash_bytes(&zero, xx_hasher_detail::value_size<K>(), m_seed));
            }
        }
        return static_cast<std::size_t>(xx_hasher_detail::hash_bytes(&key, xx_hasher_detail::value_size<K>(), m_seed));
    }

    uint64_t seed() const { return m_seed; }

  private:
    uint64_t m_seed = 0;
};

template <typename CharT, typename Traits, typename Alloc> struct XXHasher<std::basic_string<CharT, Traits, Alloc>> {
    XXHasher() = default;
    explicit XXHasher(uint64_t seed) : m_seed(seed) {}

    std::size_t operator()(const std::basic_string<CharT, Traits, Alloc> &key) const {
        return static_cast<std::size_t>(xx_hasher_detail::hash_bytes(key.data(), key.size() * sizeof(CharT), m_seed));
    }

    uint64_t seed() const { return m_seed; }

  private:
    uint64_t m_seed = 0;
};

template <typename CharT, typename Traits> struct XXHasher<std::basic_string_view<CharT, Traits>> {
    XXHasher() = default;
    explicit XXHasher(uint64_t seed) : m_seed(seed) {}

    std::size_t operator()(std::basic_string_view<CharT, Traits> key) const {
        return static_cast<std::size_t>(xx_hasher_detail::hash_bytes(key.data(), key.size() * sizeof(CharT), m_seed));
    }

    uint64_t seed() const { return m_seed; }

  private:
    uint64_t m_seed = 0;
};

// C string keys are hashed by content, matching std::string_view equality.
template <> struct XXHasher<const char *> {
    XXHasher() = default;
    explicit XXHasher(uint64_t seed) : m_seed(seed) {}

    std::size_t operator()(const char *key) const { return static_cast<std::size_t>(xx_hasher_detail::hash_bytes(key, std::strlen(key), m_seed)); }

    uint64_t seed() const { return m_seed; }

  private:
    uint64_t m_seed = 0;
};

template <typename A, typename B> struct XXHasher<std::pair<A, B>> {
    XXHasher() = default;
    explicit XXHasher(uint64_t seed) : m_seed(seed), m_first(seed), m_second(seed) {}

    std::size_t operator()(const std::pair<A, B> &key) const {
        uint64_t h = xx_hasher_detail::combine(m_seed, m_first(key.first));
        return static_cast<std::size_t>(xx_hasher_detail::combine(h, m_second(key.second)));
    }

    uint64_t seed() const { return m_seed; }

  private:
    uint64_t m_seed = 0;
    XXHasher<A> m_first;
    XXHasher<B> m_second;
};

// Equality for C string keys, compares content instead of pointers.
struct CStringEqual {
    bool operator()(const char *a, const char *b) const { return std::strcmp(a, b) == 0; }
};

// Key equality used by default alongside XXHasher<K>. C string keys compare by
// content so that equal text counts as one key.
template <typename K> struct DefaultKeyEqual {
    using type = std::equal_to<K>;
};

template <> struct DefaultKeyEqual<const char *> {
    using type = CStringEqual;
};

template <typename K> using default_key_equal_t = typename DefaultKeyEqual<K>::type;
