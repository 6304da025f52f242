#pragma once

#include "distribution.hpp"
#include "hash/xx_hasher.hpp"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

/**
 * Frequency distribution over keys of type K. Keeps track of how many times
 * an object appears in a larger context, e.g. how many times a token appears
 * in a piece of text. Storage is a hash map, so K must be hashable by Hash and
 * comparable by KeyEqual.
 *
 *   FrequencyDistribution<std::string> fdist;
 *   fdist.insert("hello");
 *   fdist.insert("hello");
 *   fdist.insert("goodbye");
 *   fdist.get("hello");   // 2
 *   fdist.sum_counts();   // 3
 *
 * Not thread-safe.
 */
template <typename K, typename Hash = XXHasher<K>, typename KeyEqual = default_key_equal_t<K>> class FrequencyDistribution : public Distribution<K, std::size_t> {
  public:
    using key_type = K;
    using quantity_type = std::size_t;
    using size_type = std::size_t;
    using hasher = Hash;
    using key_equal = KeyEqual;
    using map_type = std::unordered_map<K, quantity_type, Hash, KeyEqual>;
    using value_type = typename map_type::value_type;
    using const_iterator = typename map_type::const_iterator;
    using iterator = const_iterator;

    class KeysView {
      public:
        class iterator {
          public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = K;
            using difference_type = std::ptrdiff_t;
            using pointer = const K *;
            using reference = const K &;

            iterator() = default;
            explicit iterator(const_iterator it) : m_it(it) {}

            reference operator*() const { return m_it->first; }
            pointer operator->() const { return &m_it->first; }

            iterator &operator++() {
                ++m_it;
                return *this;
            }

            iterator operator++(int) {
                iterator tmp = *this;
                ++m_it;
                return tmp;
            }

            friend bool operator==(const iterator &a, const iterator &b) { return a.m_it == b.m_it; }
            friend bool operator!=(const iterator &a, const iterator &b) { return a.m_it != b.m_it; }

          private:
            const_iterator m_it;
        };

        explicit KeysView(const map_type &counts) : m_counts(&counts) {}

        iterator begin() const { return iterator(m_counts->begin()); }
        iterator end() const { return iterator(m_counts->end()); }
        size_type size() const { return m_counts->size(); }

      private:
        const map_type *m_counts;
    };

    // Lazily skips entries whose stored count is zero.
    class NonZeroKeysView {
      public:
        class iterator {
          public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = K;
            using difference_type = std::ptrdiff_t;
            using pointer = const K *;
            using reference = const K &;

            iterator() = default;
            iterator(const_iterator it, const_iterator last) : m_it(it), m_last(last) { _skip_zeros(); }

            reference operator*() const { return m_it->first; }
            pointer operator->() const { return &m_it->first; }

            iterator &operator++() {
                ++m_it;
                _skip_zeros();
                return *this;
            }

            iterator operator++(int) {
                iterator tmp = *this;
                ++(*this);
                return tmp;
            }

            friend bool operator==(const iterator &a, const iterator &b) { return a.m_it == b.m_it; }
            friend bool operator!=(const iterator &a, const iterator &b) { return a.m_it != b.m_it; }

          private:
            void _skip_zeros() {
                while (m_it != m_last && m_it->second == 0) ++m_it;
            }

            const_iterator m_it;
            const_iterator m_last;
        };

        explicit NonZeroKeysView(const map_type &counts) : m_counts(&counts) {}

        iterator begin() const { return iterator(m_counts->begin(), m_counts->end()); }
        iterator end() const { return iterator(m_counts->end(), m_counts->end()); }

        // Upper bound; zero-count entries are not excluded.
        size_type size_hint() const { return m_counts->size(); }

      private:
        const map_type *m_counts;
    };

    FrequencyDistribution() = default;

    explicit FrequencyDistribution(size_type capacity, const Hash &hash = Hash(), const KeyEqual &equal = KeyEqual())
        : m_counts(capacity, hash, equal) {}

    FrequencyDistribution(std::initializer_list<std::pair<K, quantity_type>> pairs) {
        m_counts.reserve(pairs.size());
        extend(pairs);
    }

    static FrequencyDistribution with_capacity(size_type capacity) { return FrequencyDistribution(capacity); }

    static FrequencyDistribution with_hasher(const Hash &hash) { return FrequencyDistribution(0, hash); }

    static FrequencyDistribution with_capacity_and_hasher(size_type capacity, const Hash &hash) { return FrequencyDistribution(capacity, hash); }

    // Builds a distribution from (key, count) pairs. Forward iterators give an
    // exact size hint, single-pass iterators only the lower bound of zero.
    template <typename InputIt> static FrequencyDistribution from_iter(InputIt first, InputIt last) {
        FrequencyDistribution fdist(_size_hint(first, last));
        fdist.extend(first, last);
        return fdist;
    }

    template <typename Range> static FrequencyDistribution from_iter(const Range &pairs) {
        using std::begin;
        using std::end;
        return from_iter(begin(pairs), end(pairs));
    }

    // --- Distribution interface ---

    size_type len() const override { return m_counts.size(); }

    quantity_type get(const key_type &key) const override {
        auto it = m_counts.find(key);
        if (it == m_counts.end()) return quantity_type(0);
        return it->second;
    }

    void clear() override {
        m_counts.clear();
        m_total = 0;
    }

    void insert(const key_type &key) override { _insert_or_increment_by(key, 1); }

    void insert(key_type &&key) { _insert_or_increment_by(std::move(key), 1); }

    void remove(const key_type &key) override {
        auto it = m_counts.find(key);
        if (it == m_counts.end()) return;
        m_total -= it->second;
        m_counts.erase(it);
    }

    // --- Bulk ingestion ---

    // Later pairs for the same key accumulate onto earlier ones.
    template <typename InputIt> void extend(InputIt first, InputIt last) {
        for (; first != last; ++first) {
            auto &&entry = *first;
            _insert_or_increment_by(entry.first, static_cast<quantity_type>(entry.second));
        }
    }

    template <typename Range> void extend(const Range &pairs) {
        using std::begin;
        using std::end;
        extend(begin(pairs), end(pairs));
    }

    void extend(std::initializer_list<std::pair<K, quantity_type>> pairs) { extend(pairs.begin(), pairs.end()); }

    void merge(const FrequencyDistribution &other) {
        if (&other == this) {
            for (auto &entry : m_counts) entry.second *= 2;
            m_total *= 2;
            return;
        }
        extend(other.m_counts.begin(), other.m_counts.end());
    }

    // --- Queries ---

    size_type size() const { return m_counts.size(); }

    bool empty() const { return m_counts.empty(); }

    quantity_type sum_counts() const { return m_total; }

    bool contains(const key_type &key) const { return m_counts.find(key) != m_counts.end(); }

    void reserve(size_type capacity) { m_counts.reserve(capacity); }

    // The k entries with the highest counts, highest first. Ties are in
    // unspecified order. k == 0 returns every entry.
    std::vector<std::pair<K, quantity_type>> most_common(size_type k = 0) const {
        std::vector<std::pair<K, quantity_type>> entries(m_counts.begin(), m_counts.end());
        auto by_count = [](const auto &a, const auto &b) { return a.second > b.second; };
        if (k == 0 || k >= entries.size()) {
            std::sort(entries.begin(), entries.end(), by_count);
            return entries;
        }
        std::partial_sort(entries.begin(), entries.begin() + k, entries.end(), by_count);
        entries.resize(k);
        return entries;
    }

    hasher hash_function() const { return m_counts.hash_function(); }

    key_equal key_eq() const { return m_counts.key_eq(); }

    // --- Iteration ---

    const_iterator begin() const { return m_counts.begin(); }
    const_iterator end() const { return m_counts.end(); }
    const_iterator cbegin() const { return m_counts.cbegin(); }
    const_iterator cend() const { return m_counts.cend(); }

    KeysView keys() const { return KeysView(m_counts); }

    NonZeroKeysView iter_non_zero() const { return NonZeroKeysView(m_counts); }

    // Hands the key/count storage to the caller and leaves this distribution
    // empty.
    map_type into_counts() && {
        map_type out = std::move(m_counts);
        m_counts.clear();
        m_total = 0;
        return out;
    }

    friend bool operator==(const FrequencyDistribution &a, const FrequencyDistribution &b) { return a.m_total == b.m_total && a.m_counts == b.m_counts; }

    friend bool operator!=(const FrequencyDistribution &a, const FrequencyDistribution &b) { return !(a == b); }

  private:
    template <typename KeyArg> void _insert_or_increment_by(KeyArg &&key, quantity_type increment) {
        auto [it, inserted] = m_counts.try_emplace(std::forward<KeyArg>(key), increment);
        if (!inserted) it->second += increment;
        m_total += increment;
    }

    template <typename InputIt> static size_type _size_hint(InputIt first, InputIt last) {
        using category = typename std::iterator_traits<InputIt>::iterator_category;
        if constexpr (std::is_base_of_v<std::forward_iterator_tag, category>) {
            return static_cast<size_type>(std::distance(first, last));
        } else {
            return 0;
        }
    }

    map_type m_counts;
    quantity_type m_total = 0;
};
