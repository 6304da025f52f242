#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstring>
#include <functional>
#include <iterator>
#include <set>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "frequency_distribution/distribution.hpp"
#include "frequency_distribution/frequency_distribution.hpp"

using StringDist = FrequencyDistribution<std::string>;

namespace {

template <typename Dist> size_t sum_of_gets(const Dist &fdist) {
    size_t sum = 0;
    for (const auto &key : fdist.keys()) sum += fdist.get(key);
    return sum;
}

std::set<std::string> non_zero_keys(const StringDist &fdist) {
    std::set<std::string> out;
    for (const auto &key : fdist.iter_non_zero()) out.insert(key);
    return out;
}

// Single-pass iterator, gives no size hint.
class PairReader {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = std::pair<std::string, size_t>;
    using difference_type = std::ptrdiff_t;
    using pointer = const value_type *;
    using reference = const value_type &;

    PairReader() = default;
    explicit PairReader(std::istream &in) : m_in(&in) { ++*this; }

    reference operator*() const { return m_current; }
    PairReader &operator++() {
        if (!(*m_in >> m_current.first >> m_current.second)) m_in = nullptr;
        return *this;
    }
    friend bool operator==(const PairReader &a, const PairReader &b) { return a.m_in == b.m_in; }
    friend bool operator!=(const PairReader &a, const PairReader &b) { return a.m_in != b.m_in; }

  private:
    std::istream *m_in = nullptr;
    value_type m_current;
};

}   // namespace

TEST_CASE("new distribution is empty") {
    StringDist fdist;
    CHECK(fdist.len() == 0);
    CHECK(fdist.empty());
    CHECK(fdist.sum_counts() == 0);
    CHECK(fdist.get("anything") == 0);
    CHECK(fdist.begin() == fdist.end());
}

TEST_CASE("with_capacity does not change observable behavior") {
    auto sized = StringDist::with_capacity(1024);
    StringDist plain;
    CHECK(sized.len() == 0);
    CHECK(sized.sum_counts() == 0);

    for (const char *w : {"x", "y", "x", "z", "x"}) {
        sized.insert(w);
        plain.insert(w);
    }
    CHECK(sized == plain);
    CHECK(sized.get("x") == 3);
}

TEST_CASE("insert counts repeated keys") {
    StringDist fdist;
    fdist.insert("hello");
    fdist.insert("hello");
    fdist.insert("goodbye");

    CHECK(fdist.get("hello") == 2);
    CHECK(fdist.get("goodbye") == 1);
    CHECK(fdist.sum_counts() == 3);
    CHECK(fdist.len() == 2);
}

TEST_CASE("insert accumulates over many observations") {
    std::vector<std::string> words = {"alpha", "beta"};
    StringDist fdist;

    fdist.insert(words[0]);
    CHECK(fdist.get(words[0]) == 1);

    fdist.insert(words[1]);
    CHECK(fdist.get(words[1]) == 1);

    for (int i = 0; i < 7; ++i) fdist.insert(words[0]);
    CHECK(fdist.get(words[0]) == 8);
    CHECK(fdist.sum_counts() == 9);
}

TEST_CASE("keys never inserted report zero") {
    StringDist fdist{{"a", 3}, {"b", 4}};
    CHECK(fdist.get("c") == 0);
    CHECK(fdist.get("") == 0);
    CHECK_FALSE(fdist.contains("c"));
    CHECK(fdist.len() == 2);
}

TEST_CASE("from_iter builds counts and non-zero iteration skips zero entries") {
    std::vector<std::pair<std::string, size_t>> words = {{"a", 50}, {"b", 100}, {"c", 75}, {"d", 0}};
    auto fdist = StringDist::from_iter(words);

    CHECK(fdist.get("a") == 50);
    CHECK(fdist.get("b") == 100);
    CHECK(fdist.get("c") == 75);
    CHECK(fdist.get("d") == 0);
    CHECK(fdist.sum_counts() == 225);

    // the zero-count entry is stored but not yielded
    CHECK(fdist.len() == 4);
    CHECK(fdist.contains("d"));
    CHECK(non_zero_keys(fdist) == std::set<std::string>{"a", "b", "c"});

    auto view = fdist.iter_non_zero();
    CHECK(std::distance(view.begin(), view.end()) == 3);
}

TEST_CASE("remove subtracts the key's count and is idempotent") {
    auto fdist = StringDist::from_iter(std::vector<std::pair<std::string, size_t>>{{"a", 50}, {"b", 100}, {"c", 75}, {"d", 0}});

    fdist.remove("a");
    CHECK(fdist.get("a") == 0);
    CHECK_FALSE(fdist.contains("a"));
    CHECK(fdist.sum_counts() == 175);
    CHECK(fdist.len() == 3);

    fdist.remove("a");
    CHECK(fdist.sum_counts() == 175);
    CHECK(fdist.len() == 3);

    fdist.remove("never-seen");
    CHECK(fdist.sum_counts() == 175);
}

TEST_CASE("remove after from_iter without zero entries") {
    auto fdist = StringDist::from_iter(std::vector<std::pair<std::string, size_t>>{{"a", 50}, {"b", 100}, {"c", 25}});
    CHECK(fdist.contains("a"));

    fdist.remove("a");
    CHECK_FALSE(fdist.contains("a"));
    CHECK(fdist.sum_counts() == 125);
}

TEST_CASE("sum_counts tracks from_iter and insert") {
    auto fdist = StringDist::from_iter(std::vector<std::pair<std::string, size_t>>{{"a", 7}, {"b", 5}, {"c", 8}, {"d", 3}});
    CHECK(fdist.sum_counts() == 23);

    fdist.insert("e");
    CHECK(fdist.sum_counts() == 24);
    CHECK(fdist.get("e") == 1);
}

TEST_CASE("clear empties storage and resets the total") {
    StringDist fdist{{"a", 7}, {"b", 5}, {"c", 8}};
    fdist.insert("a");
    REQUIRE(fdist.sum_counts() == 21);

    fdist.clear();
    CHECK(fdist.len() == 0);
    CHECK(fdist.sum_counts() == 0);
    CHECK(fdist.get("a") == 0);
    CHECK(fdist.get("b") == 0);
    CHECK(fdist.get("c") == 0);

    fdist.insert("a");
    CHECK(fdist.sum_counts() == 1);
    CHECK(fdist.sum_counts() == sum_of_gets(fdist));
}

TEST_CASE("extend accumulates repeated keys instead of overwriting") {
    StringDist fdist;
    fdist.insert("a");
    fdist.extend({{"a", 4}, {"b", 2}, {"a", 10}});

    CHECK(fdist.get("a") == 15);
    CHECK(fdist.get("b") == 2);
    CHECK(fdist.sum_counts() == 17);
}

TEST_CASE("extend with distinct keys reads back each count") {
    std::vector<std::pair<std::string, size_t>> pairs = {{"k1", 3}, {"k2", 11}, {"k3", 1}};
    StringDist fdist;
    fdist.extend(pairs.begin(), pairs.end());

    for (const auto &[key, count] : pairs) CHECK(fdist.get(key) == count);
    CHECK(fdist.sum_counts() == 15);
}

TEST_CASE("from_iter accepts single-pass iterators") {
    std::istringstream in("apples 3 oranges 4 bannana 7 apples 1");
    auto fdist = StringDist::from_iter(PairReader(in), PairReader());

    CHECK(fdist.get("apples") == 4);
    CHECK(fdist.get("oranges") == 4);
    CHECK(fdist.get("bannana") == 7);
    CHECK(fdist.sum_counts() == 15);
}

TEST_CASE("from_iter converts key and count types") {
    std::vector<std::pair<const char *, int>> pairs = {{"x", 2}, {"y", 3}};
    auto fdist = StringDist::from_iter(pairs);
    CHECK(fdist.get("x") == 2);
    CHECK(fdist.get("y") == 3);
    CHECK(fdist.sum_counts() == 5);
}

TEST_CASE("sum invariant holds over a mixed operation sequence") {
    StringDist fdist;
    std::vector<std::string> stream = {"to", "be", "or", "not", "to", "be", "that", "is", "the", "question"};
    for (const auto &w : stream) fdist.insert(w);
    CHECK(fdist.sum_counts() == stream.size());
    CHECK(fdist.sum_counts() == sum_of_gets(fdist));

    fdist.remove("to");
    CHECK(fdist.sum_counts() == stream.size() - 2);
    CHECK(fdist.sum_counts() == sum_of_gets(fdist));

    fdist.extend({{"be", 5}, {"zero", 0}});
    CHECK(fdist.sum_counts() == sum_of_gets(fdist));

    fdist.remove("zero");
    fdist.remove("missing");
    CHECK(fdist.sum_counts() == sum_of_gets(fdist));
    CHECK(fdist.get("be") == 7);
}

TEST_CASE("iteration visits every stored entry once") {
    StringDist fdist{{"a", 1}, {"b", 2}, {"c", 0}};
    std::set<std::string> seen;
    size_t total = 0;
    for (const auto &[key, count] : fdist) {
        CHECK(seen.insert(key).second);
        total += count;
    }
    CHECK(seen == std::set<std::string>{"a", "b", "c"});
    CHECK(total == fdist.sum_counts());
    CHECK(fdist.keys().size() == 3);
}

TEST_CASE("into_counts moves the storage out and leaves the distribution empty") {
    StringDist fdist{{"a", 2}, {"b", 5}};
    auto counts = std::move(fdist).into_counts();

    CHECK(counts.size() == 2);
    CHECK(counts.at("a") == 2);
    CHECK(counts.at("b") == 5);
    CHECK(fdist.len() == 0);
    CHECK(fdist.sum_counts() == 0);
}

TEST_CASE("merge adds counts and totals") {
    StringDist a{{"x", 1}, {"y", 2}};
    StringDist b{{"y", 3}, {"z", 4}};
    a.merge(b);

    CHECK(a.get("x") == 1);
    CHECK(a.get("y") == 5);
    CHECK(a.get("z") == 4);
    CHECK(a.sum_counts() == 10);
    CHECK(b.sum_counts() == 7);

    a.merge(a);
    CHECK(a.get("y") == 10);
    CHECK(a.sum_counts() == 20);
}

TEST_CASE("most_common orders by descending count") {
    StringDist fdist{{"low", 1}, {"high", 9}, {"mid", 5}, {"zero", 0}};

    auto top2 = fdist.most_common(2);
    REQUIRE(top2.size() == 2);
    CHECK(top2[0] == std::make_pair(std::string("high"), size_t(9)));
    CHECK(top2[1] == std::make_pair(std::string("mid"), size_t(5)));

    auto all = fdist.most_common();
    REQUIRE(all.size() == 4);
    CHECK(all.front().first == "high");
    CHECK(all.back().first == "zero");

    CHECK(fdist.most_common(100).size() == 4);
}

TEST_CASE("copies are independent") {
    StringDist original{{"a", 1}};
    StringDist copy = original;
    copy.insert("a");
    copy.insert("b");

    CHECK(original.get("a") == 1);
    CHECK(original.sum_counts() == 1);
    CHECK(copy.get("a") == 2);
    CHECK(copy.sum_counts() == 3);
    CHECK(original != copy);
}

TEST_CASE("pluggable hasher") {
    SUBCASE("seeded xxhash") {
        auto fdist = StringDist::with_hasher(XXHasher<std::string>(1234));
        CHECK(fdist.hash_function().seed() == 1234);
        fdist.insert("hello");
        fdist.insert("hello");
        CHECK(fdist.get("hello") == 2);
    }
    SUBCASE("std::hash") {
        auto fdist = FrequencyDistribution<std::string, std::hash<std::string>>::with_capacity_and_hasher(16, std::hash<std::string>());
        fdist.extend({{"a", 50}, {"b", 100}});
        CHECK(fdist.get("a") == 50);
        CHECK(fdist.sum_counts() == 150);
    }
    SUBCASE("integer keys") {
        FrequencyDistribution<int> fdist;
        for (int v : {1, 2, 2, 3, 3, 3}) fdist.insert(v);
        CHECK(fdist.get(3) == 3);
        CHECK(fdist.get(4) == 0);
        CHECK(fdist.sum_counts() == 6);
    }
    SUBCASE("C string keys compared by content") {
        FrequencyDistribution<const char *, XXHasher<const char *>, CStringEqual> fdist;
        std::string first = "token";
        std::string second = "token";
        fdist.insert(first.c_str());
        fdist.insert(second.c_str());
        CHECK(fdist.len() == 1);
        CHECK(fdist.get("token") == 2);
    }
}

TEST_CASE("C string keys count by content with default parameters") {
    static_assert(std::is_same_v<FrequencyDistribution<const char *>::key_equal, CStringEqual>);

    FrequencyDistribution<const char *> fdist;
    std::string first = "hello";
    std::string second = "hello";
    fdist.insert(first.c_str());
    fdist.insert(second.c_str());
    CHECK(fdist.len() == 1);
    CHECK(fdist.get("hello") == 2);
    CHECK(fdist.sum_counts() == 2);

    fdist.remove("hello");
    CHECK(fdist.empty());
    CHECK(fdist.sum_counts() == 0);
}

TEST_CASE("long double keys ignore padding bytes") {
    long double a;
    long double b;
    std::memset(&a, 0xAA, sizeof(a));
    std::memset(&b, 0x55, sizeof(b));
    long double one = 1.0L;
    std::memcpy(&a, &one, xx_hasher_detail::value_size<long double>());
    std::memcpy(&b, &one, xx_hasher_detail::value_size<long double>());
    REQUIRE(a == b);

    FrequencyDistribution<long double> fdist;
    fdist.insert(a);
    fdist.insert(b);
    CHECK(fdist.len() == 1);
    CHECK(fdist.get(1.0L) == 2);
}

TEST_CASE("capacity hints and view accessors") {
    StringDist fdist;
    fdist.reserve(128);
    CHECK(fdist.empty());
    CHECK(fdist.len() == 0);
    fdist.extend({{"a", 2}, {"b", 0}, {"c", 1}});
    fdist.reserve(1);
    CHECK(fdist.len() == 3);
    CHECK(fdist.sum_counts() == 3);
    CHECK(fdist.get("a") == 2);

    // size_hint is an upper bound that still counts the zero entry
    auto view = fdist.iter_non_zero();
    CHECK(view.size_hint() == 3);
    CHECK(std::distance(view.begin(), view.end()) == 2);

    CHECK(std::distance(fdist.cbegin(), fdist.cend()) == 3);
    CHECK(fdist.key_eq()("a", "a"));
    CHECK_FALSE(fdist.key_eq()("a", "b"));
}

TEST_CASE("usable through the Distribution interface") {
    StringDist fdist;
    Distribution<std::string> &dist = fdist;

    dist.insert("a");
    dist.insert("a");
    dist.insert("b");
    CHECK(dist.len() == 2);
    CHECK(dist.get("a") == 2);

    dist.remove("a");
    CHECK(dist.get("a") == 0);
    CHECK(fdist.sum_counts() == 1);

    dist.clear();
    CHECK(dist.len() == 0);
    CHECK(fdist.sum_counts() == 0);
}
