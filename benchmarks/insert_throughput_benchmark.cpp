/**
 * Insert / lookup throughput of FrequencyDistribution
 * Compares the xxHash default against std::hash, with and without a capacity hint.
 * Test:  ./build/bin/insert_throughput_benchmark --items 1000000 --diversity 100000 --trials 5
 */

#include "frequency_distribution/frequency_distribution.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using json = nlohmann::json;

struct ThroughputResult
{
    double insert_mops;
    double lookup_mops;
    size_t len;
    size_t sum_counts;
};

std::vector<uint64_t> make_uniform_keys(uint64_t num_items, uint64_t diversity, uint64_t seed)
{
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<uint64_t> dist(0, diversity == 0 ? 0 : diversity - 1);
    std::vector<uint64_t> keys;
    keys.reserve(num_items);
    for (uint64_t i = 0; i < num_items; ++i) { keys.push_back(dist(rng)); }
    return keys;
}

std::vector<std::string> to_string_keys(const std::vector<uint64_t> &keys)
{
    std::vector<std::string> out;
    out.reserve(keys.size());
    for (uint64_t k : keys) { out.push_back("token_" + std::to_string(k)); }
    return out;
}

template <typename Dist, typename Key> ThroughputResult measure(Dist fdist, const std::vector<Key> &keys)
{
    auto start = std::chrono::high_resolution_clock::now();
    for (const auto &k : keys) fdist.insert(k);
    double insert_s = std::chrono::duration<double>(std::chrono::high_resolution_clock::now() - start).count();

    size_t checksum = 0;
    start = std::chrono::high_resolution_clock::now();
    for (const auto &k : keys) checksum += fdist.get(k);
    double lookup_s = std::chrono::duration<double>(std::chrono::high_resolution_clock::now() - start).count();

    if (checksum < fdist.sum_counts()) std::cerr << "Warning: lookup checksum below sum_counts" << std::endl;

    return {keys.size() / insert_s / 1e6, keys.size() / lookup_s / 1e6, fdist.len(), fdist.sum_counts()};
}

double median(std::vector<double> values)
{
    if (values.empty()) return 0.0;
    std::sort(values.begin(), values.end());
    return values[values.size() / 2];
}

int main(int argc, char *argv[])
{
    std::cout << "FrequencyDistribution Throughput Benchmark\n" << std::string(80, '=') << std::endl;

    uint64_t num_items = 1000000;
    uint64_t diversity = 100000;
    uint32_t num_trials = 5;
    uint64_t seed = 1;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--items" && i + 1 < argc) { num_items = std::stoull(argv[++i]); }
        else if (arg == "--diversity" && i + 1 < argc) { diversity = std::stoull(argv[++i]); }
        else if (arg == "--trials" && i + 1 < argc) { num_trials = std::stoul(argv[++i]); }
        else if (arg == "--seed" && i + 1 < argc) { seed = std::stoull(argv[++i]); }
        else if (arg == "--help")
        {
            std::cout << "Usage: " << argv[0] << " [options]\n"
                      << "Options:\n"
                      << "  --items N       Number of inserts per trial (default: 1000000)\n"
                      << "  --diversity N   Number of distinct keys (default: 100000)\n"
                      << "  --trials N      Number of trials (default: 5)\n"
                      << "  --seed N        Key generator seed (default: 1)\n";
            return 0;
        }
    }
    if (num_trials == 0) num_trials = 1;

    std::cout << "Config: items=" << num_items << ", diversity=" << diversity << ", trials=" << num_trials << "\n" << std::endl;

    auto int_keys = make_uniform_keys(num_items, diversity, seed);
    auto str_keys = to_string_keys(int_keys);

    using IntXX = FrequencyDistribution<uint64_t>;
    using IntStd = FrequencyDistribution<uint64_t, std::hash<uint64_t>>;
    using StrXX = FrequencyDistribution<std::string>;
    using StrStd = FrequencyDistribution<std::string, std::hash<std::string>>;

    struct Variant
    {
        std::string name;
        std::function<ThroughputResult()> run;
    };
    std::vector<Variant> variants = {
        {"u64/xxhash", [&] { return measure(IntXX(), int_keys); }},
        {"u64/xxhash+capacity", [&] { return measure(IntXX::with_capacity(diversity), int_keys); }},
        {"u64/std::hash", [&] { return measure(IntStd(), int_keys); }},
        {"u64/std::hash+capacity", [&] { return measure(IntStd::with_capacity(diversity), int_keys); }},
        {"string/xxhash", [&] { return measure(StrXX(), str_keys); }},
        {"string/xxhash+capacity", [&] { return measure(StrXX::with_capacity(diversity), str_keys); }},
        {"string/std::hash", [&] { return measure(StrStd(), str_keys); }},
        {"string/std::hash+capacity", [&] { return measure(StrStd::with_capacity(diversity), str_keys); }},
    };

    json results;
    results["config"] = {{"num_items", num_items}, {"diversity", diversity}, {"num_trials", num_trials}, {"seed", seed}};
    results["variants"] = json::array();

    std::cout << "+----------------------------+--------------+--------------+------------+" << std::endl;
    std::cout << "| Variant                    | Insert(Mops) | Lookup(Mops) |   Distinct |" << std::endl;
    std::cout << "+----------------------------+--------------+--------------+------------+" << std::endl;

    for (const auto &v : variants)
    {
        std::vector<double> inserts, lookups;
        size_t len = 0;
        for (uint32_t trial = 0; trial < num_trials; ++trial)
        {
            ThroughputResult r = v.run();
            inserts.push_back(r.insert_mops);
            lookups.push_back(r.lookup_mops);
            len = r.len;
        }
        double insert_med = median(inserts);
        double lookup_med = median(lookups);

        std::cout << "| " << std::left << std::setw(27) << v.name << "| " << std::right << std::setw(12) << std::fixed << std::setprecision(2) << insert_med << " | " << std::setw(12)
                  << lookup_med << " | " << std::setw(10) << len << " |" << std::endl;

        results["variants"].push_back({{"name", v.name}, {"median_insert_mops", insert_med}, {"median_lookup_mops", lookup_med}, {"len", len}, {"all_insert_mops", inserts}});
    }
    std::cout << "+----------------------------+--------------+--------------+------------+" << std::endl;

    std::ofstream out("output/insert_throughput_results.json");
    if (out)
    {
        out << results.dump(2);
        std::cout << "\nSaved: output/insert_throughput_results.json" << std::endl;
    }

    return 0;
}
