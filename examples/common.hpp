#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

// JSON Library
#include <nlohmann/json.hpp>

#include "frequency_distribution/frequency_distribution.hpp"

using json = nlohmann::json;

// Timer class to measure execution time
class Timer {
  public:
    void start() { m_start = std::chrono::high_resolution_clock::now(); }
    double stop_s() const {
        auto end = std::chrono::high_resolution_clock::now();
        return std::chrono::duration<double>(end - m_start).count();
    }

  private:
    std::chrono::time_point<std::chrono::high_resolution_clock> m_start;
};

// Tokenization
std::vector<std::string> tokenize(const std::string &line, bool lowercase);
std::vector<std::string> read_tokens_from_file(const std::string &path, uint64_t max_tokens, bool lowercase);
std::vector<std::string> split_list(const std::string &csv, char sep = ',');

// Data generation
std::vector<uint64_t> generate_zipf_data(uint64_t size, uint64_t diversity, double a, uint64_t seed);
std::vector<std::string> generate_zipf_tokens(uint64_t size, uint64_t diversity, double a, uint64_t seed);

// Output helpers
void create_directory(const std::string &path);
std::string timestamped_filename(const std::string &path);
std::string utc_timestamp();

// Number of items a window of num_items starting at start can take from
// available items. num_items == 0 means everything from start on.
inline uint64_t items_in_window(uint64_t available, uint64_t start, uint64_t num_items) {
    if (start >= available) return 0;
    uint64_t remaining = available - start;
    return num_items == 0 ? remaining : std::min(num_items, remaining);
}

// Ingests tokens one insert at a time and returns the elapsed seconds.
template <typename K, typename Hash, typename KeyEqual> double ingest(FrequencyDistribution<K, Hash, KeyEqual> &fdist, const std::vector<K> &tokens, uint64_t start, uint64_t count) {
    uint64_t end = start + (count == 0 ? 0 : items_in_window(tokens.size(), start, count));
    Timer timer;
    timer.start();
    for (uint64_t i = start; i < end; ++i) fdist.insert(tokens[i]);
    return timer.stop_s();
}

template <typename K> json entries_to_json(const std::vector<std::pair<K, size_t>> &entries) {
    json out = json::array();
    for (const auto &[key, count] : entries) out.push_back({{"key", key}, {"count", count}});
    return out;
}

template <typename K>
void print_top_k(const std::string &title, const std::vector<std::pair<K, size_t>> &entries, size_t sum_counts) {
    std::cout << "\n--- " << title << " ---\n\n";
    std::cout << "+------+--------------------------+--------------+----------+" << std::endl;
    std::cout << "| Rank | Key                      |        Count |    Share |" << std::endl;
    std::cout << "+------+--------------------------+--------------+----------+" << std::endl;
    for (size_t i = 0; i < entries.size(); ++i) {
        double share = sum_counts > 0 ? 100.0 * static_cast<double>(entries[i].second) / static_cast<double>(sum_counts) : 0.0;
        std::cout << "| " << std::right << std::setw(4) << (i + 1) << " | " << std::left << std::setw(24) << entries[i].first << " | " << std::right << std::setw(12)
                  << entries[i].second << " | " << std::setw(7) << std::fixed << std::setprecision(2) << share << "% |" << std::endl;
    }
    std::cout << "+------+--------------------------+--------------+----------+" << std::endl;
}
