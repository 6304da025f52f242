#include "common.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <sys/stat.h>

std::vector<std::string> tokenize(const std::string &line, bool lowercase)
{
    std::vector<std::string> tokens;
    std::string current;
    for (char ch : line)
    {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c == '\'')
        {
            current.push_back(lowercase ? static_cast<char>(std::tolower(c)) : ch);
        }
        else if (!current.empty())
        {
            tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) tokens.push_back(current);
    return tokens;
}

std::vector<std::string> read_tokens_from_file(const std::string &path, uint64_t max_tokens, bool lowercase)
{
    std::vector<std::string> tokens;
    std::ifstream file(path);
    if (!file.is_open())
    {
        std::cerr << "Error: Cannot open input file: " << path << std::endl;
        return tokens;
    }

    std::string line;
    while (std::getline(file, line) && (max_tokens == 0 || tokens.size() < max_tokens))
    {
        for (auto &token : tokenize(line, lowercase))
        {
            if (max_tokens != 0 && tokens.size() >= max_tokens) break;
            tokens.push_back(std::move(token));
        }
    }
    std::cout << "Read " << tokens.size() << " tokens from " << path << "." << std::endl;
    return tokens;
}

std::vector<std::string> split_list(const std::string &csv, char sep)
{
    std::vector<std::string> items;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, sep))
    {
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

std::vector<uint64_t> generate_zipf_data(uint64_t size, uint64_t diversity, double a, uint64_t seed)
{
    std::vector<uint64_t> data;
    if (diversity == 0) return data;

    std::vector<double> pdf(diversity);
    double sum = 0.0;
    for (uint64_t i = 1; i <= diversity; ++i)
    {
        pdf[i - 1] = 1.0 / std::pow(static_cast<double>(i), a);
        sum += pdf[i - 1];
    }
    for (uint64_t i = 0; i < diversity; ++i) { pdf[i] /= sum; }
    std::discrete_distribution<uint64_t> dist(pdf.begin(), pdf.end());
    std::mt19937_64 rng(seed == 0 ? std::random_device{}() : seed);
    data.reserve(size);
    for (uint64_t i = 0; i < size; ++i) { data.push_back(dist(rng)); }
    return data;
}

std::vector<std::string> generate_zipf_tokens(uint64_t size, uint64_t diversity, double a, uint64_t seed)
{
    auto ranks = generate_zipf_data(size, diversity, a, seed);
    std::vector<std::string> tokens;
    tokens.reserve(ranks.size());
    for (uint64_t r : ranks) { tokens.push_back("w" + std::to_string(r)); }
    return tokens;
}

void create_directory(const std::string &path)
{
    size_t pos = path.find_last_of('/');
    if (pos != std::string::npos && pos > 0)
    {
        std::string dir = path.substr(0, pos);
        mkdir(dir.c_str(), 0755);
    }
}

std::string timestamped_filename(const std::string &path)
{
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    std::ostringstream timestamp_stream;
    timestamp_stream << std::put_time(&tm_now, "%Y%m%d_%H%M%S");
    std::string timestamp = timestamp_stream.str();

    // Insert timestamp before file extension
    size_t slash = path.find_last_of('/');
    size_t ext_pos = path.find_last_of('.');
    if (ext_pos != std::string::npos && (slash == std::string::npos || ext_pos > slash)) { return path.substr(0, ext_pos) + "_" + timestamp + path.substr(ext_pos); }
    return path + "_" + timestamp;
}

std::string utc_timestamp()
{
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_now;
    gmtime_r(&now_time_t, &tm_now);
    std::ostringstream timestamp;
    timestamp << std::put_time(&tm_now, "%Y-%m-%dT%H:%M:%SZ");
    return timestamp.str();
}
