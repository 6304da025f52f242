#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "yaml-cpp/yaml.h"

#include "frequency_distribution/frequency_distribution_config.hpp"

// Dataset configuration
struct DatasetConfig {
    std::string name;
    std::string dataset_type;   // "text" or "zipf"
    std::string path;
    uint64_t stream_size = 0;
    uint64_t stream_diversity = 0;
    double zipf_param = 1.1;
    uint64_t seed = 0;
    bool lowercase = true;
};

// One scripted operation on the distribution
struct StepConfig {
    std::string op;   // ingest, insert, extend, remove, clear, report
    std::string dataset;
    uint64_t num_items = 0;
    uint64_t start_offset = 0;
    std::vector<std::string> keys;
    std::vector<std::pair<std::string, uint64_t>> pairs;
    std::string label;
    uint32_t top_k = 10;
};

struct RunConfig {
    std::string name;
    std::string output_file;
    uint32_t repetitions = 1;
    std::map<std::string, DatasetConfig> datasets;
    FrequencyDistributionConfig distribution;
    std::vector<StepConfig> steps;
};

// Throws YAML::Exception on malformed documents and std::invalid_argument on
// unknown operations or dataset references.
RunConfig parse_run_config(const YAML::Node &root);
RunConfig load_run_config(const std::string &yaml_file);
