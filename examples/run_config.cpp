#include "run_config.hpp"

#include <set>
#include <stdexcept>

namespace {

const std::set<std::string> kKnownOps = {"ingest", "insert", "extend", "remove", "clear", "report"};

DatasetConfig parse_dataset(const std::string &name, const YAML::Node &ds) {
    DatasetConfig dataset;
    dataset.name = name;
    dataset.dataset_type = ds["dataset_type"].as<std::string>();
    dataset.stream_size = ds["stream_size"] ? ds["stream_size"].as<uint64_t>() : 0;
    dataset.seed = ds["seed"] ? ds["seed"].as<uint64_t>() : 0;

    if (dataset.dataset_type == "text") {
        dataset.path = ds["path"].as<std::string>();
        dataset.lowercase = ds["lowercase"] ? ds["lowercase"].as<bool>() : true;
    } else if (dataset.dataset_type == "zipf") {
        dataset.stream_diversity = ds["stream_diversity"].as<uint64_t>();
        dataset.zipf_param = ds["zipf_param"] ? ds["zipf_param"].as<double>() : 1.1;
    } else {
        throw std::invalid_argument("Dataset '" + name + "' has unknown dataset_type '" + dataset.dataset_type + "'");
    }
    return dataset;
}

StepConfig parse_step(const YAML::Node &node, const std::map<std::string, DatasetConfig> &datasets) {
    StepConfig step;
    step.op = node["op"].as<std::string>();
    if (!kKnownOps.count(step.op)) throw std::invalid_argument("Unknown step op '" + step.op + "'");

    if (step.op == "ingest") {
        step.dataset = node["dataset"].as<std::string>();
        if (!datasets.count(step.dataset)) throw std::invalid_argument("Step references unknown dataset '" + step.dataset + "'");
        step.num_items = node["num_items"] ? node["num_items"].as<uint64_t>() : 0;
        step.start_offset = node["start_offset"] ? node["start_offset"].as<uint64_t>() : 0;
    } else if (step.op == "insert" || step.op == "remove") {
        for (const auto &key : node["keys"]) { step.keys.push_back(key.as<std::string>()); }
    } else if (step.op == "extend") {
        // A sequence keeps repeated keys, a map cannot.
        const YAML::Node pairs = node["pairs"];
        if (pairs.IsSequence()) {
            for (const auto &p : pairs) { step.pairs.emplace_back(p[0].as<std::string>(), p[1].as<uint64_t>()); }
        } else {
            for (auto it = pairs.begin(); it != pairs.end(); ++it) { step.pairs.emplace_back(it->first.as<std::string>(), it->second.as<uint64_t>()); }
        }
    } else if (step.op == "report") {
        step.label = node["label"] ? node["label"].as<std::string>() : "";
        step.top_k = node["top_k"] ? node["top_k"].as<uint32_t>() : 10;
    }
    return step;
}

}   // namespace

RunConfig parse_run_config(const YAML::Node &root) {
    RunConfig config;

    // Parse metadata
    auto metadata = root["metadata"];
    config.name = metadata["name"].as<std::string>();
    config.output_file = metadata["output_file"] ? metadata["output_file"].as<std::string>() : "output/run_results.json";
    config.repetitions = metadata["repetitions"] ? metadata["repetitions"].as<uint32_t>() : 1;

    // Parse datasets
    auto datasets_node = root["datasets"];
    for (auto it = datasets_node.begin(); it != datasets_node.end(); ++it) {
        std::string dataset_name = it->first.as<std::string>();
        config.datasets[dataset_name] = parse_dataset(dataset_name, it->second);
    }

    // Parse distribution configuration
    if (auto dist = root["distribution"]) {
        config.distribution.capacity = dist["capacity"] ? dist["capacity"].as<uint64_t>() : 0;
        config.distribution.hash_seed = dist["hash_seed"] ? dist["hash_seed"].as<uint64_t>() : 0;
    }

    // Parse steps
    for (const auto &node : root["steps"]) { config.steps.push_back(parse_step(node, config.datasets)); }

    return config;
}

RunConfig load_run_config(const std::string &yaml_file) { return parse_run_config(YAML::LoadFile(yaml_file)); }
