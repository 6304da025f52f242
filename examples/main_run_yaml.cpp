#include <fstream>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "yaml-cpp/yaml.h"

// Distribution Headers
#include "frequency_distribution/frequency_distribution.hpp"
#include "frequency_distribution/frequency_distribution_config.hpp"

// Common utilities
#include "common.hpp"
#include "run_config.hpp"

using namespace std;

struct Checkpoint {
    string label;
    size_t step_index;
    uint64_t len;
    uint64_t sum_counts;
    uint64_t non_zero_keys;
    double elapsed_s;
    vector<pair<string, size_t>> most_common;
};

struct RepetitionResult {
    uint32_t repetition_id;
    double ingest_time_s = 0.0;
    uint64_t items_ingested = 0;
    vector<Checkpoint> checkpoints;
};

vector<string> load_dataset(const DatasetConfig &dataset) {
    if (dataset.dataset_type == "zipf") { return generate_zipf_tokens(dataset.stream_size, dataset.stream_diversity, dataset.zipf_param, dataset.seed); }
    return read_tokens_from_file(dataset.path, dataset.stream_size, dataset.lowercase);
}

RepetitionResult run_steps(const RunConfig &config, map<string, vector<string>> &data_cache, uint32_t rep) {
    RepetitionResult result;
    result.repetition_id = rep;

    auto fdist = config.distribution.make<string>();
    Timer run_timer;
    run_timer.start();

    for (size_t i = 0; i < config.steps.size(); ++i) {
        const StepConfig &step = config.steps[i];

        if (step.op == "ingest") {
            auto cached = data_cache.find(step.dataset);
            if (cached == data_cache.end()) { cached = data_cache.emplace(step.dataset, load_dataset(config.datasets.at(step.dataset))).first; }
            const vector<string> &tokens = cached->second;
            uint64_t count = items_in_window(tokens.size(), step.start_offset, step.num_items);
            if (count < step.num_items || step.start_offset > tokens.size()) { cerr << "Warning: dataset '" << step.dataset << "' has fewer items than requested. Ingesting what is available." << endl; }

            uint64_t before = fdist.sum_counts();
            result.ingest_time_s += ingest(fdist, tokens, step.start_offset, count);
            result.items_ingested += fdist.sum_counts() - before;
            cout << "  [" << i << "] ingest " << step.dataset << ": " << (fdist.sum_counts() - before) << " tokens" << endl;
        } else if (step.op == "insert") {
            for (const auto &key : step.keys) fdist.insert(key);
            cout << "  [" << i << "] insert " << step.keys.size() << " keys" << endl;
        } else if (step.op == "extend") {
            fdist.extend(step.pairs);
            cout << "  [" << i << "] extend " << step.pairs.size() << " pairs" << endl;
        } else if (step.op == "remove") {
            for (const auto &key : step.keys) fdist.remove(key);
            cout << "  [" << i << "] remove " << step.keys.size() << " keys" << endl;
        } else if (step.op == "clear") {
            fdist.clear();
            cout << "  [" << i << "] clear" << endl;
        } else if (step.op == "report") {
            Checkpoint cp;
            cp.label = step.label.empty() ? "step_" + to_string(i) : step.label;
            cp.step_index = i;
            cp.len = fdist.len();
            cp.sum_counts = fdist.sum_counts();
            auto non_zero = fdist.iter_non_zero();
            cp.non_zero_keys = static_cast<uint64_t>(std::distance(non_zero.begin(), non_zero.end()));
            cp.elapsed_s = run_timer.stop_s();
            cp.most_common = fdist.most_common(step.top_k);

            cout << "  [" << i << "] report " << cp.label << ": len=" << cp.len << " sum_counts=" << cp.sum_counts << " non_zero=" << cp.non_zero_keys << endl;
            print_top_k(cp.label, cp.most_common, cp.sum_counts);
            result.checkpoints.push_back(cp);
        } else {
            throw invalid_argument("Unknown step op '" + step.op + "'");
        }
    }

    return result;
}

void export_to_json(const string &filename, const RunConfig &config, const vector<RepetitionResult> &results) {
    create_directory(filename);

    json j;
    j["metadata"] = {{"experiment_type", "scripted_run"}, {"name", config.name}, {"timestamp", utc_timestamp()}};
    j["config"]["distribution"] = {{"capacity", config.distribution.capacity}, {"hash_seed", config.distribution.hash_seed}};
    j["config"]["datasets"] = json::object();
    for (const auto &[name, ds] : config.datasets) {
        j["config"]["datasets"][name] = {{"dataset_type", ds.dataset_type}, {"stream_size", ds.stream_size}, {"stream_diversity", ds.stream_diversity}, {"zipf_param", ds.zipf_param}};
    }

    j["results"] = json::array();
    for (const auto &r : results) {
        double throughput = r.ingest_time_s > 0 ? r.items_ingested / r.ingest_time_s / 1e6 : 0;
        json rep_json = {{"repetition_id", r.repetition_id}, {"items_ingested", r.items_ingested}, {"ingest_time_s", r.ingest_time_s}, {"throughput_mops", throughput}};
        rep_json["checkpoints"] = json::array();
        for (const auto &cp : r.checkpoints) {
            rep_json["checkpoints"].push_back({{"label", cp.label},
                                               {"step", cp.step_index},
                                               {"len", cp.len},
                                               {"sum_counts", cp.sum_counts},
                                               {"non_zero_keys", cp.non_zero_keys},
                                               {"elapsed_s", cp.elapsed_s},
                                               {"most_common", entries_to_json(cp.most_common)}});
        }
        j["results"].push_back(rep_json);
    }

    ofstream out(filename);
    if (!out.is_open()) {
        cerr << "Error: Cannot open output file: " << filename << endl;
        return;
    }

    out << j.dump(2);
    out.close();

    cout << "\nResults exported to: " << filename << endl;
}

void run_scripted(const RunConfig &config) {
    cout << "\n=== Run: " << config.name << " ===" << endl;
    cout << config.distribution;

    map<string, vector<string>> data_cache;
    vector<RepetitionResult> all_results;
    for (uint32_t rep = 0; rep < config.repetitions; ++rep) {
        cout << "\n=== Repetition " << (rep + 1) << "/" << config.repetitions << " ===" << endl;
        all_results.push_back(run_steps(config, data_cache, rep));
    }

    export_to_json(timestamped_filename(config.output_file), config, all_results);
}

int main(int argc, char **argv) {
    if (argc < 2) {
        cerr << "Usage: " << argv[0] << " <yaml_file>" << endl;
        return 1;
    }

    string yaml_file = argv[1];

    try {
        RunConfig config = load_run_config(yaml_file);
        run_scripted(config);
    } catch (const YAML::Exception &e) {
        cerr << "YAML parsing error: " << e.what() << endl;
        return 1;
    } catch (const exception &e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    return 0;
}
