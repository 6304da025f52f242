#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

// Utils
#include "utils/ConfigParser.hpp"

// Distribution Headers
#include "frequency_distribution/frequency_distribution.hpp"
#include "frequency_distribution/frequency_distribution_config.hpp"

// Common utilities
#include "common.hpp"
#include "word_count_config.hpp"

using namespace std;

vector<string> load_tokens(const AppConfig &config) {
    if (config.dataset_type == "zipf") {
        cout << "Generating Zipf token stream..." << endl;
        return generate_zipf_tokens(config.stream_size, config.stream_diversity, config.zipf_param, config.seed);
    }
    if (config.input_path.empty()) {
        cerr << "Error: --app.input is required for the text dataset" << endl;
        return {};
    }
    return read_tokens_from_file(config.input_path, config.stream_size, config.lowercase);
}

void export_to_json(const string &filename, const AppConfig &config, const FrequencyDistributionConfig &fd_config, const json &results) {
    create_directory(filename);

    json j;
    j["metadata"] = {{"experiment_type", "word_count"}, {"timestamp", utc_timestamp()}};
    j["config"]["app"] = config.to_json();
    j["config"]["distribution"] = {{"capacity", fd_config.capacity}, {"hash_seed", fd_config.hash_seed}};
    j["results"] = results;

    ofstream out(filename);
    if (!out.is_open()) {
        cerr << "Error: Cannot open output file: " << filename << endl;
        return;
    }

    out << j.dump(2);
    out.close();

    cout << "\nResults exported to: " << filename << endl;
}

void run_word_count(const AppConfig &config, const FrequencyDistributionConfig &fd_config) {
    cout << config;
    cout << fd_config;

    vector<string> tokens = load_tokens(config);
    if (tokens.empty()) {
        cerr << "Warning: no tokens to count." << endl;
    }

    auto fdist = fd_config.make<string>();
    double duration = ingest(fdist, tokens, 0, tokens.size());
    double throughput = (duration > 0) ? (tokens.size() / duration / 1e6) : 0;

    cout << "\nCounted " << fdist.sum_counts() << " tokens, " << fdist.len() << " distinct, in " << fixed << setprecision(3) << duration << " s (" << setprecision(2) << throughput
         << " Mops)" << endl;

    auto top = fdist.most_common(config.top_k);
    print_top_k("MOST COMMON TOKENS", top, fdist.sum_counts());

    json results;
    results["ingest"] = {{"tokens", tokens.size()}, {"len", fdist.len()}, {"sum_counts", fdist.sum_counts()}, {"time_s", duration}, {"throughput_mops", throughput}};
    results["most_common"] = entries_to_json(top);

    json removed = json::array();
    for (const auto &key : split_list(config.remove_keys)) {
        size_t count = fdist.get(key);
        fdist.remove(key);
        cout << "Removed '" << key << "' (" << count << " occurrences), sum_counts now " << fdist.sum_counts() << endl;
        removed.push_back({{"key", key}, {"count", count}, {"sum_counts_after", fdist.sum_counts()}});
    }
    results["removed"] = removed;
    results["final"] = {{"len", fdist.len()}, {"sum_counts", fdist.sum_counts()}};

    export_to_json(timestamped_filename(config.output_file), config, fd_config, results);
}

int main(int argc, char **argv) {
    ConfigParser parser;
    AppConfig app_config;
    FrequencyDistributionConfig fd_config;

    AppConfig::add_params_to_config_parser(app_config, parser);
    FrequencyDistributionConfig::add_params_to_config_parser(fd_config, parser);

    if (argc > 1 && (string(argv[1]) == "--help" || string(argv[1]) == "-h")) {
        parser.PrintUsage();
        return 0;
    }
    if (argc > 1 && (string(argv[1]) == "--generate-doc")) {
        parser.PrintMarkdown();
        return 0;
    }

    Status s = parser.ParseCommandLine(argc, argv);
    if (!s.IsOK()) {
        fprintf(stderr, "%s\n", s.ToString().c_str());
        return -1;
    }

    if (app_config.dataset_type != "text" && app_config.dataset_type != "zipf") {
        fprintf(stderr, "Unknown dataset type: %s\n", app_config.dataset_type.c_str());
        return -1;
    }

    run_word_count(app_config, fd_config);

    return 0;
}
