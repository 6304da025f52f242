#pragma once

#include <cstdint>
#include <iostream>
#include <string>
#include <tuple>

#include "utils/ConfigParser.hpp"
#include "utils/ConfigPrinter.hpp"

#include "common.hpp"

// Word count config
struct AppConfig {
    std::string dataset_type = "text";
    std::string input_path;
    uint64_t stream_size = 1000000;
    uint64_t stream_diversity = 10000;
    float zipf_param = 1.1f;
    uint64_t seed = 0;
    bool lowercase = true;
    uint32_t top_k = 20;
    std::string remove_keys;
    std::string output_file = "output/word_count.json";

    static void add_params_to_config_parser(AppConfig &config, ConfigParser &parser) {
        parser.AddParameter(new StringParameter("app.dataset_type", "text", &config.dataset_type, false, "Dataset type: text or zipf"));
        parser.AddParameter(new StringParameter("app.input", "", &config.input_path, false, "Path of the text file to count (text dataset)"));
        parser.AddParameter(new UnsignedInt64Parameter("app.stream_size", "1000000", &config.stream_size, false, "Tokens to read or generate (0 = whole file)"));
        parser.AddParameter(new UnsignedInt64Parameter("app.stream_diversity", "10000", &config.stream_diversity, false, "Distinct tokens in a zipf stream"));
        parser.AddParameter(new FloatParameter("app.zipf", "1.1", &config.zipf_param, false, "Zipfian param 'a'"));
        parser.AddParameter(new UnsignedInt64Parameter("app.seed", "0", &config.seed, false, "Generator seed (0 = random)"));
        parser.AddParameter(new BooleanParameter("app.lowercase", "true", &config.lowercase, false, "Lowercase tokens before counting"));
        parser.AddParameter(new UnsignedInt32Parameter("app.top_k", "20", &config.top_k, false, "Number of most common tokens to report"));
        parser.AddParameter(new StringParameter("app.remove", "", &config.remove_keys, false, "Comma-separated tokens to remove after counting"));
        parser.AddParameter(new StringParameter("app.output_file", "output/word_count.json", &config.output_file, false, "Output JSON file path"));
    }

    auto to_tuple() const {
        return std::make_tuple("dataset_type", dataset_type, "input", input_path, "stream_size", stream_size, "stream_diversity", stream_diversity, "zipf_param", zipf_param,
                               "seed", seed, "lowercase", lowercase, "top_k", top_k, "remove", remove_keys, "output_file", output_file);
    }

    json to_json() const {
        return {{"dataset_type", dataset_type}, {"input", input_path}, {"stream_size", stream_size}, {"stream_diversity", stream_diversity}, {"zipf_param", zipf_param},
                {"seed", seed}, {"lowercase", lowercase}, {"top_k", top_k}, {"remove", remove_keys}, {"output_file", output_file}};
    }

    friend std::ostream &operator<<(std::ostream &os, const AppConfig &config) {
        ConfigPrinter<AppConfig>::print(os, "Word Count Configuration", config);
        return os;
    }
};
