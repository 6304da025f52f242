#pragma once

#include "utils/ConfigParser.hpp"
#include "utils/ConfigPrinter.hpp"

#include <cstdint>
#include <string>
#include <tuple>

#include "frequency_distribution.hpp"

struct FrequencyDistributionConfig
{
    uint64_t capacity = 0;
    uint64_t hash_seed = 0;

    static void add_params_to_config_parser(FrequencyDistributionConfig &c, ConfigParser &p)
    {
        p.AddParameter(new UnsignedInt64Parameter("fdist.capacity", "0", &c.capacity, false, "Expected number of distinct keys (0 = grow on demand)"));
        p.AddParameter(new UnsignedInt64Parameter("fdist.hash_seed", "0", &c.hash_seed, false, "Seed of the xxHash key hasher"));
    }
    auto to_tuple() const { return std::make_tuple("capacity", capacity, "hash_seed", hash_seed); }
    friend std::ostream &operator<<(std::ostream &os, const FrequencyDistributionConfig &c)
    {
        ConfigPrinter<FrequencyDistributionConfig>::print(os, c);
        return os;
    }

    template <typename K> FrequencyDistribution<K> make() const
    {
        return FrequencyDistribution<K>::with_capacity_and_hasher(static_cast<size_t>(capacity), XXHasher<K>(hash_seed));
    }
};
