#pragma once

#include <cstddef>

template <typename K, typename Q = std::size_t> class Distribution {
  public:
    using key_type = K;
    using quantity_type = Q;

    virtual ~Distribution() = default;

    // Number of distinct keys in storage.
    virtual std::size_t len() const = 0;

    // Count for a key, zero when the key was never observed.
    virtual quantity_type get(const key_type &key) const = 0;

    virtual void clear() = 0;

    virtual void insert(const key_type &key) = 0;

    virtual void remove(const key_type &key) = 0;

  protected:
    Distribution() = default;
    Distribution(const Distribution &) = default;
    Distribution(Distribution &&) = default;
    Distribution &operator=(const Distribution &) = default;
    Distribution &operator=(Distribution &&) = default;
};
