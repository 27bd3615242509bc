#pragma once

#include <concepts>
#include <random>
#include <vector>

namespace util {

/*
 * Process-wide random number generation, seeded from the clock unless --seed is given.
 *
 * util::Random::Params random_params;
 * auto desc = raw_desc.add(random_params.make_options_description());
 * po2::parse_args(desc, ac, av);
 * util::Random::init(random_params);
 */
class Random {
 public:
  struct Params {
    auto make_options_description();

    int seed = 0;  // 0 means seed from the clock
  };

  static void init(const Params&);

  static void set_seed(int seed);

  // Uniform over the half-open range [lower, upper). Throws util::Exception if the range is empty.
  template <std::integral T, std::integral U>
  static auto uniform_sample(T lower, U upper);

  // Uniform choice of an element. Throws util::Exception if v is empty.
  template <typename T>
  static const T& choose(const std::vector<T>& v);

 private:
  static std::mt19937& prng();
};

}  // namespace util

#include "inline/util/Random.inl"
