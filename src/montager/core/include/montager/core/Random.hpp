#pragma once

#include <memory>
#include <random>

namespace montager {

/*
  Source of the single brightness-jitter draw made per channel.

  Implementations should provide:
    - uniform01(): a value in [0, 1).
  Tests inject a fixed source to pin the draw.
*/
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    [[nodiscard]] virtual double uniform01() = 0;
};

/* Mersenne-twister backed source. seed == 0 picks a random seed. */
class MersenneRandomSource final : public IRandomSource {
public:
    explicit MersenneRandomSource(unsigned seed = 0);

    [[nodiscard]] double uniform01() override;

private:
    std::mt19937 rng_;
    std::uniform_real_distribution<double> dist_{0.0, 1.0};
};

} // namespace montager
