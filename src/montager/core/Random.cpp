#include "montager/core/Random.hpp"

namespace montager {

MersenneRandomSource::MersenneRandomSource(unsigned seed)
{
    rng_.seed(seed ? seed : std::random_device{}());
}

double MersenneRandomSource::uniform01() {
    return dist_(rng_);
}

} // namespace montager
