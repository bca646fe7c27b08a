#include "link_sampler.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>

namespace Strider {
namespace Engine {

namespace {
std::mt19937 make_rng(uint64_t seed) {
    if (seed == 0) {
        std::random_device rd;
        return std::mt19937(rd());
    }
    return std::mt19937(static_cast<std::mt19937::result_type>(seed));
}
}  // namespace

LinkSampler::LinkSampler(double percentage, uint64_t seed)
    : percentage_(std::clamp(percentage, 0.0, 100.0)), rng_(make_rng(seed)) {
}

size_t LinkSampler::admitted_count(size_t candidates, double percentage) {
    if (percentage <= 0.0)
        return 0;
    if (percentage >= 100.0)
        return candidates;
    return static_cast<size_t>(std::floor(static_cast<double>(candidates) * percentage / 100.0));
}

std::vector<std::string> LinkSampler::admit(const std::vector<std::string>& candidates) {
    size_t count = admitted_count(candidates.size(), percentage_);
    if (count >= candidates.size())
        return candidates;

    std::vector<std::string> chosen;
    chosen.reserve(count);
    std::sample(candidates.begin(), candidates.end(), std::back_inserter(chosen), count, rng_);
    return chosen;
}

}  // namespace Engine
}  // namespace Strider
