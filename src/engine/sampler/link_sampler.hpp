#pragma once
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace Strider {
namespace Engine {

// Reduces each page's link batch to floor(n * P / 100) members chosen uniformly
// at random. Chosen links keep their page order. Not synchronized.
class LinkSampler {
public:
    // seed 0 draws from std::random_device.
    explicit LinkSampler(double percentage, uint64_t seed = 0);

    std::vector<std::string> admit(const std::vector<std::string>& candidates);

    static size_t admitted_count(size_t candidates, double percentage);

    double percentage() const {
        return percentage_;
    }

private:
    double       percentage_;
    std::mt19937 rng_;
};

}  // namespace Engine
}  // namespace Strider
