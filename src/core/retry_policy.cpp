#include "core/retry_policy.hpp"

#include <algorithm>
#include <cmath>

namespace tidemark {
namespace {

uint64_t splitmix64(uint64_t x) {
    x += 0x9e3779b97f4a7c15ULL;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

// Uniform in [-1, 1].
double unit_noise(uint64_t seed, int64_t sequence, int attempt) {
    const auto h = splitmix64(seed ^ static_cast<uint64_t>(sequence) ^
                              (static_cast<uint64_t>(attempt) << 40));
    const double unit = static_cast<double>(h >> 11) / static_cast<double>(1ULL << 53);
    return unit * 2.0 - 1.0;
}

} // namespace

std::chrono::milliseconds RetryPolicy::nominal_delay(int attempt) const {
    if (attempt <= 0) return std::chrono::milliseconds{0};

    const double base = static_cast<double>(base_delay.count());
    const double cap = static_cast<double>(max_delay.count());
    const double raw = base * std::pow(multiplier, attempt - 1);
    return std::chrono::milliseconds{static_cast<int64_t>(std::min(raw, cap))};
}

std::chrono::milliseconds RetryPolicy::delay_for(int64_t sequence, int attempt) const {
    const auto nominal = nominal_delay(attempt);
    if (jitter <= 0.0 || nominal.count() == 0) return nominal;

    const double factor = 1.0 + jitter * unit_noise(seed, sequence, attempt);
    const double scaled = static_cast<double>(nominal.count()) * factor;
    const double capped = std::min(scaled, static_cast<double>(max_delay.count()));
    return std::chrono::milliseconds{static_cast<int64_t>(std::max(0.0, capped))};
}

} // namespace tidemark
