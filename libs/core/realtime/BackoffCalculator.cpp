#include "BackoffCalculator.hpp"
#include <algorithm>
#include <cmath>

BackoffCalculator::BackoffCalculator(std::chrono::milliseconds initialDelay,
                                     std::chrono::milliseconds maxDelay,
                                     double multiplier)
    : m_initial(initialDelay)
    , m_max(maxDelay)
    , m_multiplier(multiplier)
    , m_current(initialDelay)
{}

std::chrono::milliseconds BackoffCalculator::next() {
    const auto delay = std::min(m_current, m_max);
    m_current = grow(m_current, m_multiplier, m_max);
    return delay;
}

std::chrono::milliseconds BackoffCalculator::grow(std::chrono::milliseconds current,
                                                  double multiplier,
                                                  std::chrono::milliseconds maxDelay) {
    // Compare in floating point first so a huge product cannot overflow the rep
    const double scaled = static_cast<double>(current.count()) * multiplier;
    if (scaled >= static_cast<double>(maxDelay.count())) {
        return maxDelay;
    }
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(std::llround(scaled)));
}
