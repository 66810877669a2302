#pragma once
#include <chrono>

// Exponential backoff without jitter: initial, initial*m, initial*m^2 ... capped at max
class BackoffCalculator {
public:
    BackoffCalculator(std::chrono::milliseconds initialDelay,
                      std::chrono::milliseconds maxDelay,
                      double multiplier);

    /// Delay for the retry being scheduled now; advances the stored delay.
    std::chrono::milliseconds next();

    /// Delay the next call to next() will return.
    [[nodiscard]] std::chrono::milliseconds current() const { return m_current; }

    void reset() { m_current = m_initial; }

    [[nodiscard]] std::chrono::milliseconds initialDelay() const { return m_initial; }
    [[nodiscard]] std::chrono::milliseconds maxDelay() const { return m_max; }

    /// Pure step function: min(current * multiplier, maxDelay).
    static std::chrono::milliseconds grow(std::chrono::milliseconds current,
                                          double multiplier,
                                          std::chrono::milliseconds maxDelay);

private:
    std::chrono::milliseconds m_initial;
    std::chrono::milliseconds m_max;
    double m_multiplier;
    std::chrono::milliseconds m_current;
};
