#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace Rosetta {

/**
 * @brief Steady-clock stopwatch used to report load times.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    Timer() : start_(Clock::now()) {}

    void reset() {
        start_ = Clock::now();
    }

    /**
     * @brief Get elapsed milliseconds since last reset or construction.
     */
    double elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_).count();
    }

    double elapsed_sec() const {
        return elapsed_ms() / 1000.0;
    }

private:
    TimePoint start_;
};

/**
 * @brief Calendar timestamp as stored in Tatoeba detail columns.
 *
 * Text form is `YYYY-MM-DD HH:MM:SS`. No time zone is attached.
 */
struct DateTime {
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;

    bool operator==(const DateTime&) const = default;

    /**
     * @brief Parse `YYYY-MM-DD HH:MM:SS`.
     *
     * Returns nullopt when the text does not have exactly that shape or a
     * field is out of its calendar range.
     */
    static std::optional<DateTime> parse(const std::string& text);

    std::string to_string() const;
};

} // namespace Rosetta
