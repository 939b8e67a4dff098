#ifndef BLOCKALIGN_TIMER_HPP
#define BLOCKALIGN_TIMER_HPP

#include <chrono>

// A timer that automatically starts on construction
class Timer {
public:
    Timer() : start_time(std::chrono::steady_clock::now()) {
    }

    // Return time elapsed since construction or the last restart()
    std::chrono::duration<double> duration() const {
        return std::chrono::steady_clock::now() - start_time;
    }

    std::chrono::duration<double>::rep elapsed() const {
        return duration().count();
    }

    void restart() {
        start_time = std::chrono::steady_clock::now();
    }

private:
    std::chrono::time_point<std::chrono::steady_clock> start_time;
};

#endif
