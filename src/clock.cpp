/**
 * Wang Jiadong <jiadong.wang.94@outlook.com>
 */

#include "clock.hpp"

#include <chrono>
#include <thread>

float64_t SteadyClock::now() const {
    using namespace std::chrono;
    return duration_cast<duration<float64_t> >(steady_clock::now().time_since_epoch()).count();
}

void SteadyClock::sleep(float64_t seconds) {
    if (seconds <= 0.0) {
        return;
    }
    std::this_thread::sleep_for(std::chrono::duration<float64_t>(seconds));
}
