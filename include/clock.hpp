/**
 * Wang Jiadong <jiadong.wang.94@outlook.com>
 */

#pragma once

#include "definitions.hpp"

class Clock {
 public:
    virtual ~Clock() {}
    // monotonic seconds, arbitrary epoch
    virtual float64_t now() const = 0;
    virtual void sleep(float64_t seconds) = 0;
};

class SteadyClock : public Clock {
 public:
    virtual float64_t now() const override;
    virtual void sleep(float64_t seconds) override;
};
