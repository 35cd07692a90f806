// -------------------------- Tabular Q-Learning Framework ------------------------------------//
//  qtab
//  Termination strategies
//  --------------------------------------------------------------------------------------------//


//  INFORMATION:
//  ------------
//  The "Time Limit" terminator polls a steady clock after every update and ends training once
//  the given wall-clock budget has passed. The clock starts with the first call.


#pragma once


#include <chrono>
#include <optional>

#include "qtab_base_terminator.h"


template<class S>
class TimeLimit : public BaseTerminator<S> {
public:
    using Clock = std::chrono::steady_clock;

    explicit TimeLimit(Clock::duration limit) : limit(limit) {
    }

    bool should_stop(const S &state) override {
        Clock::time_point now = Clock::now();
        if (!start)
            start = now;
        return now - *start >= limit;
    }

    /* Restarts the clock with the next call. */
    void reset() {
        start.reset();
    }

private:
    Clock::duration limit;
    std::optional<Clock::time_point> start;
};
