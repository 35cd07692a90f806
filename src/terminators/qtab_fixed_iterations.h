// -------------------------- Tabular Q-Learning Framework ------------------------------------//
//  qtab
//  Termination strategies
//  --------------------------------------------------------------------------------------------//


//  INFORMATION:
//  ------------
//  The "Fixed Iterations" terminator ends training after exactly N updates, regardless of the
//  state: the first N-1 calls return false, the Nth returns true.
//
//  Environment variables (read by the default constructor):
//      QTAB_ITERATIONS


#pragma once


#include <stdexcept>
#include <string>

#include "qtab_base_terminator.h"
#include "../agents/defaults.h"
#include "../utils/utils.h"


template<class S>
class FixedIterations : public BaseTerminator<S> {
public:
    FixedIterations() {
        read_env_long("QTAB_ITERATIONS", iterations);
        validate();
    }

    explicit FixedIterations(long iterations) : iterations(iterations) {
        validate();
    }

    bool should_stop(const S &state) override {
        count++;
        return count >= iterations;
    }

    /* Starts counting from zero again, e.g. for the next episode. */
    void reset() {
        count = 0;
    }

    long get_iterations() const {
        return iterations;
    }

    long get_count() const {
        return count;
    }

private:
    long iterations{defaults::ITERATIONS};
    long count{0};

    void validate() const {
        if (iterations <= 0)
            throw std::invalid_argument("FixedIterations: iteration count must be positive, got "
                                        + std::to_string(iterations));
    }
};
