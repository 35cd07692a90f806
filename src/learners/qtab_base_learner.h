// -------------------------- Tabular Q-Learning Framework ------------------------------------//
//  qtab
//  Learning strategies
//  --------------------------------------------------------------------------------------------//


#pragma once


#include <optional>


class BaseLearner {
public:
    virtual ~BaseLearner() = default;

    /*
     * Computes the new Q-Value of the pair that was just taken from its old value (nothing if unseen), the reward
     * observed after the action and the best value reachable from the next state.
     * The Trainer always passes 'best_next', terminal states included. Other callers may leave it empty, which counts as 0.
     * */
    virtual double update(std::optional<double> old_value, double reward_value,
                          std::optional<double> best_next) const = 0;

    /* Value assumed for state-action pairs that have no entry yet. */
    virtual double initial_value() const = 0;
};
