// -------------------------- Tabular Q-Learning Framework ------------------------------------//
//  qtab
//  Exploration policies
//  --------------------------------------------------------------------------------------------//


//  INFORMATION:
//  ------------
//  The "Random" policy ignores the learned Q-Values and samples the next action uniformly from
//  the actions that are legal in the current state.
//
//  Environment variables:
//      (none)


#pragma once


#include <vector>

#include "qtab_base_policy.h"
#include "../utils/utils.h"


template<class S>
class RandomPolicy : public BasePolicy<S> {
public:
    using Action = typename S::Action;

    RandomPolicy() = default;

    explicit RandomPolicy(unsigned int seed) : rng(seed) {
    }

    std::optional<Action> policy(int episode, long timestep, const S &state, const ValueTable<S> &table) override {
        std::vector<Action> actions = state.actions();
        if (actions.empty())
            return std::nullopt;
        return actions[rng.index(actions.size())];
    }

private:
    Rng rng;
};
