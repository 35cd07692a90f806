// -------------------------- Tabular Q-Learning Framework ------------------------------------//
//  qtab
//  Exploration policies
//
//  --------------------------------------------------------------------------------------------//
//
//  INFORMATION:
//  ------------
//  The "Explore First" policy tries every legal action of a state once, in declared order,
//  before it exploits: as long as some action of the current state has no Q-Value it picks the
//  first such action, afterwards it always picks the greedy action.
//
//  Environment variables:
//      (none)


#pragma once


#include <iostream>
#include <vector>

#include "qtab_base_policy.h"


template<class S>
class ExploreFirstPolicy : public BasePolicy<S> {
public:
    using Action = typename S::Action;

    std::optional<Action> policy(int episode, long timestep, const S &state, const ValueTable<S> &table) override {
        std::vector<Action> actions = state.actions();
        if (actions.empty())
            return std::nullopt;

        for (const auto &action: actions) { // Try all actions possible in each state exactly once
            if (!table.contains(state, action)) {
#if (_QTAB_DEBUG > 1)
                std::cout << "[ExploreFirstPolicy::policy] Exploring! timestep: " << timestep << std::endl;
#endif
                return action;
            }
        }

#if (_QTAB_DEBUG > 1)
        std::cout << "[ExploreFirstPolicy::policy] Exploiting!" << std::endl;
#endif
        return table.argmax(state, actions);
    }
};
