// -------------------------- Tabular Q-Learning Framework ------------------------------------//
//  qtab
//  Exploration policies
//  --------------------------------------------------------------------------------------------//


#pragma once


#include <optional>

#include "../qtab_value_table.h"


template<class S>
class BasePolicy {
public:
    using Action = typename S::Action;

    virtual ~BasePolicy() = default;

    /*
     * Picks the next action to try from 'state'. Returns nothing if the state has no legal actions.
     * */
    virtual std::optional<Action> policy(int episode, long timestep, const S &state, const ValueTable<S> &table) = 0;
};
