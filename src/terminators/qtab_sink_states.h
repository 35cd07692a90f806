// -------------------------- Tabular Q-Learning Framework ------------------------------------//
//  qtab
//  Termination strategies
//  --------------------------------------------------------------------------------------------//


#pragma once


#include "qtab_base_terminator.h"


/*
 * Ends training as soon as the agent reaches a terminal state (a state without legal actions).
 * Useful for episodic tasks where every call to Trainer::train plays one episode.
 * */
template<class S>
class SinkStates : public BaseTerminator<S> {
public:
    bool should_stop(const S &state) override {
        return state.actions().empty();
    }
};
