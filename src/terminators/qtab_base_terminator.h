// -------------------------- Tabular Q-Learning Framework ------------------------------------//
//  qtab
//  Termination strategies
//  --------------------------------------------------------------------------------------------//


#pragma once


template<class S>
class BaseTerminator {
public:
    virtual ~BaseTerminator() = default;

    /*
     * Called once after every completed update with the state the agent ended up in. Returning true ends training.
     * */
    virtual bool should_stop(const S &state) = 0;
};
