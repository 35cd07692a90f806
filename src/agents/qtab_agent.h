// -------------------------- Tabular Q-Learning Framework ------------------------------------//
//  qtab
//  --------------------------------------------------------------------------------------------//


//  INFORMATION:
//  ------------
//  A problem domain plugs into the trainer through two contracts.
//
//  State: any copyable value type that declares its action type and lists the actions that
//  are legal from it. An empty list marks a terminal state.
//
//      struct GridState {
//          using Action = Move;
//          std::vector<Move> actions() const;
//          bool operator==(const GridState &other) const;
//      };
//
//  Both GridState and Move need a std::hash specialization that agrees with operator==.
//
//  Agent: owns exactly one current state, applies actions to it and scores it.


#pragma once


/*
 * Base class of every agent that can be trained. 'S' is the state type described above.
 * */
template<class S>
class BaseAgent {
public:
    using Action = typename S::Action;

    virtual ~BaseAgent() = default;

    /* The live state. Stays valid until the next call to take_action. */
    virtual const S &current_state() const = 0;

    /*
     * Applies 'action' to the current state. Only actions listed by current_state().actions() are valid;
     * anything else is up to the implementation.
     * */
    virtual void take_action(const Action &action) = 0;

    /* Reward of the current state, i.e. of the state reached by the last action. */
    virtual double reward() const = 0;
};
