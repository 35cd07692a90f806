// -------------------------- Tabular Q-Learning Framework ------------------------------------//
//  qtab
//  --------------------------------------------------------------------------------------------//


#pragma once

#include <iomanip>
#include <iostream>
#include <optional>
#include <utility>
#include <vector>

#include "agents/defaults.h"
#include "agents/qtab_agent.h"
#include "learners/qtab_base_learner.h"
#include "policies/qtab_base_policy.h"
#include "terminators/qtab_base_terminator.h"
#include "utils/utils.h"
#include "qtab_terminal_type.h"
#include "qtab_value_table.h"


/*
 * Owns the learned Q-Values of one problem and trains them by letting an agent act in its environment.
 * After training the trainer can be asked for the expected value of an action or the best action in a state.
 *
 * Environment variables (read by the constructor):
 *     QTAB_TERMINAL
 *     QTAB_TERMINAL_VALUE
 * */
template<class S>
class Trainer {
public:
    using Action = typename S::Action;

    Trainer() {
        read_env_enum("QTAB_TERMINAL", terminal_type);
        read_env_double("QTAB_TERMINAL_VALUE", terminal_value);
    }

    /*
     * Lets 'agent' act until 'terminator' stops training. In every step the policy picks an action for the
     * agent's current state, the agent takes it and observes its reward, and the learner updates the Q-Value of the
     * pair that was taken. Training also ends when the agent is in a state without legal actions.
     *
     * The agent and the strategies are used exclusively by this call for its whole duration.
     * */
    void train(BaseAgent<S> &agent, const BaseLearner &learner, BaseTerminator<S> &terminator,
               BasePolicy<S> &policy) {
        episode++;
        long updates = 0;

#if (_QTAB_DEBUG > 0)
        std::cout << "[Trainer::train] Starting episode " << episode << " at timestep " << timestep << std::endl;
#endif
        while (true) {
            S current_state = agent.current_state();
            auto action = policy.policy(episode, timestep, current_state, table);
            if (!action) {
#if (_QTAB_DEBUG > 0)
                std::cout << "[Trainer::train] No legal action in the current state. Stopping." << std::endl;
#endif
                break;
            }

            std::optional<double> old_value = table.get(current_state, *action);
            agent.take_action(*action);
            const S &next_state = agent.current_state();
            double reward_value = agent.reward();

            double new_value = learner.update(old_value, reward_value, best_next_value(next_state, learner));
            table.set(current_state, *action, new_value);
            timestep++;
            updates++;

#if (_QTAB_DEBUG > 1)
            std::cout << std::fixed << std::setprecision(3) << "[Trainer::train] timestep " << timestep
                      << ": reward " << reward_value << ", Q " << old_value.value_or(learner.initial_value())
                      << " -> " << new_value << std::endl;
#endif
            if (terminator.should_stop(agent.current_state()))
                break;
        }

#if (_QTAB_DEBUG > 0)
        std::cout << "[Trainer::train] Episode " << episode << " finished after " << updates << " updates. Table size: "
                  << table.size() << std::endl;
#endif
    }

    /*
     * Returns the learned value of taking 'action' in 'state', or nothing if the pair was never updated.
     * */
    std::optional<double> expected_value(const S &state, const Action &action) const {
        return table.get(state, action);
    }

    /*
     * Returns the learned values of the legal actions of 'state' in declared order. Actions that were never taken
     * from 'state' are left out.
     * */
    std::vector<std::pair<Action, double>> expected_values(const S &state) const {
        std::vector<std::pair<Action, double>> values;
        for (const auto &action: state.actions()) {
            auto value = table.get(state, action);
            if (value)
                values.emplace_back(action, *value);
        }
        return values;
    }

    /*
     * Returns the legal action of 'state' with the highest learned value. Ties go to the action declared first.
     * Returns nothing if the state has no legal actions or none of them has a learned value.
     * */
    std::optional<Action> best_action(const S &state) const {
        return table.argmax(state, state.actions());
    }

    const ValueTable<S> &learned_values() const {
        return table;
    }

    /*
     * Sets the value used for the best next action when the agent lands in a terminal state. 'value' is only used
     * by TerminalType::TERMINAL_CONSTANT.
     * */
    void set_terminal(TerminalType type, double value = defaults::TERMINAL_VALUE) {
        terminal_type = type;
        terminal_value = value;
    }

    TerminalType get_terminal_type() const {
        return terminal_type;
    }

    double get_terminal_value() const {
        return terminal_value;
    }

    /* Number of updates over all calls to train. */
    long get_timestep() const {
        return timestep;
    }

    /* Number of calls to train. */
    int get_episode() const {
        return episode;
    }

private:
    ValueTable<S> table;

    TerminalType terminal_type{defaults::TERMINAL_TYPE};
    double terminal_value{defaults::TERMINAL_VALUE};

    long timestep{0};
    int episode{0};

    /*
     * Highest Q-Value reachable from 'next_state', unseen pairs counting as the learner's initial value.
     * */
    std::optional<double> best_next_value(const S &next_state, const BaseLearner &learner) const {
        std::vector<Action> actions = next_state.actions();
        if (!actions.empty())
            return table.best_value(next_state, actions, learner.initial_value());

        switch (terminal_type) {
            case TerminalType::TERMINAL_INITIAL:
                return learner.initial_value();
            case TerminalType::TERMINAL_CONSTANT:
                return terminal_value;
            case TerminalType::TERMINAL_ZERO:
            default:
                return 0.0;
        }
    }
};
