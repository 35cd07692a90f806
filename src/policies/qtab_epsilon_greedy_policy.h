// -------------------------- Tabular Q-Learning Framework ------------------------------------//
//  qtab
//  Exploration policies
//  --------------------------------------------------------------------------------------------//


//  INFORMATION:
//  ------------
//  The "Epsilon Greedy" policy has a chance (probability = ε) to explore a random action from the
//  legal actions. Otherwise it uses the greedy action from the learned experience (exploit). ε
//  gets decreased every timestep (epsilon decay) to favor exploration at the start of the
//  learning phase and exploitation in the end.
//
//  While no action of the current state has a Q-Value yet, the greedy choice falls back to a
//  random action.
//
//  Environment variables (read by the default constructor):
//      QTAB_EPSILON
//      QTAB_EPS_MIN
//      QTAB_EPS_DECAY
//      QTAB_DECAY


#pragma once


#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "qtab_base_policy.h"
#include "../agents/defaults.h"
#include "../decays/qtab_decay.h"
#include "../utils/utils.h"


template<class S>
class EpsilonGreedyPolicy : public BasePolicy<S> {
public:
    using Action = typename S::Action;

    EpsilonGreedyPolicy() {
        read_env_double("QTAB_EPSILON", epsilon_init);              // Read exploration rate from env
        read_env_double("QTAB_EPS_MIN", epsilon_min);
        read_env_double("QTAB_EPS_DECAY", epsilon_decay_factor);
        read_env_enum("QTAB_DECAY", decay_type);
        epsilon = epsilon_init;
        validate();
    }

    EpsilonGreedyPolicy(double epsilon_init, double epsilon_min, double epsilon_decay_factor,
                        DecayType decay_type = defaults::DECAY_TYPE)
            : epsilon_init(epsilon_init), epsilon_min(epsilon_min), epsilon_decay_factor(epsilon_decay_factor),
              decay_type(decay_type), epsilon(epsilon_init) {
        validate();
    }

    EpsilonGreedyPolicy(double epsilon_init, double epsilon_min, double epsilon_decay_factor, DecayType decay_type,
                        unsigned int seed)
            : EpsilonGreedyPolicy(epsilon_init, epsilon_min, epsilon_decay_factor, decay_type) {
        rng = Rng(seed);
    }

    std::optional<Action> policy(int episode, long timestep, const S &state, const ValueTable<S> &table) override {
        std::vector<Action> actions = state.actions();
        if (actions.empty())
            return std::nullopt;

        epsilon = decay(decay_type, timestep, epsilon_init, epsilon_min, epsilon_decay_factor);

        // Switches between exploration and exploitation with the probability of epsilon (or 1-epsilon)
        if (rng() >= epsilon) {
            auto greedy = table.argmax(state, actions);
            if (greedy) {
#if (_QTAB_DEBUG > 1)
                std::cout << "[EpsilonGreedyPolicy::policy] Exploiting!" << std::endl;
#endif
                return greedy;
            }
        }
#if (_QTAB_DEBUG > 1)
        std::cout << "[EpsilonGreedyPolicy::policy] Exploring!" << std::endl;
#endif
        return actions[rng.index(actions.size())];
    }

    /* Exploration rate used by the most recent call to policy(). */
    double get_epsilon() const {
        return epsilon;
    }

    double get_epsilon_init() const {
        return epsilon_init;
    }

    double get_epsilon_min() const {
        return epsilon_min;
    }

    double get_epsilon_decay() const {
        return epsilon_decay_factor;
    }

    DecayType get_decay_type() const {
        return decay_type;
    }

private:
    double epsilon_init{defaults::EPSILON};
    double epsilon_min{defaults::EPSILON_MIN};
    double epsilon_decay_factor{defaults::EPSILON_DECAY_FACTOR};
    DecayType decay_type{defaults::DECAY_TYPE};
    double epsilon{defaults::EPSILON};
    Rng rng;

    void validate() const {
        if (!(epsilon_init >= 0.0 && epsilon_init <= 1.0))
            throw std::invalid_argument("EpsilonGreedyPolicy: epsilon must be in [0, 1], got "
                                        + std::to_string(epsilon_init));
        if (!(epsilon_min >= 0.0 && epsilon_min <= 1.0))
            throw std::invalid_argument("EpsilonGreedyPolicy: minimum epsilon must be in [0, 1], got "
                                        + std::to_string(epsilon_min));
        if (!(epsilon_decay_factor >= 0.0))
            throw std::invalid_argument("EpsilonGreedyPolicy: decay factor must not be negative, got "
                                        + std::to_string(epsilon_decay_factor));
    }
};
