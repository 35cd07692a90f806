// -------------------------- Tabular Q-Learning Framework ------------------------------------//
//  qtab
//  Learning strategies
//  --------------------------------------------------------------------------------------------//


#include <iostream>
#include <stdexcept>
#include <string>

#include "../agents/defaults.h"
#include "../utils/utils.h"
#include "qtab_q_learner.h"

// public
QLearner::QLearner() : alpha(defaults::ALPHA), gamma(defaults::GAMMA), init_value(defaults::INITIAL_VALUE) {
    read_env_double("QTAB_ALPHA", alpha);                 // Read learning rate from env
    read_env_double("QTAB_GAMMA", gamma);                 // Read discount factor from env
    read_env_double("QTAB_INITIAL_VALUE", init_value);    // Read value of unseen pairs from env
    validate();
}

QLearner::QLearner(double alpha, double gamma, double initial_value) : alpha(alpha), gamma(gamma),
                                                                       init_value(initial_value) {
    validate();
}

double QLearner::update(std::optional<double> old_value, double reward_value, std::optional<double> best_next) const {
    double old = old_value.value_or(init_value);
    double max_next = best_next.value_or(0.0);
    double right_term = alpha * (reward_value + gamma * max_next - old);

#if (_QTAB_DEBUG > 1) // Print the update
    std::cout << "[QLearner::update] " << old << " (old) + " << right_term << " (right) = " << old + right_term
              << std::endl;
#endif

    return old + right_term;
}

double QLearner::initial_value() const {
    return init_value;
}

// protected
void QLearner::validate() const {
    if (!(alpha >= 0.0 && alpha <= 1.0))
        throw std::invalid_argument("QLearner: alpha must be in [0, 1], got " + std::to_string(alpha));
    if (!(gamma >= 0.0 && gamma <= 1.0))
        throw std::invalid_argument("QLearner: gamma must be in [0, 1], got " + std::to_string(gamma));
}
