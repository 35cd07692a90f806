// -------------------------- Tabular Q-Learning Framework ------------------------------------//
//  qtab
//  Learning strategies
//  --------------------------------------------------------------------------------------------//


//  INFORMATION:
//  ------------
//  Standard tabular Q-Learning:
//
//      Q(s, a) <- Q(s, a) + alpha * (r + gamma * max_a' Q(s', a') - Q(s, a))
//
//  An unseen Q(s, a) starts at the initial value. A missing max_a' Q(s', a') (the next state is
//  terminal) counts as 0.
//
//  Environment variables (read by the default constructor):
//      QTAB_ALPHA
//      QTAB_GAMMA
//      QTAB_INITIAL_VALUE


#pragma once


#include "qtab_base_learner.h"


class QLearner : public BaseLearner {
public:
    /* Configures the learner from the environment, falling back to the defaults. */
    QLearner();

    /*
     * 'alpha' is the learning rate and 'gamma' the discount factor, both in [0, 1]. Throws std::invalid_argument
     * otherwise.
     * */
    QLearner(double alpha, double gamma, double initial_value);

    double update(std::optional<double> old_value, double reward_value,
                  std::optional<double> best_next) const override;

    double initial_value() const override;

    double get_alpha() const {
        return alpha;
    }

    double get_gamma() const {
        return gamma;
    }

protected:
    double alpha;             // Learning rate
    double gamma;             // Discount factor
    double init_value;        // Q-Value of unseen state-action pairs

    void validate() const;
};
