//  ************************* Tabular Q-Learning Framework ***************************************
//  * qtab                                                                                       *
//  * Exploration policies                                                                       *
//  **********************************************************************************************
//  * INFORMATION:                                                                               *
//  * ------------                                                                               *
//  * The "Softmax" policy assigns each legal action a probability derived from its Q-Value and  *
//  * selects the next action according to this distribution. Actions without a Q-Value use a   *
//  * configurable default.                                                                      *
//  *                                                                                            *
//  * Environment variables (read by the default constructor):                                   *
//  *     QTAB_TAU (Temperature)                                                                 *
//  *     QTAB_INITIAL_VALUE (Default for missing Q-Values)                                      *
//  **********************************************************************************************


#pragma once


#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#include "qtab_base_policy.h"
#include "../agents/defaults.h"
#include "../utils/utils.h"


template<class S>
class SoftmaxPolicy : public BasePolicy<S> {
public:
    using Action = typename S::Action;

    SoftmaxPolicy() {
        read_env_double("QTAB_TAU", tau);
        read_env_double("QTAB_INITIAL_VALUE", default_value);
        validate();
    }

    explicit SoftmaxPolicy(double tau, double default_value = defaults::INITIAL_VALUE)
            : tau(tau), default_value(default_value) {
        validate();
    }

    SoftmaxPolicy(double tau, double default_value, unsigned int seed)
            : tau(tau), default_value(default_value), rng(seed) {
        validate();
    }

    std::optional<Action> policy(int episode, long timestep, const S &state, const ValueTable<S> &table) override {
        std::vector<Action> actions = state.actions();
        if (actions.empty())
            return std::nullopt;

        std::vector<double> weights;
        weights.reserve(actions.size());
        for (const auto &action: actions) {
            weights.push_back(table.get_or(state, action, default_value));
        }

        auto probabilities = Softmax(weights, tau);
        return actions[StochasticSelection(probabilities, rng())];
    }

    double get_tau() const {
        return tau;
    }

    /*
     * The temperature parameter here might be 1/temperature seen elsewhere.
     * Here, lower temperatures move the highest-weighted output
     * toward a probability of 1.0.
     * And higher temperatures tend to even out all the probabilities,
     * toward 1/<entry count>.
     * temperature's range is between 0 and +Infinity (excluding these
     * two extremes).
    **/
    static std::vector<double> Softmax(const std::vector<double> &weights, double temperature) {
        std::vector<double> probabilities;
        double sum = 0;
        double max_weight = *std::max_element(weights.begin(), weights.end());

        for (auto weight: weights) {
            double pr = std::exp((weight - max_weight) / temperature);    // shifted so the largest term is e^0
            sum += pr;
            probabilities.push_back(pr);
        }

        for (auto &pr: probabilities) {
            pr /= sum;
        }

        return probabilities;
    }

    /*
     * Selects one index out of a vector of probabilities, "probabilities", for a point in [0, 1).
     * The sum of all elements in "probabilities" must be 1.
     *
     * The unit interval is divided into sub-intervals, one for each
     * entry in "probabilities".  Each sub-interval's size is proportional
     * to its corresponding probability. A linear search finds the entry
     * whose sub-interval contains "point".
     **/
    static std::size_t StochasticSelection(const std::vector<double> &probabilities, double point) {
        double cur_cutoff = 0;

        for (std::vector<double>::size_type i = 0; i < probabilities.size() - 1; ++i) {
            cur_cutoff += probabilities[i];
            if (point < cur_cutoff) return i;
        }

        return probabilities.size() - 1;
    }

private:
    double tau{defaults::TAU};
    double default_value{defaults::INITIAL_VALUE};
    Rng rng;

    void validate() const {
        if (!(tau > 0.0))
            throw std::invalid_argument("SoftmaxPolicy: temperature must be positive, got " + std::to_string(tau));
    }
};
