// -------------------------- Tabular Q-Learning Framework ------------------------------------//
//  qtab
//  Exploration policies
//  --------------------------------------------------------------------------------------------//


#pragma once


#include <iostream>
#include <memory>

#include "qtab_base_policy.h"
#include "qtab_policy_type.h"
#include "qtab_random_policy.h"
#include "qtab_epsilon_greedy_policy.h"
#include "qtab_softmax_policy.h"
#include "qtab_explore_first_policy.h"
#include "../agents/defaults.h"
#include "../utils/utils.h"


/*
 * Creates an exploration policy of the given type, configured from the environment.
 * */
template<class S>
std::unique_ptr<BasePolicy<S>> create_policy(PolicyType policy_type) {
    std::unique_ptr<BasePolicy<S>> pol;

    switch (policy_type) {
        case PolicyType::RANDOM:
            pol.reset(new RandomPolicy<S>());
            break;
        case PolicyType::EPSILON_GREEDY:
            pol.reset(new EpsilonGreedyPolicy<S>());
            break;
        case PolicyType::SOFTMAX:
            pol.reset(new SoftmaxPolicy<S>());
            break;
        case PolicyType::EXPLORE_FIRST:
            pol.reset(new ExploreFirstPolicy<S>());
            break;
        default:
            std::cout << "[create_policy] Unknown policy type specified: " << policy_type
                      << ". Using default (random)." << std::endl;
            policy_type = PolicyType::RANDOM;
            pol.reset(new RandomPolicy<S>());
            break;
    }

#if (_QTAB_DEBUG > 0)
    std::cout << "[create_policy] Configuring policy as: " << PolicyLookup.at(policy_type) << std::endl;
#endif
    return pol;
}

/*
 * Creates the exploration policy named by QTAB_POLICY (default: random).
 * */
template<class S>
std::unique_ptr<BasePolicy<S>> create_policy() {
    PolicyType policy_type{defaults::POLICY_TYPE};
    read_env_enum("QTAB_POLICY", policy_type);
    return create_policy<S>(policy_type);
}
