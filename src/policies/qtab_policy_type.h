// -------------------------- Tabular Q-Learning Framework ------------------------------------//
//  qtab
//  Exploration policies
//  --------------------------------------------------------------------------------------------//


#pragma once


#include <string>
#include <unordered_map>


enum PolicyType {
    RANDOM = 0,
    EPSILON_GREEDY = 1,
    SOFTMAX = 2,
    EXPLORE_FIRST = 3
};

static std::unordered_map <std::string, PolicyType> PolicyTable = {
        {"random",         PolicyType::RANDOM},
        {"epsilon-greedy", PolicyType::EPSILON_GREEDY},
        {"softmax",        PolicyType::SOFTMAX},
        {"explore-first",  PolicyType::EXPLORE_FIRST}
};

static std::unordered_map<int, std::string> PolicyLookup = {
        {PolicyType::RANDOM,         "random"},
        {PolicyType::EPSILON_GREEDY, "epsilon-greedy"},
        {PolicyType::SOFTMAX,        "softmax"},
        {PolicyType::EXPLORE_FIRST,  "explore-first"}
};
