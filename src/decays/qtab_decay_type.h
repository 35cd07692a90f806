// -------------------------- Tabular Q-Learning Framework ------------------------------------//
//  qtab
//  Exploration rate schedules
//  --------------------------------------------------------------------------------------------//

#include <string>
#include <unordered_map>

#pragma once


enum DecayType {
    EXPONENTIAL = 0,
    LINEAR = 1
};

static std::unordered_map <std::string, DecayType> DecayTable = {
        {"exponential", DecayType::EXPONENTIAL},
        {"linear",      DecayType::LINEAR}
};

static std::unordered_map<int, std::string> DecayLookup = {
        {DecayType::EXPONENTIAL, "exponential"},
        {DecayType::LINEAR,      "linear"}
};
