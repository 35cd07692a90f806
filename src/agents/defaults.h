// -------------------------- Tabular Q-Learning Framework ------------------------------------//
//  qtab
//  --------------------------------------------------------------------------------------------//

#include "../decays/qtab_decay_type.h"
#include "../policies/qtab_policy_type.h"
#include "../qtab_terminal_type.h"

#pragma once


namespace defaults {
    const double ALPHA                   = 0.20;
    const double GAMMA                   = 0.90;
    const double INITIAL_VALUE           = 0.00;
    const double EPSILON                 = 0.90;
    const double EPSILON_MIN             = 0.10;
    const double EPSILON_DECAY_FACTOR    = 0.01;
    const double TAU                     = 1.50;
    const double TERMINAL_VALUE          = 0.00;

    const long ITERATIONS                = 100000;

    const DecayType DECAY_TYPE           = DecayType::EXPONENTIAL;
    const PolicyType POLICY_TYPE         = PolicyType::RANDOM;
    const TerminalType TERMINAL_TYPE     = TerminalType::TERMINAL_ZERO;
}
