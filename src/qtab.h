// -------------------------- Tabular Q-Learning Framework ------------------------------------//
//  qtab
//  --------------------------------------------------------------------------------------------//


#pragma once

#include "agents/defaults.h"
#include "agents/qtab_agent.h"

#include "decays/qtab_decay_type.h"
#include "decays/qtab_decay.h"

#include "learners/qtab_base_learner.h"
#include "learners/qtab_q_learner.h"

#include "policies/qtab_policy_type.h"
#include "policies/qtab_base_policy.h"
#include "policies/qtab_random_policy.h"
#include "policies/qtab_epsilon_greedy_policy.h"
#include "policies/qtab_softmax_policy.h"
#include "policies/qtab_explore_first_policy.h"
#include "policies/qtab_policy_provider.h"

#include "terminators/qtab_base_terminator.h"
#include "terminators/qtab_fixed_iterations.h"
#include "terminators/qtab_sink_states.h"
#include "terminators/qtab_time_limit.h"
#include "terminators/qtab_any_terminator.h"

#include "qtab_terminal_type.h"
#include "qtab_value_table.h"
#include "qtab_trainer.h"
