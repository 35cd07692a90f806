// -------------------------- Tabular Q-Learning Framework ------------------------------------//
//  qtab
//  Exploration rate schedules
//  --------------------------------------------------------------------------------------------//


//  INFORMATION:
//  ------------
//  Rates such as epsilon start high to favor exploration and are decreased every timestep
//  towards a lower bound to favor exploitation later on.
//
//      EXPONENTIAL:  max(min, init * e^(-factor * t))
//      LINEAR:       max(min, init - factor * t)


#pragma once


#include "qtab_decay_type.h"


/*
 * Returns the decayed value of a rate after 'timestep' steps. A factor of zero disables the decay.
 * */
double decay(DecayType type, long timestep, double target_init, double target_min, double factor);
