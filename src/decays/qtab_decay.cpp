// -------------------------- Tabular Q-Learning Framework ------------------------------------//
//  qtab
//  Exploration rate schedules
//  --------------------------------------------------------------------------------------------//


#include <cmath>

#include "qtab_decay.h"


double decay(DecayType type, long timestep, double target_init, double target_min, double factor) {
    if (factor <= 0)
        return target_init;

    switch (type) {
        case DecayType::LINEAR:
            return fmax(target_min, target_init - factor * timestep);
        case DecayType::EXPONENTIAL:
        default:
            return fmax(target_min, target_init * exp(-factor * timestep));
    }
}
