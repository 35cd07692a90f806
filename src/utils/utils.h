// -------------------------- Tabular Q-Learning Framework ------------------------------------//
//  qtab
//  --------------------------------------------------------------------------------------------//

#ifndef _QTAB_DEBUG
#define _QTAB_DEBUG 0   // 0: silent, 1: training summaries and config fallbacks, 2: every update
#endif

#pragma once

#include <cstddef>
#include <functional>
#include <random>
#include <string>

#include "../decays/qtab_decay_type.h"
#include "../policies/qtab_policy_type.h"
#include "../qtab_terminal_type.h"

/*
 * Reads the environment variable with the name 'var_name' and parses it as a long.
 * The whole value must parse, otherwise it is reported and 'target' keeps its default.
 * */
void read_env_long(const char *var_name, long &target);

/*
 * Reads the environment variable with the name 'var_name' and parses it as a double.
 * The whole value must parse, otherwise it is reported and 'target' keeps its default.
 * */
void read_env_double(const char *var_name, double &target);

void read_env_enum(const char *var_name, DecayType &target);

void read_env_enum(const char *var_name, PolicyType &target);

void read_env_enum(const char *var_name, TerminalType &target);

/*
 * Mixes the hash of 'value' into 'seed'.
 * */
template<class T>
inline void hash_combine(std::size_t &seed, const T &value) {
    seed ^= std::hash<T>{}(value) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

/*
 * Rng class encapsulates random number generation for the exploration policies,
 * in case you need to replace std's <random> with something else.
 **/
struct Rng {
    std::mt19937 engine;
    std::uniform_real_distribution<double> distribution;

    Rng() : distribution(0, 1) {
        std::random_device rd;
        engine.seed(rd());
    }

    explicit Rng(unsigned int seed) : engine(seed), distribution(0, 1) {
    }

    /* Uniform double in [0, 1). */
    double operator()() {
        return distribution(engine);
    }

    /* Uniform index in [0, size). 'size' must be positive. */
    std::size_t index(std::size_t size) {
        std::uniform_int_distribution<std::size_t> uniform(0, size - 1);
        return uniform(engine);
    }
};
