// -------------------------- Tabular Q-Learning Framework ------------------------------------//
//  qtab
//  --------------------------------------------------------------------------------------------//


#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "utils/utils.h"


/*
 * Sparse table of Q-Values keyed by (State, Action). Entries are created lazily on the first update and are
 * never evicted. A missing entry means "no value", not zero.
 *
 * The state type must declare its action type as S::Action, and both types need operator== and a
 * std::hash specialization. Keys hold full copies of the state and action.
 * */
template<class S>
class ValueTable {
public:
    using Action = typename S::Action;
    using Key = std::pair<S, Action>;

    struct KeyHash {
        std::size_t operator()(const Key &key) const {
            std::size_t seed = std::hash<S>{}(key.first);
            hash_combine(seed, key.second);
            return seed;
        }
    };

    using Map = std::unordered_map<Key, double, KeyHash>;
    using const_iterator = typename Map::const_iterator;

    /*
     * Returns the Q-Value stored for a particular state-action pair, or nothing if it was never set.
     * */
    std::optional<double> get(const S &state, const Action &action) const {
        auto it = table.find(Key(state, action));
        if (it == table.end())
            return std::nullopt;
        return it->second;
    }

    double get_or(const S &state, const Action &action, double default_value) const {
        auto it = table.find(Key(state, action));
        return it == table.end() ? default_value : it->second;
    }

    bool contains(const S &state, const Action &action) const {
        return table.find(Key(state, action)) != table.end();
    }

    /* Insert-or-update. */
    void set(const S &state, const Action &action, double value) {
        table[Key(state, action)] = value;
    }

    /*
     * Highest Q-Value over 'actions', missing entries counting as 'default_value'.
     * Returns nothing if 'actions' is empty.
     * */
    std::optional<double> best_value(const S &state, const std::vector<Action> &actions,
                                     double default_value) const {
        std::optional<double> best;
        for (const auto &action: actions) {
            double value = get_or(state, action, default_value);
            if (!best || value > *best)
                best = value;
        }
        return best;
    }

    /*
     * Searches for the best action among 'actions' using the stored Q-Values only. Actions without an entry
     * are skipped and ties go to the action that comes first in 'actions'.
     * */
    std::optional<Action> argmax(const S &state, const std::vector<Action> &actions) const {
        std::optional<std::size_t> best_index;
        double best_current = 0.0;

        for (std::size_t i = 0; i < actions.size(); i++) {
            auto value = get(state, actions[i]);
            if (value && (!best_index || *value > best_current)) {
                best_current = *value;
                best_index = i;
            }
        }
        if (!best_index)
            return std::nullopt;
        return actions[*best_index];
    }

    std::size_t size() const {
        return table.size();
    }

    bool empty() const {
        return table.empty();
    }

    const_iterator begin() const {
        return table.begin();
    }

    const_iterator end() const {
        return table.end();
    }

private:
    Map table;
};
