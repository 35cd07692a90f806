// -------------------------- Tabular Q-Learning Framework ------------------------------------//
//  qtab
//  Termination strategies
//  --------------------------------------------------------------------------------------------//


#pragma once


#include <initializer_list>
#include <vector>

#include "qtab_base_terminator.h"


/*
 * Stops as soon as one of the wrapped terminators wants to stop. Every child is polled on every call so stateful
 * children (counters, clocks) keep advancing. The children are borrowed and must outlive this object.
 * */
template<class S>
class AnyTerminator : public BaseTerminator<S> {
public:
    AnyTerminator(std::initializer_list<BaseTerminator<S> *> terminators) : children(terminators) {
    }

    void add(BaseTerminator<S> &terminator) {
        children.push_back(&terminator);
    }

    bool should_stop(const S &state) override {
        bool stop = false;
        for (auto *child: children) {
            if (child->should_stop(state))
                stop = true;
        }
        return stop;
    }

private:
    std::vector<BaseTerminator<S> *> children;
};
