// -------------------------- Tabular Q-Learning Framework ------------------------------------//
//  qtab
//  --------------------------------------------------------------------------------------------//


//  INFORMATION:
//  ------------
//  Decides which value stands in for the best next action value when the agent lands in a
//  terminal state (a state without legal actions).
//
//      zero:      0
//      initial:   the learner's initial value for unseen entries
//      constant:  a fixed value set through QTAB_TERMINAL_VALUE or Trainer::set_terminal
//
//  Environment variables:
//      QTAB_TERMINAL
//      QTAB_TERMINAL_VALUE


#pragma once


#include <string>
#include <unordered_map>


enum TerminalType {
    TERMINAL_ZERO = 0,
    TERMINAL_INITIAL = 1,
    TERMINAL_CONSTANT = 2
};

static std::unordered_map <std::string, TerminalType> TerminalTable = {
        {"zero",     TerminalType::TERMINAL_ZERO},
        {"initial",  TerminalType::TERMINAL_INITIAL},
        {"constant", TerminalType::TERMINAL_CONSTANT}
};

static std::unordered_map<int, std::string> TerminalLookup = {
        {TerminalType::TERMINAL_ZERO,     "zero"},
        {TerminalType::TERMINAL_INITIAL,  "initial"},
        {TerminalType::TERMINAL_CONSTANT, "constant"}
};
