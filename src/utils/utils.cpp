// -------------------------- Tabular Q-Learning Framework ------------------------------------//
//  qtab
//  --------------------------------------------------------------------------------------------//


#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

#include "utils.h"


namespace {

template<class E>
void read_env_enum_from(const char *var_name, E &target, const std::unordered_map<std::string, E> &table,
                        const std::unordered_map<int, std::string> &lookup) {
    if (std::getenv(var_name) != nullptr) {
        std::string str = std::string(std::getenv(var_name));
        if (table.find(str) == table.end()) {
            std::cout << "[read_env_enum] " << var_name << " cannot use value " << str << ". Possible values: ";
            for (auto const &x: table) {
                std::cout << x.first << ", ";
            }
            std::cout << " using default: " << lookup.at(int(target)) << std::endl;
        } else {
            target = table.at(str);
        }
    } else {
#if (_QTAB_DEBUG > 0)
        std::cout << "[read_env_enum] Couldn't read envvar " << var_name << ". Using default: "
                  << lookup.at(int(target)) << std::endl;
#endif
    }
}

}

void read_env_long(const char *var_name, long &target) {
    if (std::getenv(var_name) != nullptr) {
        try {
            const char *value = std::getenv(var_name);
            std::size_t parsed = 0;
            long result = std::stol(value, &parsed);
            if (parsed != std::strlen(value))
                throw std::invalid_argument(value);
            target = result;
        } catch (const std::logic_error &) {
            std::cout << "[read_env_long] " << var_name << " cannot use value " << std::getenv(var_name)
                      << ". Using default: " << target << std::endl;
        }
    } else {
#if (_QTAB_DEBUG > 0)
        std::cout << "[read_env_long] Couldn't read envvar " << var_name << ". Using default: " << target << std::endl;
#endif
    }
}

void read_env_double(const char *var_name, double &target) {
    if (std::getenv(var_name) != nullptr) {
        try {
            const char *value = std::getenv(var_name);
            std::size_t parsed = 0;
            double result = std::stod(value, &parsed);
            if (parsed != std::strlen(value))
                throw std::invalid_argument(value);
            target = result;
        } catch (const std::logic_error &) {
            std::cout << "[read_env_double] " << var_name << " cannot use value " << std::getenv(var_name)
                      << ". Using default: " << target << std::endl;
        }
    } else {
#if (_QTAB_DEBUG > 0)
        std::cout << "[read_env_double] Couldn't read envvar " << var_name << ". Using default: " << target
                  << std::endl;
#endif
    }
}

void read_env_enum(const char *var_name, DecayType &target) {
    read_env_enum_from(var_name, target, DecayTable, DecayLookup);
}

void read_env_enum(const char *var_name, PolicyType &target) {
    read_env_enum_from(var_name, target, PolicyTable, PolicyLookup);
}

void read_env_enum(const char *var_name, TerminalType &target) {
    read_env_enum_from(var_name, target, TerminalTable, TerminalLookup);
}
