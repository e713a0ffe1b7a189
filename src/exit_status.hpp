/**
 * @file exit_status.hpp
 * @brief Process exit codes of the mercount front end
 */

#pragma once

#include <exception>
#include <stdexcept>

constexpr int EXIT_USAGE = 1;  // bad command line or configuration
constexpr int EXIT_INPUT = 2;  // unreadable or malformed data, or a failed counting run

/**
 * @brief Exit code for an exception that ended a run
 *
 * Configuration problems are thrown as std::invalid_argument; everything
 * else (I/O, alphabet violations, table exhaustion) fails the run itself.
 */
inline int exit_status_for(const std::exception& e) {
    if (dynamic_cast<const std::invalid_argument*>(&e) != nullptr) {
        return EXIT_USAGE;
    }
    return EXIT_INPUT;
}
