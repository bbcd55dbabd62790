#ifndef B91_DEBUG_HPP
#define B91_DEBUG_HPP

/**
 * @file b91_debug.hpp
 * @brief Debug logging macro for the base91 codecs
 * 
 * This header provides compile-time debug logging support.
 * To enable debug logging, define B91_DEBUG before including this header
 * (or configure CMake with -DB91_DEBUG=ON):
 *   #define B91_DEBUG
 *   #include "b91_debug.hpp"
 */

#ifdef B91_DEBUG
#include <iostream>
#include <sstream>

/**
 * @brief Macro for debug logging
 * 
 * Usage: B91_DEBUG_LOG("message " << variable);
 * 
 * When B91_DEBUG is defined, this macro outputs to stderr.
 * When B91_DEBUG is not defined, this macro compiles to nothing.
 */
#define B91_DEBUG_LOG(msg) do { \
    std::ostringstream _oss; \
    _oss << "[B91_DEBUG] " << msg; \
    std::cerr << _oss.str() << std::endl; \
} while(0)

#else
#define B91_DEBUG_LOG(msg) ((void)0)
#endif

#endif // B91_DEBUG_HPP
