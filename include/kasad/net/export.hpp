/**
 * @file export.hpp
 * @brief Symbol visibility macros for the kasad_net library.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(KASAD_NET_BUILD)
        #define KASAD_NET_API __declspec(dllexport)
    #else
        #define KASAD_NET_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(KASAD_NET_BUILD)
        #define KASAD_NET_API __attribute__((visibility("default")))
    #else
        #define KASAD_NET_API
    #endif
#else
    #define KASAD_NET_API
#endif
