/**
 * @file export.hpp
 * @brief SOODLINK_NET_API, the symbol visibility macro of soodlink_net.
 *
 * @copyright Copyright (c) 2024 SoodLink Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) && !defined(SOODLINK_STATIC)
    #ifdef SOODLINK_NET_BUILD
        #define SOODLINK_NET_API __declspec(dllexport)
    #else
        #define SOODLINK_NET_API __declspec(dllimport)
    #endif
#elif defined(SOODLINK_NET_BUILD) && (defined(__GNUC__) || defined(__clang__))
    #define SOODLINK_NET_API __attribute__((visibility("default")))
#else
    #define SOODLINK_NET_API
#endif
