/**
 * @file export.hpp
 * @brief SOODLINK_CONFIG_API, the symbol visibility macro of soodlink_config.
 *
 * @copyright Copyright (c) 2024 SoodLink Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) && !defined(SOODLINK_STATIC)
    #ifdef SOODLINK_CONFIG_BUILD
        #define SOODLINK_CONFIG_API __declspec(dllexport)
    #else
        #define SOODLINK_CONFIG_API __declspec(dllimport)
    #endif
#elif defined(SOODLINK_CONFIG_BUILD) && (defined(__GNUC__) || defined(__clang__))
    #define SOODLINK_CONFIG_API __attribute__((visibility("default")))
#else
    #define SOODLINK_CONFIG_API
#endif
