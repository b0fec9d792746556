/**
 * @file export.hpp
 * @brief SOODLINK_CORE_API, the symbol visibility macro of soodlink_core.
 *
 * @copyright Copyright (c) 2024 SoodLink Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) && !defined(SOODLINK_STATIC)
    #ifdef SOODLINK_CORE_BUILD
        #define SOODLINK_CORE_API __declspec(dllexport)
    #else
        #define SOODLINK_CORE_API __declspec(dllimport)
    #endif
#elif defined(SOODLINK_CORE_BUILD) && (defined(__GNUC__) || defined(__clang__))
    #define SOODLINK_CORE_API __attribute__((visibility("default")))
#else
    #define SOODLINK_CORE_API
#endif
