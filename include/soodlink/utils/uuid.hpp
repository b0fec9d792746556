/**
 * @file uuid.hpp
 * @brief UUID v4 generation for discovery transaction ids.
 *
 * Generates random UUIDs using C++ standard library random facilities.
 *
 * @copyright Copyright (c) 2024 SoodLink Contributors
 * @license MIT License
 */

#pragma once

#include "soodlink/utils/export.hpp"

#include <cstdint>
#include <string>

namespace soodlink {
namespace utils {

/**
 * @class UUIDGenerator
 * @brief Thread-safe UUID v4 generator.
 *
 * Generates RFC 4122 version 4 (random) UUIDs in lowercase canonical
 * form: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx, y in {8, 9, a, b}.
 * The 36-character result always fits a single SOOD attribute.
 *
 * Usage:
 * @code
 * std::string tid = UUIDGenerator::generate();
 * @endcode
 */
class SOODLINK_UTILS_API UUIDGenerator {
public:
    static constexpr std::size_t kLength = 36;

    /**
     * @brief Generate a new random UUID v4.
     */
    static std::string generate();

    /**
     * @brief Check whether a string has the canonical 8-4-4-4-12 layout.
     *
     * Accepts upper and lower case hex digits. Does not check the
     * version or variant nibbles, so ids minted by servers pass too.
     */
    static bool isValid(const std::string& uuid);
};

}  // namespace utils
}  // namespace soodlink
