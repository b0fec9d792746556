/**
 * @file logger.cpp
 * @brief Logger implementation (mostly header-only, this provides linkage).
 *
 * @copyright Copyright (c) 2024 SoodLink Contributors
 * @license MIT License
 */

#include "soodlink/utils/logger.hpp"

namespace soodlink {
namespace utils {

// Logger is header-only; this translation unit gives soodlink_utils a
// symbol to export. The singleton lives in Logger::instance().

}  // namespace utils
}  // namespace soodlink
