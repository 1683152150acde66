#include "common/types.h"

namespace tradeguard {
namespace common {

/**
 * @file types.cpp
 * @brief Template instantiations for common types
 *
 * Explicit instantiations for the Result<T> specializations returned by the
 * market components.
 */

template class Result<bool>;
template class Result<std::string>;
template class Result<uint64_t>;

} // namespace common
} // namespace tradeguard
