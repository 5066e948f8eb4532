#pragma once
#ifndef _STRATA_EXPECTED_H_
#define _STRATA_EXPECTED_H_
#include <system_error>
#include <tl/expected.hpp>

namespace strata {
template <typename T>
using expected = tl::expected<T, std::error_code>;

inline expected<void> ok() { return expected<void>{}; }

}  // namespace strata

#endif  // _STRATA_EXPECTED_H_
