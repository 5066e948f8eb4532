#pragma once
#ifndef _STRATA_LEAF_H_
#define _STRATA_LEAF_H_

// leaf 头文件在 -Wpedantic 下有告警，只在这里屏蔽一次
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wpedantic"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wimplicit-fallthrough"
#endif

#include <boost/leaf.hpp>

#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif

// Every synchronous strata API returns strata::leaf::result<T>; the error
// object it carries is a strata_error (see error/error.h).
namespace strata::leaf {
using namespace boost::leaf;

template <typename T>
using result = boost::leaf::result<T>;
}  // namespace strata::leaf

#endif  // _STRATA_LEAF_H_
