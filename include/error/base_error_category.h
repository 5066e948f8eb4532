#pragma once
#ifndef _STRATA_BASE_ERROR_CATEGORY_H_
#define _STRATA_BASE_ERROR_CATEGORY_H_
#include <string>
#include <system_error>
namespace strata {

class base_error_category : public std::error_category {
 public:
  virtual const char* name() const noexcept override = 0;
  virtual std::string message(int ev) const override = 0;
};

}  // namespace strata

#endif  // _STRATA_BASE_ERROR_CATEGORY_H_
