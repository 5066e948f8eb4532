#ifndef _STRATA_FATAL_H_
#define _STRATA_FATAL_H_
#include <fmt/format.h>

#include <string>
#include <string_view>
#include <utility>

#include "basic/logger.h"
#include "error/error.h"
#include "error/leaf.h"
#include "error/replica_error.h"
namespace strata::core {

// escalate_fatal runs try_block and turns any failure into a fatal
// replica_error::REPLICA_CORRUPTION prefixed with what. Used where the effect
// was already committed, so failing to apply it means the replica diverged.
// Errors which are fatal already pass through unchanged.
template <typename TryBlock>
leaf::result<void> escalate_fatal(logger_interface& logger, std::string_view what, TryBlock&& try_block) {
  return leaf::try_handle_some(std::forward<TryBlock>(try_block),
                               [&](const strata_error& err) -> leaf::result<void> {
                                 if (is_fatal(err.err_code)) {
                                   return new_error(err);
                                 }
                                 auto msg = fmt::format("{}: {}", what, err.what());
                                 LOGGER_CRITICAL(logger, "{}", msg);
                                 return new_error(replica_error::REPLICA_CORRUPTION, std::move(msg));
                               });
}

}  // namespace strata::core

#endif  // _STRATA_FATAL_H_
