#ifndef _STRATA_UTILITY_MACROS_H_
#define _STRATA_UTILITY_MACROS_H_

// MOVABLE_BUT_NOT_COPYABLE is for value types carrying move-only payloads
// (engine batches, eval results with completion hooks).
#define MOVABLE_BUT_NOT_COPYABLE(Type) \
  Type(Type &&) = default;             \
  Type &operator=(Type &&) = default;  \
  Type(const Type &) = delete;         \
  Type &operator=(const Type &) = delete;

// NOT_COPYABLE_NOT_MOVABLE pins objects which others hold by reference or
// shared_ptr: the store, replicas, engines, caches.
#define NOT_COPYABLE_NOT_MOVABLE(Type)    \
  Type(const Type &) = delete;            \
  Type &operator=(const Type &) = delete; \
  Type(Type &&) = delete;                 \
  Type &operator=(Type &&) = delete;

#define STRATA_UNUSED(x) (void)(x)

#endif  // _STRATA_UTILITY_MACROS_H_
