#ifndef _STRATA_STORE_H_
#define _STRATA_STORE_H_
#include <asio/any_io_executor.hpp>

#include "basic/utility_macros.h"
#include "replica_core/config.h"
#include "replica_core/engine.h"
#include "replica_core/hlc_clock.h"
#include "replica_core/interfaces.h"
#include "replica_core/metrics.h"
#include "replica_core/raft_entry_cache.h"
#include "replica_core/stopper.h"
namespace strata::core {

// store_collaborators are the services a store hands to its replicas.
struct store_collaborators {
  engine_proxy engine;
  replica_queue_proxy raft_log_queue;
  replica_queue_proxy split_queue;
  replica_queue_proxy replica_gc_queue;
  gossip_proxy gossip;
  intent_resolver_proxy intent_resolver;
  range_topology_proxy range_topology;
};

// store is what a replica reaches through to get at node-wide state: its
// identity and configuration, the clock, the engine and the queues.
class store {
  NOT_COPYABLE_NOT_MOVABLE(store)

 public:
  store(store_config&& cfg, hlc_clock& clock, stopper& stopper, store_collaborators&& collaborators)
      : cfg_(std::move(cfg)), clock_(clock), stopper_(stopper), collaborators_(std::move(collaborators)) {}

  const store_config& cfg() const { return cfg_; }

  pb::store_id store_id() const { return cfg_.store_id; }

  hlc_clock& clock() { return clock_; }

  stopper& get_stopper() { return stopper_; }

  const asio::any_io_executor& executor() const { return stopper_.executor(); }

  engine_proxy& engine() { return collaborators_.engine; }

  replica_queue_proxy& raft_log_queue() { return collaborators_.raft_log_queue; }

  replica_queue_proxy& split_queue() { return collaborators_.split_queue; }

  replica_queue_proxy& replica_gc_queue() { return collaborators_.replica_gc_queue; }

  gossip_proxy& gossip() { return collaborators_.gossip; }

  intent_resolver_proxy& intent_resolver() { return collaborators_.intent_resolver; }

  range_topology_proxy& range_topology() { return collaborators_.range_topology; }

  store_metrics& metrics() { return metrics_; }

  raft_entry_cache& entry_cache() { return raft_entry_cache_; }

 private:
  store_config cfg_;
  hlc_clock& clock_;
  stopper& stopper_;
  store_collaborators collaborators_;
  store_metrics metrics_;
  raft_entry_cache raft_entry_cache_;
};

}  // namespace strata::core

#endif  // _STRATA_STORE_H_
