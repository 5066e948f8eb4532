#include <absl/strings/escaping.h>
#include <fmt/format.h>
#include <openssl/evp.h>

#include <memory>

#include "error/error.h"
#include "error/logic_error.h"
#include "error/replica_error.h"
#include "replica_core/keys.h"
#include "replica_core/pb/protobuf.h"
#include "replica_core/replica.h"
namespace strata::core {

namespace {

class sha512_hasher {
  NOT_COPYABLE_NOT_MOVABLE(sha512_hasher)

 public:
  sha512_hasher() : ctx_(EVP_MD_CTX_new(), EVP_MD_CTX_free) {
    ok_ = ctx_ != nullptr && EVP_DigestInit_ex(ctx_.get(), EVP_sha512(), nullptr) == 1;
  }

  // update hashes a length-prefixed key and value, so that (k, v) pairs can
  // not be confused by moving bytes across the boundary.
  void update(std::string_view key, std::string_view value) {
    update_length(key.size());
    update_bytes(key);
    update_length(value.size());
    update_bytes(value);
  }

  bool ok() const { return ok_; }

  std::optional<std::string> finish() {
    if (!ok_) {
      return std::nullopt;
    }
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), md, &len) != 1) {
      ok_ = false;
      return std::nullopt;
    }
    return std::string(reinterpret_cast<const char*>(md), len);
  }

 private:
  void update_length(std::size_t n) {
    unsigned char buf[8];
    for (int i = 7; i >= 0; --i) {
      buf[i] = static_cast<unsigned char>(n & 0xff);
      n >>= 8;
    }
    update_bytes(std::string_view(reinterpret_cast<const char*>(buf), sizeof(buf)));
  }

  void update_bytes(std::string_view bytes) {
    if (ok_ && EVP_DigestUpdate(ctx_.get(), bytes.data(), bytes.size()) != 1) {
      ok_ = false;
    }
  }

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;
  bool ok_ = false;
};

std::string hex_id(std::string_view id) { return absl::BytesToHexString(absl::string_view(id.data(), id.size())); }

}  // namespace

leaf::result<replica_checksum_result> compute_checksum(const engine_snapshot_proxy& snap,
                                                       const replicapb::range_descriptor& desc, bool with_snapshot) {
  sha512_hasher hasher;
  if (!hasher.ok()) {
    return new_error(replica_error::CHECKSUM_FAILED, "unable to initialize sha512 digest");
  }
  replica_checksum_result result;
  if (with_snapshot) {
    result.snapshot.emplace();
    *result.snapshot->mutable_range_descriptor() = desc;
  }
  auto visit = [&](std::string_view key, std::string_view value) {
    hasher.update(key, value);
    if (result.snapshot) {
      auto* kv = result.snapshot->add_kv();
      kv->set_key(std::string(key));
      kv->set_value(std::string(value));
    }
  };

  // range-id local replicated state
  auto prefix = keys::make_range_id_prefix(desc.range_id());
  BOOST_LEAF_CHECK(snap->scan(prefix, keys::prefix_end(prefix), visit));

  // user data
  std::string_view start = desc.start_key();
  if (start < keys::LOCAL_MAX) {
    start = keys::LOCAL_MAX;
  }
  BOOST_LEAF_CHECK(snap->scan(start, desc.end_key(), visit));

  auto digest = hasher.finish();
  if (!digest) {
    return new_error(replica_error::CHECKSUM_FAILED, "sha512 digest failed");
  }
  result.digest = std::move(digest);
  return result;
}

void replica::gc_old_checksum_entries_locked(std::chrono::system_clock::time_point now) {
  absl::erase_if(checksums_, [now](const auto& entry) {
    const auto& gc_timestamp = entry.second.gc_timestamp;
    return gc_timestamp.has_value() && now > *gc_timestamp;
  });
}

void replica::compute_checksum_post_apply(const replicapb::compute_checksum& args) {
  const auto& id = args.checksum_id();
  auto now = store_.clock().physical_time();
  replicapb::range_descriptor d;
  {
    std::lock_guard<std::mutex> guard(mu_);
    auto iter = checksums_.find(id);
    if (iter != checksums_.end() && iter->second.started) {
      // a previous attempt was made to compute this checksum.
      LOGGER_DEBUG(logger_, "checksum {} already started", hex_id(id));
      return;
    }
    gc_old_checksum_entries_locked(now);
    auto& c = checksums_[id];
    if (c.notify == nullptr) {
      c.notify = coro::notify_signal::make(store_.executor());
    }
    c.started = true;
    d = state_.desc();
  }

  if (args.version() != REPLICA_CHECKSUM_VERSION) {
    LOGGER_INFO(logger_, "incompatible compute checksum versions (server: {}, requested: {})",
                REPLICA_CHECKSUM_VERSION, args.version());
    compute_checksum_done(id, std::nullopt, std::nullopt);
    return;
  }

  auto snap = std::make_shared<engine_snapshot_proxy>(store_.engine()->new_snapshot());
  auto launched = leaf::try_handle_some(
      [&]() -> leaf::result<void> {
        return store_.get_stopper().run_async_task(
            "compute checksum", [self = shared_from_this(), id, d, snap, with_snapshot = args.snapshot()]() {
              auto result = leaf::try_handle_some(
                  [&]() -> leaf::result<replica_checksum_result> { return compute_checksum(*snap, d, with_snapshot); },
                  [&](const strata_error& err) -> leaf::result<replica_checksum_result> {
                    LOGGER_ERROR(self->logger_, "checksum {} failed: {}", hex_id(id), err.what());
                    return replica_checksum_result{};
                  });
              if (result) {
                self->compute_checksum_done(id, std::move(result->digest), std::move(result->snapshot));
              } else {
                self->compute_checksum_done(id, std::nullopt, std::nullopt);
              }
            });
      },
      [&](const strata_error& err) -> leaf::result<void> {
        LOGGER_ERROR(logger_, "could not run async checksum computation (ID = {}): {}", hex_id(id), err.what());
        return new_error(err);
      });
  if (!launched) {
    // nobody else will complete the entry, waiters must not hang.
    compute_checksum_done(id, std::nullopt, std::nullopt);
  }
}

void replica::compute_checksum_done(const std::string& id, std::optional<std::string> digest,
                                    std::optional<replicapb::raft_snapshot_data> snapshot) {
  coro::notify_signal_handle notify;
  {
    std::lock_guard<std::mutex> guard(mu_);
    auto iter = checksums_.find(id);
    if (iter == checksums_.end()) {
      LOGGER_ERROR(logger_, "no map entry for checksum (ID = {})", hex_id(id));
      return;
    }
    auto& c = iter->second;
    c.digest = std::move(digest);
    c.snapshot = std::move(snapshot);
    c.gc_timestamp = store_.clock().physical_time() + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                                                          store_.cfg().checksum_gc_interval);
    notify = c.notify;
  }
  if (notify != nullptr) {
    notify->fire();
  }
}

asio::awaitable<expected<replica_checksum_result>> replica::get_checksum(
    std::string id, std::chrono::steady_clock::duration timeout) {
  coro::notify_signal_handle notify;
  {
    std::lock_guard<std::mutex> guard(mu_);
    auto& c = checksums_[id];
    if (c.notify == nullptr) {
      // pending until the compute command arrives.
      c.notify = coro::notify_signal::make(store_.executor());
    }
    notify = c.notify;
  }

  if (!notify->fired()) {
    auto waited = co_await notify->async_wait_for(timeout);
    if (!waited) {
      LOGGER_WARN(logger_, "checksum computation {} did not complete within {}ms", hex_id(id),
                  std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count());
      {
        // 等待方放弃后该条目可能再也不会完成，给它一个回收时间
        std::lock_guard<std::mutex> guard(mu_);
        auto iter = checksums_.find(id);
        if (iter != checksums_.end() && !iter->second.gc_timestamp.has_value()) {
          iter->second.gc_timestamp = store_.clock().physical_time() +
                                      std::chrono::duration_cast<std::chrono::system_clock::duration>(
                                          store_.cfg().checksum_gc_interval);
        }
      }
      co_return tl::unexpected(make_error_code(replica_error::CHECKSUM_TIMEOUT));
    }
  }

  std::lock_guard<std::mutex> guard(mu_);
  auto iter = checksums_.find(id);
  if (iter == checksums_.end()) {
    co_return tl::unexpected(make_error_code(logic_error::KEY_NOT_FOUND));
  }
  co_return replica_checksum_result{iter->second.digest, iter->second.snapshot};
}

}  // namespace strata::core
