#pragma once

#include <atomic>
#include <cstdint>

namespace autotrader {

// -----------------------------------------------------------------------------
// IdGenerator: thread-safe, monotonically increasing id source
// -----------------------------------------------------------------------------
//
// @brief  Produces unique, monotonically increasing ids via an atomic
//         counter.
//
// @details
// Starts at 1 (0 is reserved as an "unset" sentinel). Used by the
// PositionLedger for position ids and by the PaperExecutionAdapter for
// synthetic order ids. After a restart the ledger calls advance_past() with
// the highest rehydrated id so new ids never collide with persisted ones.
//
// std::memory_order_relaxed is enough: the only requirement is uniqueness.
//
// Thread model:
//   next_id() and advance_past() are safe to call from any thread.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  IdGenerator() = default;

  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // -------------------------------------------------------------------------
  // advance_past(id)
  // -------------------------------------------------------------------------
  // @brief  Guarantees that every future next_id() is greater than id.
  //
  // @details
  // Compare-exchange loop so a concurrent next_id() can never hand out a
  // value at or below id once this returns.
  // -------------------------------------------------------------------------
  void advance_past(std::uint64_t id) {
    std::uint64_t current = next_id_.load(std::memory_order_relaxed);
    while (current <= id &&
           !next_id_.compare_exchange_weak(current, id + 1,
                                           std::memory_order_relaxed)) {
    }
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace autotrader
