#pragma once

//
// SnapshotExchange
// ----------------
// Single-writer / single-reader handoff for fixed-size blocks.  Three slots
// rotate between the two sides: the writer fills its back slot and publishes
// it by swapping it with the shared middle slot; the reader swaps the middle
// slot into its front slot when something fresh is waiting.  Neither side ever
// touches a slot the other one owns, so the reader sees whole snapshots or the
// previous one, never a mix.  No locks, no allocation, no waiting.
//
// Writer API: writeSlot() + publish(), or publish(value).
// Reader API: acquire() (latest complete snapshot), read() (no refresh).
#include <array>
#include <atomic>
#include <cstdint>
#include <type_traits>

namespace flicker {

template <typename T>
class SnapshotExchange {
  static_assert(std::is_trivially_copyable<T>::value,
                "snapshots are copied as plain bytes between threads");

public:
  SnapshotExchange() = default;
  explicit SnapshotExchange(const T& initial) {
    slots_.fill(initial);
  }

  SnapshotExchange(const SnapshotExchange&) = delete;
  SnapshotExchange& operator=(const SnapshotExchange&) = delete;

  // Writer side -------------------------------------------------------------

  T& writeSlot() { return slots_[back_]; }

  void publish() {
    const std::uint8_t previous =
        middle_.exchange(static_cast<std::uint8_t>(back_ | kFreshBit), std::memory_order_acq_rel);
    back_ = static_cast<std::uint8_t>(previous & kIndexMask);
    published_.fetch_add(1, std::memory_order_relaxed);
  }

  void publish(const T& value) {
    writeSlot() = value;
    publish();
  }

  // Reader side -------------------------------------------------------------

  // Pull the newest published snapshot if one is waiting.  Returns true when
  // the front slot changed.
  bool refresh() {
    if ((middle_.load(std::memory_order_acquire) & kFreshBit) == 0) {
      return false;
    }
    const std::uint8_t previous = middle_.exchange(front_, std::memory_order_acq_rel);
    front_ = static_cast<std::uint8_t>(previous & kIndexMask);
    return true;
  }

  const T& acquire() {
    refresh();
    return slots_[front_];
  }

  // Front slot without refreshing.  Valid until the next refresh()/acquire().
  const T& read() const { return slots_[front_]; }

  std::uint64_t publishedCount() const { return published_.load(std::memory_order_relaxed); }

private:
  static constexpr std::uint8_t kIndexMask = 0x03;
  static constexpr std::uint8_t kFreshBit = 0x04;

  std::array<T, 3> slots_{};
  std::uint8_t back_{0};
  std::atomic<std::uint8_t> middle_{1};
  std::uint8_t front_{2};
  std::atomic<std::uint64_t> published_{0};
};

}  // namespace flicker
