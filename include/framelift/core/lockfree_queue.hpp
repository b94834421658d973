#pragma once

#include <atomic>
#include <bit>
#include <cstddef>
#include <memory>
#include <new>
#include <optional>

namespace framelift {

// Fixed-size ring shared by many producers and drained by one consumer.
// Each cell carries a ticket: equal to the write position when free, one past
// it when filled. Capacity is rounded up to a power of two.
template <typename T>
class BoundedMPSCQueue {
public:
  explicit BoundedMPSCQueue(std::size_t capacity)
      : mask_(std::bit_ceil(capacity) - 1),
        cells_(std::make_unique<Cell[]>(mask_ + 1)) {
    for (std::size_t i = 0; i <= mask_; ++i) {
      cells_[i].ticket.store(i, std::memory_order_relaxed);
    }
  }

  ~BoundedMPSCQueue() {
    while (try_pop()) {
    }
  }

  BoundedMPSCQueue(const BoundedMPSCQueue&) = delete;
  BoundedMPSCQueue& operator=(const BoundedMPSCQueue&) = delete;

  // False when full; value is left untouched in that case.
  [[nodiscard]] auto push(T&& value) noexcept -> bool {
    auto pos = write_pos_.load(std::memory_order_relaxed);
    for (;;) {
      auto& cell = cells_[pos & mask_];
      auto ticket = cell.ticket.load(std::memory_order_acquire);
      if (ticket == pos) {
        if (write_pos_.compare_exchange_weak(pos, pos + 1,
                                             std::memory_order_acq_rel,
                                             std::memory_order_relaxed)) {
          std::construct_at(cell.value(), std::move(value));
          cell.ticket.store(pos + 1, std::memory_order_release);
          return true;
        }
      } else if (ticket < pos) {
        return false;
      } else {
        pos = write_pos_.load(std::memory_order_relaxed);
      }
    }
  }

  // Consumer thread only.
  [[nodiscard]] auto try_pop() noexcept -> std::optional<T> {
    auto& cell = cells_[read_pos_ & mask_];
    if (cell.ticket.load(std::memory_order_acquire) != read_pos_ + 1) {
      return std::nullopt;
    }
    std::optional<T> out(std::move(*cell.value()));
    std::destroy_at(cell.value());
    cell.ticket.store(read_pos_ + mask_ + 1, std::memory_order_release);
    ++read_pos_;
    return out;
  }

private:
  struct Cell {
    std::atomic<std::size_t> ticket;
    alignas(T) std::byte storage[sizeof(T)];

    auto value() noexcept -> T* {
      return std::launder(reinterpret_cast<T*>(storage));
    }
  };

  std::size_t mask_;
  std::unique_ptr<Cell[]> cells_;
  alignas(64) std::atomic<std::size_t> write_pos_{0};
  alignas(64) std::size_t read_pos_{0};
};

}  // namespace framelift
