#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>

#include "engine/NoteEvent.h"

namespace engine {

// Bounded lock-free ring, any number of producers and one consumer.
// Each cell carries a sequence number: producers claim a slot with a CAS on
// head_ and publish by bumping the cell sequence; the consumer owns tail_.
template <typename T, std::size_t Capacity>
class MpscRing {
public:
    static_assert(Capacity >= 2, "Capacity too small");
    static_assert((Capacity & (Capacity - 1)) == 0, "Capacity must be power of two");

    MpscRing() {
        for (std::size_t i = 0; i < Capacity; ++i) {
            cells_[i].sequence.store(i, std::memory_order_relaxed);
        }
    }

    MpscRing(const MpscRing&) = delete;
    MpscRing& operator=(const MpscRing&) = delete;

    // Never blocks. Returns false when the ring is full.
    bool push(const T& value) {
        std::size_t head = head_.load(std::memory_order_relaxed);
        for (;;) {
            Cell& cell = cells_[head & (Capacity - 1)];
            const std::size_t sequence = cell.sequence.load(std::memory_order_acquire);
            const auto diff = static_cast<std::intptr_t>(sequence) - static_cast<std::intptr_t>(head);
            if (diff == 0) {
                if (head_.compare_exchange_weak(head, head + 1, std::memory_order_relaxed)) {
                    cell.value = value;
                    cell.sequence.store(head + 1, std::memory_order_release);
                    return true;
                }
            } else if (diff < 0) {
                return false;
            } else {
                head = head_.load(std::memory_order_relaxed);
            }
        }
    }

    // Consumer thread only.
    bool pop(T& out) {
        const std::size_t tail = tail_.load(std::memory_order_relaxed);
        Cell& cell = cells_[tail & (Capacity - 1)];
        const std::size_t sequence = cell.sequence.load(std::memory_order_acquire);
        if (sequence != tail + 1) {
            return false;
        }
        out = cell.value;
        cell.sequence.store(tail + Capacity, std::memory_order_release);
        tail_.store(tail + 1, std::memory_order_relaxed);
        return true;
    }

    static constexpr std::size_t capacity() { return Capacity; }

private:
    struct Cell {
        std::atomic<std::size_t> sequence{0};
        T value{};
    };

    std::array<Cell, Capacity> cells_{};
    alignas(64) std::atomic<std::size_t> head_{0};
    alignas(64) std::atomic<std::size_t> tail_{0};
};

// Producer endpoint shared between MIDI/UI threads and the audio callback.
class NoteQueue {
public:
    static constexpr std::size_t kCapacity = 1024;

    bool trySend(const NoteEvent& event) { return ring_.push(event); }
    bool tryReceive(NoteEvent& event) { return ring_.pop(event); }

private:
    MpscRing<NoteEvent, kCapacity> ring_;
};

}  // namespace engine
