#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <new>
#include <utility>

namespace lf {

constexpr std::size_t CACHE_LINE_SIZE = 64;

// Bounded multi-producer/multi-consumer ring (sequence-numbered cells).
// The physical capacity is rounded up to a power of two.
template<typename _Tp>
class ArrayMPMCQueue {
public:
    explicit ArrayMPMCQueue(std::size_t capacity):
                    _M_C_capacity(align_pow_2(capacity == 0 ? 1 : capacity)),
                    _M_C_mask(_M_C_capacity - 1),
                    _M_data(static_cast<Cell*>(::operator new[](_M_C_capacity * sizeof(Cell),
                                                                std::align_val_t{CACHE_LINE_SIZE}))),
                    _M_head(0),
                    _M_tail(0) {
        for (std::size_t i = 0; i < _M_C_capacity; ++i) {
            new (&_M_data[i]) Cell();
            _M_data[i].seq.store(i, std::memory_order_relaxed);
        }
    }

    ~ArrayMPMCQueue() {
        clear();
        for (std::size_t i = 0; i < _M_C_capacity; ++i) {
            std::destroy_at(&_M_data[i]);
        }
        ::operator delete[](_M_data, std::align_val_t{CACHE_LINE_SIZE});
    }

    ArrayMPMCQueue(const ArrayMPMCQueue&) = delete;
    ArrayMPMCQueue& operator=(const ArrayMPMCQueue&) = delete;

    template<typename _Up>
    bool try_push(_Up&& val);
    bool try_pop(_Tp& out);

    // Drops every element still queued. Returns how many were dropped.
    std::size_t clear() {
        std::size_t dropped = 0;
        _Tp tmp;
        while (try_pop(tmp)) {
            ++dropped;
        }
        return dropped;
    }

    inline std::size_t capacity() const { return _M_C_capacity; }
    inline std::size_t size() const {
        std::size_t head = _M_head.load(std::memory_order_acquire);
        std::size_t tail = _M_tail.load(std::memory_order_acquire);
        // head may be observed after a concurrent pop moved it past our tail snapshot
        return tail > head ? tail - head : 0;
    }

    inline bool empty() const { return size() == 0; }
    inline bool full() const { return size() >= _M_C_capacity; }

private:
    static std::size_t align_pow_2(std::size_t num) {
        std::size_t ret = 1;
        while (ret < num) {
            ret <<= 1;
        }
        return ret;
    }

private:
    struct alignas(CACHE_LINE_SIZE) Cell {
        std::atomic<std::size_t> seq;
        alignas(_Tp) std::byte data[sizeof(_Tp)];
    };
    const std::size_t _M_C_capacity;
    const std::size_t _M_C_mask;
    Cell* const _M_data;

    alignas(CACHE_LINE_SIZE) std::atomic<std::size_t> _M_head;
    alignas(CACHE_LINE_SIZE) std::atomic<std::size_t> _M_tail;
};

template<typename _Tp>
template<typename _Up>
bool ArrayMPMCQueue<_Tp>::try_push(_Up&& val) {
    Cell* cell;
    std::size_t ticket = _M_tail.load(std::memory_order_relaxed);
    for(;;) {
        cell = &_M_data[ticket & _M_C_mask];
        std::size_t seq = cell->seq.load(std::memory_order_acquire);

        // seq == ticket: free cell
        // seq < ticket: previous lap not consumed yet, queue is full
        // seq > ticket: another producer took this ticket
        if (seq == ticket) {
            if (_M_tail.compare_exchange_weak(ticket, ticket + 1,
                                                std::memory_order_relaxed,
                                                std::memory_order_relaxed))
                break;
        } else if (seq < ticket) {
            return false;
        } else {
            ticket = _M_tail.load(std::memory_order_relaxed);
        }
    }

    new (&cell->data) _Tp(std::forward<_Up>(val));
    cell->seq.store(ticket + 1, std::memory_order_release);
    return true;
}

template<typename _Tp>
bool ArrayMPMCQueue<_Tp>::try_pop(_Tp& out) {
    Cell* cell;
    std::size_t ticket = _M_head.load(std::memory_order_relaxed);
    for (;;) {
        cell = &_M_data[ticket & _M_C_mask];
        std::size_t seq = cell->seq.load(std::memory_order_acquire);

        // seq == ticket + 1: holds data
        // seq == ticket: empty
        // otherwise another consumer got ahead
        if (seq == ticket + 1) {
            if (_M_head.compare_exchange_weak(ticket, ticket + 1,
                                                std::memory_order_relaxed,
                                                std::memory_order_relaxed))
                break;
        } else if (seq == ticket) {
            return false;
        } else {
            ticket = _M_head.load(std::memory_order_relaxed);
        }
    }

    _Tp* ptr = std::launder(reinterpret_cast<_Tp*>(&cell->data));
    out = std::move(*ptr);
    std::destroy_at(ptr);
    cell->seq.store(ticket + _M_C_capacity, std::memory_order_release);
    return true;
}

} // namespace lf
