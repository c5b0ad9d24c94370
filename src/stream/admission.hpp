#pragma once

#include "rangegate/common.hpp"
#include <memory>
#include <mutex>

namespace rangegate::stream {

class AdmissionController;

/**
 * StreamSlot - Scoped hold on one admission slot
 *
 * Move-only. The slot is returned to its controller exactly once: on
 * release() or on destruction, whichever comes first. An empty slot
 * (rejected acquisition) releases nothing.
 */
class StreamSlot {
public:
    StreamSlot() = default;
    ~StreamSlot();

    StreamSlot(StreamSlot&& other) noexcept;
    StreamSlot& operator=(StreamSlot&& other) noexcept;
    RANGEGATE_DISALLOW_COPY(StreamSlot);

    bool granted() const { return owner_ != nullptr; }
    explicit operator bool() const { return granted(); }

    void release();

private:
    friend class AdmissionController;
    explicit StreamSlot(std::shared_ptr<AdmissionController> owner)
        : owner_(std::move(owner)) {}

    std::shared_ptr<AdmissionController> owner_;
};

/**
 * AdmissionController - Bounded count of concurrently active streams
 *
 * Must be owned by a std::shared_ptr; granted slots keep it alive.
 */
class AdmissionController : public std::enable_shared_from_this<AdmissionController> {
public:
    /**
     * @param capacity Maximum simultaneously held slots (at least 1)
     */
    explicit AdmissionController(size_t capacity);

    /**
     * Take a slot if one is free; an empty StreamSlot means "server busy"
     */
    StreamSlot try_acquire();

    size_t active() const;
    size_t capacity() const { return capacity_; }

    struct Statistics {
        size_t granted{0};
        size_t rejected{0};
        size_t released{0};
        size_t peak_active{0};
    };

    Statistics get_statistics() const;

private:
    friend class StreamSlot;
    void release();

    const size_t capacity_;

    mutable std::mutex mutex_;
    size_t active_{0};
    Statistics stats_;
};

} // namespace rangegate::stream
