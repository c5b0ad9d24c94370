#include "admission.hpp"
#include "rangegate/error.hpp"
#include "utils/logger.hpp"
#include <algorithm>

namespace rangegate::stream {

StreamSlot::~StreamSlot() {
    release();
}

StreamSlot::StreamSlot(StreamSlot&& other) noexcept
    : owner_(std::move(other.owner_))
{
    other.owner_.reset();
}

StreamSlot& StreamSlot::operator=(StreamSlot&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = std::move(other.owner_);
        other.owner_.reset();
    }
    return *this;
}

void StreamSlot::release() {
    if (owner_) {
        auto owner = std::move(owner_);
        owner_.reset();
        owner->release();
    }
}

AdmissionController::AdmissionController(size_t capacity)
    : capacity_(capacity)
{
    if (capacity_ == 0) {
        throw ConfigException("max_concurrent_streams must be at least 1");
    }
}

StreamSlot AdmissionController::try_acquire() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_ >= capacity_) {
            stats_.rejected++;
            RANGEGATE_LOG_DEBUG("Admission rejected ({}/{} streams active)",
                                active_, capacity_);
            return StreamSlot();
        }
        active_++;
        stats_.granted++;
        stats_.peak_active = std::max(stats_.peak_active, active_);
    }
    return StreamSlot(shared_from_this());
}

void AdmissionController::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ == 0) {
        RANGEGATE_LOG_ERROR("Admission slot released with no active streams");
        return;
    }
    active_--;
    stats_.released++;
}

size_t AdmissionController::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

AdmissionController::Statistics AdmissionController::get_statistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace rangegate::stream
