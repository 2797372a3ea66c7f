#include "epubkit/core/CancellationToken.hpp"

namespace epubkit {
namespace core {

CancellationSource::CancellationSource()
    : flag_(std::make_shared<std::atomic<bool>>(false)) {
}

void CancellationSource::cancel() noexcept {
    flag_->store(true, std::memory_order_release);
}

bool CancellationSource::isCancelled() const noexcept {
    return flag_->load(std::memory_order_acquire);
}

CancellationToken CancellationSource::token() const {
    return CancellationToken(flag_);
}

CancellationToken CancellationToken::withDeadline(Clock::time_point deadline) const {
    CancellationToken copy(*this);
    // 已有更早的截止时间时保留更早的那个
    if (!copy.deadline_ || deadline < *copy.deadline_) {
        copy.deadline_ = deadline;
    }
    return copy;
}

CancellationToken CancellationToken::withTimeout(Clock::duration timeout) const {
    return withDeadline(Clock::now() + timeout);
}

bool CancellationToken::deadlineExceeded() const noexcept {
    return deadline_ && Clock::now() >= *deadline_;
}

bool CancellationToken::isCancelled() const noexcept {
    if (flag_ && flag_->load(std::memory_order_acquire)) {
        return true;
    }
    return deadlineExceeded();
}

VoidResult CancellationToken::check() const {
    if (flag_ && flag_->load(std::memory_order_acquire)) {
        return makeError(ErrorCode::Cancelled, "operation cancelled");
    }
    if (deadlineExceeded()) {
        return makeError(ErrorCode::Cancelled, "deadline exceeded");
    }
    return success();
}

}} // namespace epubkit::core
