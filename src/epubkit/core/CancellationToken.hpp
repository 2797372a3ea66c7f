#pragma once

#include "epubkit/core/Expected.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace epubkit {
namespace core {

class CancellationToken;

/**
 * @brief 取消信号的发起方
 *
 * 持有共享标志；由它派生的所有 CancellationToken 在 cancel() 后立即观察到取消。
 * 可以在另一个线程调用 cancel()，被取消的操作在下一个检查点返回 Cancelled。
 */
class CancellationSource {
public:
    CancellationSource();

    void cancel() noexcept;
    bool isCancelled() const noexcept;

    CancellationToken token() const;

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/**
 * @brief 取消信号的只读视图，可附带截止时间
 *
 * 默认构造的token永远不会被取消。检查是轮询式的，不会中断正在进行的I/O。
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;

    /**
     * @brief 返回一个在指定时间点之后视为已取消的副本
     */
    CancellationToken withDeadline(Clock::time_point deadline) const;

    /**
     * @brief 返回一个在 now + timeout 之后视为已取消的副本
     */
    CancellationToken withTimeout(Clock::duration timeout) const;

    bool isCancelled() const noexcept;
    bool deadlineExceeded() const noexcept;
    bool hasDeadline() const noexcept { return deadline_.has_value(); }

    /**
     * @brief 检查点：已取消返回 Cancelled 错误，否则成功
     *
     * 错误消息区分显式取消（"operation cancelled"）和超时（"deadline exceeded"）。
     */
    VoidResult check() const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag)
        : flag_(std::move(flag)) {}

    std::shared_ptr<const std::atomic<bool>> flag_;
    std::optional<Clock::time_point> deadline_;
};

}} // namespace epubkit::core
