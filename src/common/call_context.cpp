#include "common/call_context.hpp"

namespace sessionguard {
namespace common {

CallContext::CallContext() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

CallContext CallContext::Background() {
    return CallContext();
}

CallContext CallContext::WithDeadline(TimePoint deadline) {
    CallContext ctx;
    ctx.deadline_ = deadline;
    return ctx;
}

CallContext CallContext::WithTimeout(std::chrono::milliseconds timeout) {
    return WithDeadline(std::chrono::steady_clock::now() + timeout);
}

void CallContext::Cancel() const {
    cancelled_->store(true, std::memory_order_release);
}

bool CallContext::IsCancelled() const {
    return cancelled_->load(std::memory_order_acquire);
}

bool CallContext::IsExpired() const {
    return deadline_.has_value() && std::chrono::steady_clock::now() >= *deadline_;
}

Status CallContext::Check() const {
    if (IsCancelled()) {
        return Status::Cancelled("Operation cancelled by caller");
    }
    if (IsExpired()) {
        return Status::DeadlineExceeded("Operation deadline exceeded");
    }
    return Status::OK();
}

}
}
