/*
   Copyright 2026 The Zkcoord Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#include "cancellation_signal.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <utility>

#include <boost/signals2/signal.hpp>
#include <boost/system/error_code.hpp>

namespace zkcoord::concurrency {

//! Held by shared_ptr: links from a parent signal keep only a weak reference to it
struct CancellationSignal::State {
    bool cancel() {
        {
            std::scoped_lock lock{mutex};
            if (cancelled) {
                return false;
            }
            cancelled = true;
        }
        cancelled_cv.notify_all();
        on_cancel();
        on_cancel.disconnect_all_slots();
        return true;
    }

    std::atomic_bool cancelled{false};
    std::mutex mutex;
    std::condition_variable cancelled_cv;
    boost::signals2::signal<void()> on_cancel;
};

CancellationSignal::CancellationSignal() : state_{std::make_shared<State>()} {}

CancellationSignal::~CancellationSignal() = default;

bool CancellationSignal::cancel() { return state_->cancel(); }

bool CancellationSignal::is_cancelled() const { return state_->cancelled.load(); }

boost::signals2::scoped_connection CancellationSignal::subscribe(Callback callback) const {
    std::unique_lock lock{state_->mutex};
    if (state_->cancelled) {
        lock.unlock();
        callback();
        return {};
    }
    // Connecting under the lock: cancel() either sees this slot or we have seen its flag
    return boost::signals2::scoped_connection{state_->on_cancel.connect(std::move(callback))};
}

void CancellationSignal::link_to(const CancellationSignal& parent) {
    std::weak_ptr<State> child_state{state_};
    auto link = parent.subscribe([child_state]() {
        if (auto state = child_state.lock()) {
            state->cancel();
        }
    });
    std::scoped_lock lock{parent_link_mutex_};
    parent_link_ = std::move(link);
}

bool CancellationSignal::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock lock{state_->mutex};
    return state_->cancelled_cv.wait_for(lock, timeout, [&] { return state_->cancelled.load(); });
}

void CancellationSignal::wait() const {
    std::unique_lock lock{state_->mutex};
    state_->cancelled_cv.wait(lock, [&] { return state_->cancelled.load(); });
}

void CancellationSignal::throw_if_cancelled() const {
    if (is_cancelled()) {
        throw make_cancelled_error();
    }
}

boost::system::system_error make_cancelled_error() {
    return boost::system::system_error{make_error_code(boost::system::errc::operation_canceled)};
}

bool is_cancelled_error(const boost::system::system_error& error) {
    return error.code() == boost::system::errc::operation_canceled;
}

bool is_cancelled_error(const std::exception_ptr& ex_ptr) {
    if (!ex_ptr) {
        return false;
    }
    try {
        std::rethrow_exception(ex_ptr);
    } catch (const boost::system::system_error& e) {
        return is_cancelled_error(e);
    } catch (...) {
        return false;
    }
}

}  // namespace zkcoord::concurrency
