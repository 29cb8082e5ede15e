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

#include "prover_pool.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <utility>

#include <boost/thread/lock_guard.hpp>
#include <boost/thread/lock_types.hpp>

#include <zkcoord/common/ensure.hpp>
#include <zkcoord/common/log.hpp>

namespace zkcoord::coordinator {

static std::string prover_name(const prover::ClientPtr& prover) {
    return prover ? prover->id() : std::string{"<null>"};
}

ProverPool::ProverPool(std::size_t capacity)
    : capacity_{capacity},
      available_(capacity),
      wait_state_{std::make_shared<WaitState>()},
      mutex_{wait_state_->mutex},
      not_empty_{wait_state_->not_empty},
      not_full_{wait_state_->not_full} {
    checked_out_.reserve(capacity);
}

bool ProverPool::add(const concurrency::CancellationSignal& signal, prover::ClientPtr prover) {
    ensure_pre_condition(prover != nullptr, []() { return "ProverPool::add null prover"; });
    if (signal.is_cancelled()) {
        return false;
    }
    const auto cancellation = wake_up_on(signal);

    boost::unique_lock<boost::mutex> lock{mutex_};
    ensure(!is_resident(prover.get()), [&]() { return "ProverPool::add prover " + prover->id() + " already in pool"; });

    not_full_.wait(lock, [&] { return closed_ || signal.is_cancelled() || !is_full(); });
    if (closed_ || signal.is_cancelled()) {
        // Pass on a wake-up we may have consumed
        if (!closed_ && !is_full()) not_full_.notify_one();
        ZKCOORD_DEBUG << "ProverPool::add cancelled prover=" << prover->id() << " closed=" << closed_;
        return false;
    }
    // A concurrent add of the same prover may have won the race while we were waiting
    ensure(!is_resident(prover.get()), [&]() { return "ProverPool::add prover " + prover->id() + " already in pool"; });

    ZKCOORD_TRACE << "ProverPool::add prover=" << prover->id() << " available=" << available_.size() + 1;
    available_.push_back(std::move(prover));
    lock.unlock();
    not_empty_.notify_one();
    return true;
}

prover::ClientPtr ProverPool::get(const concurrency::CancellationSignal& signal) {
    signal.throw_if_cancelled();
    const auto cancellation = wake_up_on(signal);

    boost::unique_lock<boost::mutex> lock{mutex_};
    not_empty_.wait(lock, [&] { return closed_ || signal.is_cancelled() || !available_.empty(); });
    if (closed_ || signal.is_cancelled()) {
        if (!closed_ && !available_.empty()) not_empty_.notify_one();
        ZKCOORD_DEBUG << "ProverPool::get cancelled closed=" << closed_;
        throw concurrency::make_cancelled_error();
    }
    return check_out_front();
}

std::optional<prover::ClientPtr> ProverPool::try_get() {
    boost::unique_lock<boost::mutex> lock{mutex_};
    if (closed_ || available_.empty()) {
        return std::nullopt;
    }
    return check_out_front();
}

void ProverPool::release(const prover::ClientPtr& prover) {
    boost::unique_lock<boost::mutex> lock{mutex_};
    check_in(prover, "release");
    if (closed_) {
        ZKCOORD_DEBUG << "ProverPool::release prover=" << prover->id() << " dropped, pool closed";
        return;
    }
    available_.push_back(prover);
    ZKCOORD_TRACE << "ProverPool::release prover=" << prover->id() << " available=" << available_.size();
    lock.unlock();
    not_empty_.notify_one();
}

void ProverPool::discard(const prover::ClientPtr& prover) {
    boost::unique_lock<boost::mutex> lock{mutex_};
    check_in(prover, "discard");
    ZKCOORD_DEBUG << "ProverPool::discard prover=" << prover->id() << " size=" << available_.size() + checked_out_.size();
    lock.unlock();
    not_full_.notify_one();
}

void ProverPool::close() {
    boost::unique_lock<boost::mutex> lock{mutex_};
    if (closed_) {
        return;
    }
    closed_ = true;
    available_.clear();
    lock.unlock();
    ZKCOORD_DEBUG << "ProverPool::close";
    not_empty_.notify_all();
    not_full_.notify_all();
}

std::size_t ProverPool::available() const {
    boost::unique_lock<boost::mutex> lock{mutex_};
    return available_.size();
}

std::size_t ProverPool::checked_out() const {
    boost::unique_lock<boost::mutex> lock{mutex_};
    return checked_out_.size();
}

std::size_t ProverPool::size() const {
    boost::unique_lock<boost::mutex> lock{mutex_};
    return available_.size() + checked_out_.size();
}

bool ProverPool::is_closed() const {
    boost::unique_lock<boost::mutex> lock{mutex_};
    return closed_;
}

bool ProverPool::is_resident(const prover::Client* prover) const {
    if (checked_out_.contains(prover)) {
        return true;
    }
    return std::any_of(available_.begin(), available_.end(), [&](const auto& p) { return p.get() == prover; });
}

prover::ClientPtr ProverPool::check_out_front() {
    auto prover{std::move(available_.front())};
    available_.pop_front();
    const bool inserted = checked_out_.insert(prover.get()).second;
    ensure_invariant(inserted, [&]() { return "ProverPool prover " + prover->id() + " checked out twice"; });
    ZKCOORD_TRACE << "ProverPool::get prover=" << prover->id() << " available=" << available_.size();
    return prover;
}

void ProverPool::check_in(const prover::ClientPtr& prover, const char* operation) {
    const auto it = checked_out_.find(prover.get());
    ensure(prover != nullptr && it != checked_out_.end(), [&]() {
        return std::string{"ProverPool::"} + operation + " prover " + prover_name(prover) + " not checked out";
    });
    checked_out_.erase(it);
}

boost::signals2::scoped_connection ProverPool::wake_up_on(const concurrency::CancellationSignal& signal) const {
    // The callback may still be running on the cancelling thread after the pool has been destroyed
    return signal.subscribe([state = std::weak_ptr<WaitState>{wait_state_}]() {
        const auto wait_state{state.lock()};
        if (!wait_state) {
            return;
        }
        // Taking the lock orders this wake-up after any waiter's predicate check
        { boost::lock_guard<boost::mutex> lock{wait_state->mutex}; }
        wait_state->not_empty.notify_all();
        wait_state->not_full.notify_all();
    });
}

}  // namespace zkcoord::coordinator
