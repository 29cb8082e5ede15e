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

#ifndef ZKCOORD_COORDINATOR_PROVER_POOL_HPP_
#define ZKCOORD_COORDINATOR_PROVER_POOL_HPP_

#include <cstddef>
#include <memory>
#include <optional>

#include <absl/container/flat_hash_set.h>
#include <boost/circular_buffer.hpp>
#include <boost/signals2/connection.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/mutex.hpp>

#include <zkcoord/concurrency/cancellation_signal.hpp>
#include <zkcoord/coordinator/settings.hpp>
#include <zkcoord/prover/client.hpp>

namespace zkcoord::coordinator {

/**
 * @class ProverPool
 * @brief Bounded pool arbitrating exclusive access to a set of prover clients.
 * Provers are handed out by get() and given back by release(): while checked out a prover belongs to the caller only,
 * no other get() can return it before its release. The number of provers resident in the pool (available plus checked
 * out) never exceeds the capacity fixed at construction.
 * Both get() and add() block while they cannot proceed and return promptly when the caller's CancellationSignal fires
 * or the pool is closed. A cancelled call leaves the pool untouched.
 * Misuse (releasing a prover not checked out, adding a prover twice) raises std::logic_error and changes nothing.
 * The class is thread-safe. A signal passed to get() or add() may be cancelled from any thread, even while the pool
 * is being destroyed.
 */
class ProverPool {
  public:
    explicit ProverPool(std::size_t capacity);
    explicit ProverPool(const ProverPoolSettings& settings) : ProverPool(settings.max_server_proofs) {}

    ProverPool(const ProverPool&) = delete;
    ProverPool& operator=(const ProverPool&) = delete;

    //! \brief Inserts a new prover into the available set, waiting for room if the pool is full
    //! \return True if the prover has been stored, false if \p signal fired or the pool is closed
    //! \throws std::invalid_argument if \p prover is null, std::logic_error if \p prover is already in the pool
    bool add(const concurrency::CancellationSignal& signal, prover::ClientPtr prover);

    //! \brief Checks out the next available prover, waiting for one if none is available
    //! \throws boost::system::system_error with operation_canceled if \p signal fires (or already fired) or the
    //! pool is closed
    prover::ClientPtr get(const concurrency::CancellationSignal& signal);

    //! \brief Checks out the next available prover if any, without waiting
    std::optional<prover::ClientPtr> try_get();

    //! \brief Gives back a prover previously checked out by get() or try_get()
    //! \throws std::logic_error if \p prover is not currently checked out from this pool (e.g. double release)
    void release(const prover::ClientPtr& prover);

    //! \brief Drops a checked out prover for good (e.g. after a failure), leaving room for a replacement
    //! \throws std::logic_error if \p prover is not currently checked out from this pool
    void discard(const prover::ClientPtr& prover);

    //! \brief Closes the pool for good: blocked and future get() calls are cancelled, add() calls are refused
    //! \details Available provers are dropped, checked out provers may still be released or discarded
    void close();

    [[nodiscard]] std::size_t capacity() const { return capacity_; }

    //! Number of provers ready to be checked out
    [[nodiscard]] std::size_t available() const;

    //! Number of provers currently checked out
    [[nodiscard]] std::size_t checked_out() const;

    //! Number of provers owned by the pool (available plus checked out)
    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] bool is_closed() const;

  private:
    [[nodiscard]] bool is_full() const { return available_.size() + checked_out_.size() >= capacity_; }
    [[nodiscard]] bool is_resident(const prover::Client* prover) const;

    //! Removes the front available prover and marks it as checked out (lock must be held)
    prover::ClientPtr check_out_front();

    //! Forgets a checked out prover (lock must be held)
    void check_in(const prover::ClientPtr& prover, const char* operation);

    //! Subscribes to \p signal a wake-up of all waiters, which stays harmless after the pool is gone
    [[nodiscard]] boost::signals2::scoped_connection wake_up_on(const concurrency::CancellationSignal& signal) const;

    //! Synchronization primitives, shared with the cancellation callbacks
    struct WaitState {
        boost::mutex mutex;
        boost::condition_variable not_empty;
        boost::condition_variable not_full;
    };

    const std::size_t capacity_;
    boost::circular_buffer<prover::ClientPtr> available_;
    absl::flat_hash_set<const prover::Client*> checked_out_;
    bool closed_{false};
    std::shared_ptr<WaitState> wait_state_;
    boost::mutex& mutex_;
    boost::condition_variable& not_empty_;
    boost::condition_variable& not_full_;
};

}  // namespace zkcoord::coordinator

#endif  // ZKCOORD_COORDINATOR_PROVER_POOL_HPP_
