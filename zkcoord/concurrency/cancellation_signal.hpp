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

#ifndef ZKCOORD_CONCURRENCY_CANCELLATION_SIGNAL_HPP_
#define ZKCOORD_CONCURRENCY_CANCELLATION_SIGNAL_HPP_

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>

#include <boost/signals2/connection.hpp>
#include <boost/system/system_error.hpp>

namespace zkcoord::concurrency {

//! \brief One-shot cancellation signal handed to every blocking operation.
//! Once fired it stays fired: blocking calls observing it must return promptly with the cancelled outcome.
//! \remarks Thread safe. All members are safe to call concurrently from any thread.
class CancellationSignal {
  public:
    using Callback = std::function<void()>;

    CancellationSignal();
    ~CancellationSignal();

    CancellationSignal(const CancellationSignal&) = delete;
    CancellationSignal& operator=(const CancellationSignal&) = delete;

    //! \brief Fires the signal and runs all subscribed callbacks
    //! \return True if this call fired the signal, false if it was already cancelled
    bool cancel();

    [[nodiscard]] bool is_cancelled() const;

    //! \brief Registers a callback invoked once when the signal fires (immediately if already fired)
    //! \return The registration: the callback is disconnected when it goes out of scope
    //! \warning Callbacks run on the thread calling cancel() and must not block
    [[nodiscard]] boost::signals2::scoped_connection subscribe(Callback callback) const;

    //! \brief Makes this signal a child of \p parent: cancelling the parent cancels this one, not vice versa
    //! \remarks Linking to another parent replaces the previous link
    void link_to(const CancellationSignal& parent);

    //! \brief Blocks the calling thread until cancellation or timeout
    //! \return True if cancelled, false on timeout
    bool wait_for(std::chrono::milliseconds timeout) const;

    //! \brief Blocks the calling thread until cancellation
    void wait() const;

    //! \brief Throws the cancelled error if the signal has fired
    void throw_if_cancelled() const;

  private:
    struct State;
    std::shared_ptr<State> state_;
    std::mutex parent_link_mutex_;
    boost::signals2::scoped_connection parent_link_;
};

//! \brief Builds the distinguished error raised by operations interrupted by a CancellationSignal
boost::system::system_error make_cancelled_error();

//! \brief Whether the given error is the cancelled outcome (i.e. not an actual failure)
bool is_cancelled_error(const boost::system::system_error& error);
bool is_cancelled_error(const std::exception_ptr& ex_ptr);

}  // namespace zkcoord::concurrency

#endif  // ZKCOORD_CONCURRENCY_CANCELLATION_SIGNAL_HPP_
