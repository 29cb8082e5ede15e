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

#ifndef ZKCOORD_CONCURRENCY_SHUTDOWN_SIGNAL_HPP_
#define ZKCOORD_CONCURRENCY_SHUTDOWN_SIGNAL_HPP_

#include <csignal>
#include <functional>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <zkcoord/concurrency/cancellation_signal.hpp>

namespace zkcoord::concurrency {

//! \brief Intercepts process termination requests (SIGINT, SIGTERM) on the given io_context
class ShutdownSignal {
  public:
    explicit ShutdownSignal(boost::asio::io_context& io_context) : signals_(io_context, SIGINT, SIGTERM) {}

    //! \brief Stops waiting for signals; the pending callback (if any) is never called
    void cancel();

    using SignalNumber = int;

    //! \brief Invokes \p callback on the io_context thread when the first termination signal arrives
    void on_signal(std::function<void(SignalNumber)> callback);

    //! \brief Cancels \p cancellation when the first termination signal arrives
    void cancel_on_signal(CancellationSignal& cancellation);

  private:
    boost::asio::signal_set signals_;
};

}  // namespace zkcoord::concurrency

#endif  // ZKCOORD_CONCURRENCY_SHUTDOWN_SIGNAL_HPP_
