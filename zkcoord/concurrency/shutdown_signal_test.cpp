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

#include "shutdown_signal.hpp"

#include <csignal>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <catch2/catch.hpp>

#include <zkcoord/common/log.hpp>
#include <zkcoord/test/log.hpp>

namespace zkcoord::concurrency {

TEST_CASE("ShutdownSignal", "[zkcoord][concurrency][shutdown_signal]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    boost::asio::io_context io_context;
    ShutdownSignal shutdown_signal{io_context};

    SECTION("SIGINT cancels the signal") {
        CancellationSignal cancellation;
        shutdown_signal.cancel_on_signal(cancellation);
        std::raise(SIGINT);
        io_context.run();
        CHECK(cancellation.is_cancelled());
    }

    SECTION("SIGTERM invokes the callback with the signal number") {
        ShutdownSignal::SignalNumber caught{0};
        shutdown_signal.on_signal([&](ShutdownSignal::SignalNumber number) { caught = number; });
        std::raise(SIGTERM);
        io_context.run();
        CHECK(caught == SIGTERM);
    }

    SECTION("cancel drops the pending callback") {
        CancellationSignal cancellation;
        shutdown_signal.cancel_on_signal(cancellation);
        boost::asio::post(io_context, [&]() { shutdown_signal.cancel(); });
        io_context.run();
        CHECK(!cancellation.is_cancelled());
    }
}

}  // namespace zkcoord::concurrency
