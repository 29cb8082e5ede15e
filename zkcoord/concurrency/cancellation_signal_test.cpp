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
#include <chrono>
#include <stdexcept>
#include <thread>

#include <boost/system/error_code.hpp>
#include <catch2/catch.hpp>

namespace zkcoord::concurrency {

using namespace std::chrono_literals;

TEST_CASE("CancellationSignal", "[zkcoord][concurrency][cancellation_signal]") {
    CancellationSignal signal;

    SECTION("not cancelled at construction") {
        CHECK(!signal.is_cancelled());
        CHECK_NOTHROW(signal.throw_if_cancelled());
    }

    SECTION("cancel is idempotent") {
        CHECK(signal.cancel());
        CHECK(signal.is_cancelled());
        CHECK(!signal.cancel());
        CHECK(signal.is_cancelled());
    }

    SECTION("throw_if_cancelled raises the cancelled error") {
        signal.cancel();
        try {
            signal.throw_if_cancelled();
            FAIL("expected cancelled error");
        } catch (const boost::system::system_error& e) {
            CHECK(e.code() == boost::system::errc::operation_canceled);
            CHECK(is_cancelled_error(e));
        }
    }

    SECTION("subscribed callback runs once on cancel") {
        int calls{0};
        const auto connection = signal.subscribe([&]() { ++calls; });
        CHECK(calls == 0);
        signal.cancel();
        CHECK(calls == 1);
        signal.cancel();
        CHECK(calls == 1);
    }

    SECTION("subscribe after cancel runs the callback immediately") {
        signal.cancel();
        int calls{0};
        const auto connection = signal.subscribe([&]() { ++calls; });
        CHECK(calls == 1);
    }

    SECTION("dropped subscription is not called") {
        int calls{0};
        {
            const auto connection = signal.subscribe([&]() { ++calls; });
        }
        signal.cancel();
        CHECK(calls == 0);
    }

    SECTION("wait_for times out when not cancelled") {
        const auto start{std::chrono::steady_clock::now()};
        CHECK(!signal.wait_for(20ms));
        CHECK(std::chrono::steady_clock::now() - start >= 20ms);
    }

    SECTION("wait_for returns promptly on cancel from another thread") {
        std::thread canceller{[&]() {
            std::this_thread::sleep_for(20ms);
            signal.cancel();
        }};
        const auto start{std::chrono::steady_clock::now()};
        CHECK(signal.wait_for(10s));
        CHECK(std::chrono::steady_clock::now() - start < 5s);
        canceller.join();
    }

    SECTION("wait returns once cancelled") {
        std::thread canceller{[&]() { signal.cancel(); }};
        signal.wait();
        CHECK(signal.is_cancelled());
        canceller.join();
    }
}

TEST_CASE("CancellationSignal link_to", "[zkcoord][concurrency][cancellation_signal]") {
    CancellationSignal parent;

    SECTION("parent cancellation propagates to child") {
        CancellationSignal child;
        child.link_to(parent);
        int child_calls{0};
        const auto connection = child.subscribe([&]() { ++child_calls; });
        parent.cancel();
        CHECK(child.is_cancelled());
        CHECK(child_calls == 1);
    }

    SECTION("child cancellation does not propagate to parent") {
        CancellationSignal child;
        child.link_to(parent);
        child.cancel();
        CHECK(child.is_cancelled());
        CHECK(!parent.is_cancelled());
    }

    SECTION("linking to an already cancelled parent cancels the child") {
        parent.cancel();
        CancellationSignal child;
        child.link_to(parent);
        CHECK(child.is_cancelled());
    }

    SECTION("parent may outlive the child") {
        {
            CancellationSignal child;
            child.link_to(parent);
        }
        CHECK(parent.cancel());
    }

    SECTION("child may outlive the parent") {
        CancellationSignal child;
        {
            CancellationSignal short_lived_parent;
            child.link_to(short_lived_parent);
        }
        CHECK(!child.is_cancelled());
        CHECK(child.cancel());
    }
}

TEST_CASE("CancellationSignal concurrent link_to", "[zkcoord][concurrency][cancellation_signal]") {
    CancellationSignal parent1;
    CancellationSignal parent2;
    CancellationSignal child;

    std::thread linker1{[&]() {
        for (int i{0}; i < 1000; ++i) child.link_to(parent1);
    }};
    std::thread linker2{[&]() {
        for (int i{0}; i < 1000; ++i) child.link_to(parent2);
    }};
    linker1.join();
    linker2.join();
    CHECK(!child.is_cancelled());

    // The last link made wins, whichever thread made it
    parent1.cancel();
    parent2.cancel();
    CHECK(child.is_cancelled());
}

TEST_CASE("is_cancelled_error", "[zkcoord][concurrency][cancellation_signal]") {
    CHECK(is_cancelled_error(make_cancelled_error()));
    CHECK(!is_cancelled_error(boost::system::system_error{make_error_code(boost::system::errc::timed_out)}));

    CHECK(is_cancelled_error(std::make_exception_ptr(make_cancelled_error())));
    CHECK(!is_cancelled_error(std::make_exception_ptr(std::runtime_error{"failure"})));
    CHECK(!is_cancelled_error(std::exception_ptr{}));
}

}  // namespace zkcoord::concurrency
