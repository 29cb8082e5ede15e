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

#include "mock_client.hpp"

#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

#include <catch2/catch.hpp>

#include <zkcoord/common/log.hpp>
#include <zkcoord/test/log.hpp>

namespace zkcoord::prover {

using namespace std::chrono_literals;

TEST_CASE("MockClient", "[zkcoord][prover][mock_client]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    concurrency::CancellationSignal signal;

    SECTION("proves batches") {
        MockClient client{"prover-0"};
        const auto proof = client.prove(signal, 42);
        CHECK(proof.batch_number == 42);
        CHECK(proof.prover_id == "prover-0");
        CHECK(proof.data == "proof:prover-0:42");
        CHECK(client.jobs() == 1);
        CHECK(client.failures() == 0);
        CHECK(!client.is_busy());
    }

    SECTION("fails every n-th job") {
        MockClient client{"prover-1", {.fail_every = 2}};
        CHECK_NOTHROW(client.prove(signal, 1));
        CHECK_THROWS_AS(client.prove(signal, 2), ProverError);
        CHECK_NOTHROW(client.prove(signal, 3));
        try {
            client.prove(signal, 4);
            FAIL("expected ProverError");
        } catch (const ProverError& e) {
            CHECK(e.prover_id() == "prover-1");
        }
        CHECK(client.jobs() == 4);
        CHECK(client.failures() == 2);
        CHECK(!client.is_busy());
    }

    SECTION("cancelled while proving") {
        MockClient client{"prover-2", {.delay = 10s}};
        auto job = std::async(std::launch::async, [&]() { return client.prove(signal, 7); });
        std::this_thread::sleep_for(20ms);
        signal.cancel();
        CHECK_THROWS_AS(job.get(), boost::system::system_error);
        CHECK(!client.is_busy());
    }

    SECTION("overlapping jobs are rejected") {
        MockClient client{"prover-3", {.delay = 10s}};
        auto job = std::async(std::launch::async, [&]() { return client.prove(signal, 1); });
        while (!client.is_busy()) {
            std::this_thread::yield();
        }
        CHECK_THROWS_AS(client.prove(signal, 2), std::logic_error);
        CHECK(client.is_busy());
        signal.cancel();
        CHECK_THROWS_AS(job.get(), boost::system::system_error);
    }
}

}  // namespace zkcoord::prover
