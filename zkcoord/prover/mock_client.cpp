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

#include <utility>

#include <absl/cleanup/cleanup.h>
#include <absl/strings/str_cat.h>

#include <zkcoord/common/ensure.hpp>
#include <zkcoord/common/log.hpp>

namespace zkcoord::prover {

MockClient::MockClient(std::string id, MockClientSettings settings)
    : id_{std::move(id)}, settings_{settings} {}

Proof MockClient::prove(const concurrency::CancellationSignal& signal, uint64_t batch_number) {
    bool expected_idle{false};
    ensure(busy_.compare_exchange_strong(expected_idle, true),
           [&]() { return "MockClient " + id_ + " already busy, cannot prove batch " + std::to_string(batch_number); });
    absl::Cleanup mark_idle = [this] { busy_.store(false); };

    const uint64_t job_number{++jobs_};
    ZKCOORD_TRACE << "MockClient::prove id=" << id_ << " batch=" << batch_number << " job=" << job_number;

    if (settings_.delay.count() > 0) {
        (void)signal.wait_for(settings_.delay);
    }
    signal.throw_if_cancelled();

    if (settings_.fail_every != 0 && job_number % settings_.fail_every == 0) {
        ++failures_;
        throw ProverError{id_, absl::StrCat("proof generation failed on ", id_, " for batch ", batch_number)};
    }

    return Proof{batch_number, id_, absl::StrCat("proof:", id_, ":", batch_number)};
}

}  // namespace zkcoord::prover
