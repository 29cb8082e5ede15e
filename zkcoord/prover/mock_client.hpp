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

#ifndef ZKCOORD_PROVER_MOCK_CLIENT_HPP_
#define ZKCOORD_PROVER_MOCK_CLIENT_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include <zkcoord/prover/client.hpp>

namespace zkcoord::prover {

struct MockClientSettings {
    std::chrono::milliseconds delay{0};  // Simulated proving time
    uint32_t fail_every{0};              // Every n-th job fails with ProverError (0 means never)
};

//! \brief In-process prover simulating proof generation
//! \details Overlapping prove() calls are rejected with std::logic_error: they mean exclusive access is broken
class MockClient : public Client {
  public:
    explicit MockClient(std::string id, MockClientSettings settings = {});

    [[nodiscard]] const std::string& id() const override { return id_; }

    Proof prove(const concurrency::CancellationSignal& signal, uint64_t batch_number) override;

    //! Number of prove() calls started
    [[nodiscard]] uint64_t jobs() const { return jobs_.load(); }

    //! Number of prove() calls failed with ProverError
    [[nodiscard]] uint64_t failures() const { return failures_.load(); }

    [[nodiscard]] bool is_busy() const { return busy_.load(); }

  private:
    std::string id_;
    MockClientSettings settings_;
    std::atomic_uint64_t jobs_{0};
    std::atomic_uint64_t failures_{0};
    std::atomic_bool busy_{false};
};

}  // namespace zkcoord::prover

#endif  // ZKCOORD_PROVER_MOCK_CLIENT_HPP_
