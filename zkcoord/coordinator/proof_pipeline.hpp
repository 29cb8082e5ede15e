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

#ifndef ZKCOORD_COORDINATOR_PROOF_PIPELINE_HPP_
#define ZKCOORD_COORDINATOR_PROOF_PIPELINE_HPP_

#include <cstdint>
#include <optional>
#include <vector>

#include <zkcoord/concurrency/cancellation_signal.hpp>
#include <zkcoord/coordinator/prover_pool.hpp>
#include <zkcoord/coordinator/settings.hpp>
#include <zkcoord/prover/client.hpp>

namespace zkcoord::coordinator {

struct PipelineReport {
    uint64_t proved_batches{0};
    uint64_t failed_batches{0};      // Batches given up after max_attempts failures
    uint64_t skipped_batches{0};     // Batches never completed because the run stopped early
    uint64_t failed_attempts{0};
    uint64_t discarded_provers{0};
    bool cancelled{false};           // Stopped by the caller's signal
    bool out_of_provers{false};      // Stopped because every prover has been discarded
    std::vector<prover::Proof> proofs;  // Sorted by batch number
};

//! \brief Proves a range of batches delegating each one to a prover taken from the pool
//! \details Every worker repeatedly takes the next batch, checks out a prover, proves the batch and gives the prover
//! back. Provers failing a job are either returned or discarded as configured and the batch is retried.
class ProofPipeline {
  public:
    ProofPipeline(ProverPool& pool, PipelineSettings settings);

    ProofPipeline(const ProofPipeline&) = delete;
    ProofPipeline& operator=(const ProofPipeline&) = delete;

    //! \brief Proves batches [first_batch, first_batch + num_batches) and blocks until done or stopped
    //! \remarks Any unexpected exception raised by a worker is rethrown here after all workers have completed
    //! \throws std::invalid_argument if the batch range exceeds the uint64_t domain
    PipelineReport run(const concurrency::CancellationSignal& signal, uint64_t first_batch, uint64_t num_batches);

  private:
    struct Run;

    enum class Outcome { kProved, kFailed, kStopped };

    void work(Run& run);
    static std::optional<uint64_t> claim_batch(Run& run);
    Outcome prove_batch(Run& run, uint64_t batch_number);

    ProverPool& pool_;
    PipelineSettings settings_;
};

}  // namespace zkcoord::coordinator

#endif  // ZKCOORD_COORDINATOR_PROOF_PIPELINE_HPP_
