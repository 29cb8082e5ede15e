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

#include "proof_pipeline.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <limits>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include <zkcoord/common/ensure.hpp>
#include <zkcoord/common/log.hpp>

namespace zkcoord::coordinator {

//! State shared by the workers of one run
struct ProofPipeline::Run {
    concurrency::CancellationSignal signal;  // Child of the caller signal, fired also when the run must stop
    uint64_t end_batch{0};
    std::atomic_uint64_t next_batch{0};
    std::mutex mutex;
    PipelineReport report;
    std::exception_ptr exception;
};

ProofPipeline::ProofPipeline(ProverPool& pool, PipelineSettings settings) : pool_{pool}, settings_{settings} {
    ensure_pre_condition(settings_.num_workers > 0, []() { return "ProofPipeline: num_workers must be positive"; });
    ensure_pre_condition(settings_.max_attempts > 0, []() { return "ProofPipeline: max_attempts must be positive"; });
}

PipelineReport ProofPipeline::run(const concurrency::CancellationSignal& signal, uint64_t first_batch,
                                  uint64_t num_batches) {
    ensure_pre_condition(num_batches <= std::numeric_limits<uint64_t>::max() - first_batch, [&]() {
        return "ProofPipeline: batch range starting at " + std::to_string(first_batch) + " with " +
               std::to_string(num_batches) + " batches overflows";
    });

    Run run;
    run.signal.link_to(signal);
    run.end_batch = first_batch + num_batches;
    run.next_batch = first_batch;

    log::Info("ProofPipeline started", {"workers", std::to_string(settings_.num_workers),
                                        "first_batch", std::to_string(first_batch),
                                        "batches", std::to_string(num_batches),
                                        "provers", std::to_string(pool_.size())});

    std::vector<std::thread> workers;
    workers.reserve(settings_.num_workers);
    for (uint32_t i{0}; i < settings_.num_workers; ++i) {
        workers.emplace_back([this, &run, i]() {
            log::set_thread_name(("pipeline-" + std::to_string(i)).c_str());
            try {
                work(run);
            } catch (...) {
                std::scoped_lock lock{run.mutex};
                if (!run.exception) {
                    run.exception = std::current_exception();
                }
                run.signal.cancel();
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    if (run.exception) {
        std::rethrow_exception(run.exception);
    }

    PipelineReport report{std::move(run.report)};
    report.cancelled = signal.is_cancelled();
    report.skipped_batches = num_batches - report.proved_batches - report.failed_batches;
    std::sort(report.proofs.begin(), report.proofs.end(),
              [](const auto& lhs, const auto& rhs) { return lhs.batch_number < rhs.batch_number; });

    log::Info("ProofPipeline completed", {"proved", std::to_string(report.proved_batches),
                                          "failed", std::to_string(report.failed_batches),
                                          "skipped", std::to_string(report.skipped_batches),
                                          "discarded_provers", std::to_string(report.discarded_provers),
                                          "cancelled", report.cancelled ? "true" : "false"});
    return report;
}

void ProofPipeline::work(Run& run) {
    while (!run.signal.is_cancelled()) {
        const auto batch_number{claim_batch(run)};
        if (!batch_number) {
            break;
        }
        if (prove_batch(run, *batch_number) == Outcome::kStopped) {
            break;
        }
    }
}

std::optional<uint64_t> ProofPipeline::claim_batch(Run& run) {
    // The counter never moves past end_batch, so it cannot wrap around
    uint64_t batch_number{run.next_batch.load()};
    do {
        if (batch_number >= run.end_batch) {
            return std::nullopt;
        }
    } while (!run.next_batch.compare_exchange_weak(batch_number, batch_number + 1));
    return batch_number;
}

ProofPipeline::Outcome ProofPipeline::prove_batch(Run& run, uint64_t batch_number) {
    for (uint32_t attempt{1}; attempt <= settings_.max_attempts; ++attempt) {
        prover::ClientPtr client;
        try {
            client = pool_.get(run.signal);
        } catch (const boost::system::system_error& e) {
            if (concurrency::is_cancelled_error(e)) {
                return Outcome::kStopped;
            }
            throw;
        }

        std::optional<prover::Proof> proof;
        try {
            proof = client->prove(run.signal, batch_number);
        } catch (const prover::ProverError& e) {
            log::Warning("Proof generation failed", {"prover", e.prover_id(),
                                                     "batch", std::to_string(batch_number),
                                                     "attempt", std::to_string(attempt),
                                                     "error", e.what()});
        } catch (...) {
            pool_.release(client);
            if (concurrency::is_cancelled_error(std::current_exception())) {
                return Outcome::kStopped;
            }
            throw;
        }

        if (proof) {
            pool_.release(client);
            ZKCOORD_DEBUG << "ProofPipeline batch " << batch_number << " proved by " << proof->prover_id;
            std::scoped_lock lock{run.mutex};
            ++run.report.proved_batches;
            run.report.proofs.push_back(std::move(*proof));
            return Outcome::kProved;
        }

        {
            std::scoped_lock lock{run.mutex};
            ++run.report.failed_attempts;
            if (settings_.discard_failed_provers) {
                ++run.report.discarded_provers;
            }
        }
        if (!settings_.discard_failed_provers) {
            pool_.release(client);
            continue;
        }
        pool_.discard(client);
        if (pool_.size() == 0) {
            log::Error("ProofPipeline stopped", {"reason", "no provers left",
                                                 "batch", std::to_string(batch_number)});
            std::scoped_lock lock{run.mutex};
            run.report.out_of_provers = true;
            run.signal.cancel();
            return Outcome::kStopped;
        }
    }

    log::Error("Batch proving given up", {"batch", std::to_string(batch_number),
                                          "attempts", std::to_string(settings_.max_attempts)});
    std::scoped_lock lock{run.mutex};
    ++run.report.failed_batches;
    return Outcome::kFailed;
}

}  // namespace zkcoord::coordinator
