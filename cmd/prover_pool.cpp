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

#include <memory>
#include <string>
#include <thread>

#include <CLI/CLI.hpp>
#include <absl/cleanup/cleanup.h>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <zkcoord/common/log.hpp>
#include <zkcoord/concurrency/cancellation_signal.hpp>
#include <zkcoord/concurrency/shutdown_signal.hpp>
#include <zkcoord/coordinator/proof_pipeline.hpp>
#include <zkcoord/coordinator/prover_pool.hpp>
#include <zkcoord/prover/mock_client.hpp>

#include "common.hpp"

using namespace zkcoord;
using namespace zkcoord::cmd;

ProverPoolDriverSettings parse_cli_settings(int argc, char* argv[]) {
    CLI::App cli{"Zkcoord - prover pool driver"};

    ProverPoolDriverSettings settings;
    parse_command_line(cli, argc, argv, settings);
    return settings;
}

int prover_pool_main(const ProverPoolDriverSettings& settings) {
    log::init(settings.log_settings);
    log::set_thread_name("main");

    concurrency::CancellationSignal root_signal;

    // Termination signals are serviced on a dedicated io_context thread
    boost::asio::io_context io_context;
    auto work_guard = boost::asio::make_work_guard(io_context);
    concurrency::ShutdownSignal shutdown_signal{io_context};
    shutdown_signal.cancel_on_signal(root_signal);
    std::thread signal_thread{[&io_context]() {
        log::set_thread_name("signals");
        io_context.run();
    }};
    absl::Cleanup stop_signal_thread = [&]() {
        boost::asio::post(io_context, [&shutdown_signal]() { shutdown_signal.cancel(); });
        work_guard.reset();
        signal_thread.join();
    };

    coordinator::ProverPool pool{settings.pool_settings};
    absl::Cleanup close_pool = [&pool]() { pool.close(); };

    for (uint32_t i{0}; i < settings.num_provers; ++i) {
        auto client = std::make_shared<prover::MockClient>("prover-" + std::to_string(i), settings.prover_settings);
        if (!pool.add(root_signal, std::move(client))) {
            log::Warning("Startup interrupted", {"added_provers", std::to_string(i)});
            return 0;
        }
    }
    log::Info("Prover pool ready", {"capacity", std::to_string(pool.capacity()),
                                    "provers", std::to_string(pool.size())});

    coordinator::ProofPipeline pipeline{pool, settings.pipeline_settings};
    const auto report = pipeline.run(root_signal, settings.first_batch, settings.num_batches);

    for (const auto& proof : report.proofs) {
        ZKCOORD_DEBUG << "Batch " << proof.batch_number << " proved by " << proof.prover_id << ": " << proof.data;
    }
    if (report.out_of_provers) {
        log::Error("All provers have been discarded", {"discarded", std::to_string(report.discarded_provers)});
    }
    return report.failed_batches > 0 || report.out_of_provers ? 1 : 0;
}

int main(int argc, char* argv[]) {
    try {
        return prover_pool_main(parse_cli_settings(argc, argv));
    } catch (const CLI::ParseError& pe) {
        return pe.get_exit_code();
    } catch (const std::exception& e) {
        ZKCOORD_CRIT << "Prover pool driver exiting due to exception: " << e.what();
        return -1;
    } catch (...) {
        ZKCOORD_CRIT << "Prover pool driver exiting due to unexpected exception";
        return -1;
    }
}
