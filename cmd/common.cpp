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

#include "common.hpp"

#include <chrono>
#include <map>
#include <string>

namespace zkcoord::cmd {

void parse_command_line(CLI::App& cli, int argc, char* argv[], ProverPoolDriverSettings& settings) {
    add_logging_options(cli, settings.log_settings);
    add_prover_pool_options(cli, settings);
    add_pipeline_options(cli, settings);

    cli.final_callback([&settings]() {
        if (settings.num_provers > settings.pool_settings.max_server_proofs) {
            throw CLI::ValidationError("--provers", "cannot exceed --pool.capacity (" +
                                                        std::to_string(settings.pool_settings.max_server_proofs) + ")");
        }
    });

    try {
        cli.parse(argc, argv);
    } catch (const CLI::ParseError& pe) {
        cli.exit(pe);
        throw;
    }
}

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    std::map<std::string, log::Level> level_mapping{
        {"critical", log::Level::kCritical},
        {"error", log::Level::kError},
        {"warning", log::Level::kWarning},
        {"info", log::Level::kInfo},
        {"debug", log::Level::kDebug},
        {"trace", log::Level::kTrace},
    };
    auto& log_opts = *cli.add_option_group("Log", "Logging options");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Sets log verbosity")
        ->capture_default_str()
        ->check(CLI::Range(log::Level::kCritical, log::Level::kTrace))
        ->transform(CLI::Transformer(level_mapping, CLI::ignore_case))
        ->default_val(log_settings.log_verbosity);
    log_opts.add_flag("--log.stdout", log_settings.log_std_out, "Outputs to std::out instead of std::err");
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors on log lines");
    log_opts.add_flag("--log.utc", log_settings.log_utc, "Prints log timings in UTC");
    log_opts.add_flag("--log.threads", log_settings.log_threads, "Prints thread ids");
    log_opts.add_option("--log.file", log_settings.log_file, "Tee all log lines to given file name");
}

void add_prover_pool_options(CLI::App& cli, ProverPoolDriverSettings& settings) {
    auto& pool_opts = *cli.add_option_group("Prover pool", "Prover pool options");
    pool_opts.add_option("--pool.capacity", settings.pool_settings.max_server_proofs,
                         "Maximum number of provers owned by the pool")
        ->capture_default_str()
        ->check(CLI::Range(1u, 1024u));
    pool_opts.add_option("--provers", settings.num_provers, "Number of mock provers added to the pool at startup")
        ->capture_default_str()
        ->check(CLI::Range(1u, 1024u));
    pool_opts.add_option_function<uint32_t>(
                 "--prover.delay",
                 [&settings](const uint32_t& delay_ms) { settings.prover_settings.delay = std::chrono::milliseconds{delay_ms}; },
                 "Simulated proving time per batch in ms")
        ->default_str(std::to_string(settings.prover_settings.delay.count()));
    pool_opts.add_option("--prover.fail-every", settings.prover_settings.fail_every,
                         "Make every n-th job of each prover fail (0 means never)")
        ->capture_default_str();
}

void add_pipeline_options(CLI::App& cli, ProverPoolDriverSettings& settings) {
    auto& pipeline_opts = *cli.add_option_group("Pipeline", "Proof pipeline options");
    pipeline_opts.add_option("--workers", settings.pipeline_settings.num_workers, "Number of concurrent pipeline workers")
        ->capture_default_str()
        ->check(CLI::Range(1u, 1024u));
    pipeline_opts.add_option("--first-batch", settings.first_batch, "Number of the first batch to prove")
        ->capture_default_str();
    pipeline_opts.add_option("--batches", settings.num_batches, "Number of batches to prove")
        ->capture_default_str();
    pipeline_opts.add_option("--pipeline.max-attempts", settings.pipeline_settings.max_attempts,
                             "Proving attempts per batch before giving up on it")
        ->capture_default_str()
        ->check(CLI::Range(1u, 100u));
    pipeline_opts.add_flag("--pipeline.discard-failed", settings.pipeline_settings.discard_failed_provers,
                           "Drop provers failing a job instead of returning them to the pool");
}

}  // namespace zkcoord::cmd
