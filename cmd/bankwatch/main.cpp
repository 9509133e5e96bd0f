// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include "metrics_file.hpp"

#include <bankwatch/banking/block_info.hpp>
#include <bankwatch/banking/event/json_event_source.hpp>
#include <bankwatch/banking/metrics.hpp>
#include <bankwatch/banking/pipeline.hpp>
#include <bankwatch/banking/transaction_index.hpp>
#include <bankwatch/core/config.hpp>
#include <bankwatch/core/fiber/stop_latch.hpp>
#include <bankwatch/core/fiber/task_pool.hpp>
#include <bankwatch/core/likely.h>
#include <bankwatch/core/log_level_map.hpp>
#include <bankwatch/storage/json_lines_sink.hpp>
#include <bankwatch/storage/postgres_sink.hpp>
#include <bankwatch/storage/storage_sink.hpp>

#include <CLI/CLI.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <boost/fiber/future.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <istream>
#include <memory>
#include <signal.h>
#include <string>
#include <utility>

sig_atomic_t volatile stop;

BANKWATCH_ANONYMOUS_NAMESPACE_BEGIN

void signal_handler(int)
{
    stop = 1;
}

BANKWATCH_ANONYMOUS_NAMESPACE_END

using namespace bankwatch;
namespace fs = std::filesystem;

int main(int const argc, char const *argv[])
{
    CLI::App cli{"bankwatch"};
    cli.option_defaults()->always_capture_default();

    std::string events;
    fs::path output;
    unsigned block_hold = 30;
    size_t delay_queue_capacity = 0;
    unsigned eviction_period = 60;
    uint64_t eviction_lag = 300;
    size_t eviction_batch_size = 8;
    size_t heavy_account_limit = DEFAULT_HEAVY_ACCOUNT_LIMIT;
    bool record_untracked_inclusions = false;
    fs::path metrics_file;
    unsigned metrics_period = 15;
    unsigned nthreads = 4;
    unsigned nfibers = 8;
    auto log_level = quill::LogLevel::Info;

    cli.add_option(
           "--events",
           events,
           "newline-delimited json events to consume, - for stdin")
        ->required();
    cli.add_option(
        "--output",
        output,
        "append json-lines records to this file instead of writing to the "
        "postgres database named by PG_CONFIG");
    cli.add_option(
        "--block_hold",
        block_hold,
        "seconds a block waits before it is processed, so late error "
        "notifications for its slot are still counted");
    cli.add_option(
        "--delay_queue_capacity",
        delay_queue_capacity,
        "blocks held before ingestion waits, 0 for unbounded");
    cli.add_option(
           "--eviction_period",
           eviction_period,
           "seconds between eviction passes")
        ->check(CLI::PositiveNumber);
    cli.add_option(
        "--eviction_lag",
        eviction_lag,
        "slots behind the latest processed block after which a transaction "
        "is persisted and forgotten");
    cli.add_option(
           "--eviction_batch_size",
           eviction_batch_size,
           "transactions per storage write")
        ->check(CLI::PositiveNumber);
    cli.add_option(
        "--heavy_account_limit",
        heavy_account_limit,
        "most locked accounts recorded per block");
    cli.add_flag(
        "--record_untracked_inclusions",
        record_untracked_inclusions,
        "also track included transactions that had no error notification");
    cli.add_option(
        "--metrics_file",
        metrics_file,
        "periodically write prometheus text metrics to this file");
    cli.add_option(
           "--metrics_period",
           metrics_period,
           "seconds between metrics file updates")
        ->check(CLI::PositiveNumber);
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));
    cli.add_option("--nthreads", nthreads, "number of threads")
        ->check(CLI::Range(2u, 256u));
    cli.add_option("--nfibers", nfibers, "number of fibers")
        ->check(CLI::Range(4u, 4096u));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    std::ofstream output_stream;
    std::unique_ptr<StorageSink> sink;
    if (!output.empty()) {
        output_stream.open(output, std::ios::app);
        if (BANKWATCH_UNLIKELY(!output_stream)) {
            LOG_ERROR("could not open output {}", output.string());
            return EXIT_FAILURE;
        }
        LOG_INFO("writing records to {}", output.string());
        sink = std::make_unique<JsonLinesSink>(output_stream);
    }
    else {
        char const *const pg_config = std::getenv("PG_CONFIG");
        if (BANKWATCH_UNLIKELY(pg_config == nullptr)) {
            LOG_ERROR("env PG_CONFIG not found and no --output given");
            return EXIT_FAILURE;
        }
        auto res = PostgresSink::connect(pg_config);
        if (BANKWATCH_UNLIKELY(res.has_error())) {
            LOG_ERROR(
                "could not open storage: {}",
                res.assume_error().message().c_str());
            return EXIT_FAILURE;
        }
        sink = std::move(res).assume_value();
    }

    std::ifstream events_file;
    std::istream *events_in = &std::cin;
    if (events != "-") {
        events_file.open(events);
        if (BANKWATCH_UNLIKELY(!events_file)) {
            LOG_ERROR("could not open events {}", events);
            return EXIT_FAILURE;
        }
        events_in = &events_file;
    }
    JsonEventSource source{*events_in};

    Metrics metrics;
    PipelineConfig const config{
        .block_hold = std::chrono::seconds{block_hold},
        .delay_queue_capacity = delay_queue_capacity,
        .block_processor =
            {.heavy_account_limit = heavy_account_limit,
             .inclusion_policy = record_untracked_inclusions
                                     ? InclusionPolicy::CreateIfAbsent
                                     : InclusionPolicy::TrackedOnly},
        .eviction = {
            .period = std::chrono::seconds{eviction_period},
            .lag_window = eviction_lag,
            .batch_size = eviction_batch_size}};
    Pipeline pipeline{config, *sink, metrics};

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    stop = 0;

    fiber::TaskPool pool{nthreads, nfibers};
    fiber::StopLatch reporter_stop;
    boost::fibers::future<void> reporter;
    if (!metrics_file.empty()) {
        reporter = pool.spawn([&] {
            report_metrics(
                metrics,
                metrics_file,
                std::chrono::seconds{metrics_period},
                reporter_stop);
        });
    }

    auto const start_time = std::chrono::steady_clock::now();
    auto const result = pipeline.run(source, pool, stop);
    auto const elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start_time);

    reporter_stop.request_stop();
    if (reporter.valid()) {
        reporter.get();
    }

    if (BANKWATCH_UNLIKELY(result.has_error())) {
        LOG_ERROR(
            "stopped on storage failure: {}",
            result.assume_error().message().c_str());
    }
    LOG_INFO(
        "finished after {}s: blocks={} error_notifications={} "
        "malformed_events={} evicted={} persist_failures={}",
        elapsed.count(),
        metrics.blocks.get(),
        metrics.banking_stage_events.get(),
        metrics.malformed_events.get(),
        metrics.evicted_transactions.get(),
        metrics.persist_failures.get());
    return result.has_error() ? EXIT_FAILURE : EXIT_SUCCESS;
}
