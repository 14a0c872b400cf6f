/**
 * Main entry point for the market signal engine
 */

#include <iostream>
#include <chrono>
#include <atomic>
#include <csignal>
#include <string>
#include <thread>
#include <vector>
#include <boost/program_options.hpp>

#include "market_signals/common/clock.h"
#include "market_signals/common/config.h"
#include "market_signals/common/logging.h"
#include "market_signals/data/rest_market_data_source.h"
#include "market_signals/orchestrator/batch_orchestrator.h"
#include "market_signals/orchestrator/symbol_loader.h"
#include "market_signals/report/json_report_sink.h"
#include "market_signals/scheduler/quota_tracker.h"

namespace po = boost::program_options;
using namespace market_signals;
using namespace std;

// Global signal handler
std::atomic<bool> running{true};

void signalHandler(int signal) {
    (void)signal;
    running = false;
}

namespace {

std::vector<std::string> resolveSymbols(const po::variables_map& vm, const common::Config& config) {
    std::vector<std::string> symbols;
    if (vm.count("symbols")) {
        symbols = orchestrator::parseSymbolList(vm["symbols"].as<std::string>());
    } else if (vm.count("symbols-file")) {
        symbols = orchestrator::loadSymbolsFile(vm["symbols-file"].as<std::string>());
    } else {
        std::string joined;
        for (const auto& symbol : config.getBatchConfig().default_symbols) {
            joined += symbol + ",";
        }
        symbols = orchestrator::parseSymbolList(joined);
    }

    return orchestrator::applySkipLimit(symbols,
                                        vm["skip"].as<size_t>(),
                                        vm["limit"].as<size_t>());
}

// Sleep in short steps so that a shutdown signal ends the wait promptly
void waitForNextCycle(int interval_s) {
    auto wake = std::chrono::steady_clock::now() + std::chrono::seconds(interval_s);
    while (running && std::chrono::steady_clock::now() < wake) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        // Parse command line options
        po::options_description desc("Allowed options");
        desc.add_options()
            ("help", "produce help message")
            ("config", po::value<std::string>()->default_value("config/system.yaml"), "system configuration file")
            ("log-level", po::value<std::string>(), "log level (debug, info, warning, error, critical)")
            ("symbols", po::value<std::string>(), "comma separated symbols")
            ("symbols-file", po::value<std::string>(), "file with comma or newline separated symbols")
            ("skip", po::value<size_t>()->default_value(0), "skip the first N symbols")
            ("limit", po::value<size_t>()->default_value(0), "process at most N symbols (0 = all)")
            ("output", po::value<std::string>(), "report output file")
            ("periodic", "run cycles until interrupted")
            ("interval", po::value<int>(), "seconds between periodic cycles")
        ;

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            cout << desc << "\n";
            return 0;
        }

        // Register signal handler
        signal(SIGINT, signalHandler);
        signal(SIGTERM, signalHandler);

        // Load configuration
        common::Config config(vm["config"].as<std::string>());

        // Initialize logging
        const auto& logging = config.getLoggingConfig();
        common::g_logger.setLevel(vm.count("log-level") ? vm["log-level"].as<std::string>() : logging.level);
        common::g_logger.setConsoleOutput(logging.console);
        if (!logging.file.empty()) {
            common::g_logger.open(logging.file);
        }
        LOG_INFO("Starting market signal engine");

        std::vector<std::string> symbols = resolveSymbols(vm, config);
        if (symbols.empty()) {
            LOG_ERROR("No valid symbols to process");
            cerr << "No valid symbols to process" << endl;
            common::g_logger.flush();
            return 1;
        }

        std::string output = vm.count("output") ? vm["output"].as<std::string>()
                                                : config.getBatchConfig().output_file;
        int interval_s = vm.count("interval") ? vm["interval"].as<int>()
                                              : config.getBatchConfig().interval_s;
        if (interval_s <= 0) {
            throw std::invalid_argument("--interval must be positive");
        }

        // Initialize components
        common::SystemClock clock;
        scheduler::QuotaTracker quota(config.getQuotaConfig(), clock);
        data::RestMarketDataSource source(config.getDataSourceConfig());
        report::JsonReportSink sink(output);
        orchestrator::BatchOrchestrator orchestrator(config, quota, source, sink, clock);

        LOG_INFO("Processing " + std::to_string(symbols.size()) + " symbols, reports to " + output);

        bool periodic = vm.count("periodic") > 0;
        int exit_code = 0;

        // Main loop
        do {
            try {
                report::BatchSummary summary = orchestrator.runCycle(symbols);
                exit_code = summary.ok + summary.degraded > 0 ? 0 : 1;
            } catch (const std::exception& e) {
                LOG_ERROR(std::string("Cycle failed: ") + e.what());
                exit_code = 1;
                if (!periodic) {
                    throw;
                }
            }

            if (periodic && running) {
                LOG_INFO("Next cycle in " + std::to_string(interval_s) + " seconds");
                waitForNextCycle(interval_s);
            }
        } while (periodic && running);

        LOG_INFO("Market signal engine shutdown complete");
        common::g_logger.flush();
        return exit_code;
    } catch (const std::exception& e) {
        LOG_CRITICAL(std::string("Fatal error: ") + e.what());
        common::g_logger.flush();
        cerr << "Fatal error: " << e.what() << endl;
        return 1;
    }
}
