#include "config/config.h"
#include "core/context.h"
#include "engine/engine.h"
#include "harness/simulated_target.h"
#include "monitor/security_monitor.h"
#include "telemetry/event_sink.h"
#include <spdlog/spdlog.h>
#include <utility>

namespace {

constexpr int kExitBreakerOpen = 2;
constexpr int kExitFatal = 1;

}  // namespace

int main() {
    try {
        auto config = chaosforge::Config::from_env();

        spdlog::set_level(spdlog::level::from_str(config.log_level));
        spdlog::info("Starting ChaosForge v1.0.0");

        chaosforge::LogEventSink sink;
        chaosforge::ChaosContext context(std::move(config), sink);
        chaosforge::SimulatedTarget target;
        auto corpus = chaosforge::make_seed_corpus(context.config);

        chaosforge::SecurityMonitor monitor(context);
        monitor.start();

        chaosforge::Engine engine(context, target);
        auto summary = engine.execute_tests(corpus);

        monitor.stop();
        monitor.rethrow_fault();

        // Evaluate the final counters so a trip caused by the last chunk is reported
        auto report = monitor.tick(chaosforge::SteadyClock::now());
        auto snapshot = context.metrics.snapshot();
        spdlog::info("Final monitor cycle: {}, {} tx, {} failed, risk score {}",
                     chaosforge::to_string(report.status), snapshot.total_transactions,
                     snapshot.failed_transactions, snapshot.risk_score());

        spdlog::info("Summary: {} tests, {} interesting, {} rejected, {} skipped, "
                     "peak {} in flight",
                     summary.results.size(), summary.interesting, summary.rejected,
                     summary.skipped, summary.peak_in_flight);

        if (context.breaker.is_open()) {
            spdlog::critical("Run halted by circuit breaker: {}", context.breaker.last_reason());
            return kExitBreakerOpen;
        }
        spdlog::info("ChaosForge run complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return kExitFatal;
    }
}
