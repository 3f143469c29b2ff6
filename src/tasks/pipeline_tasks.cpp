#include "pipeline_tasks.h"
#include <memory>
#include "log/logger.h"
#include "runner/command_task_body.h"

namespace pipehub::tasks {

const std::vector<PipelineTaskSpec>& pipelineTaskSpecs()
{
    static const std::vector<PipelineTaskSpec> specs = {
        {"build_ticker_universe", {}, "daily",
         "Refresh dynamic ticker universe"},
        {"ingest_market_daily", {"build_ticker_universe"}, "daily",
         "Fetch OHLCV data for universe tickers"},
        {"ingest_news_hourly", {"build_ticker_universe"}, "hourly",
         "Collect news and sentiment"},
        {"build_features_daily", {"ingest_market_daily", "ingest_news_hourly"}, "daily",
         "Generate feature windows for prediction"},
        {"run_predictions_daily", {"build_features_daily"}, "daily",
         "Run model inference across universe"},
        {"validate_predictions_daily", {"run_predictions_daily"}, "daily",
         "Validate predictions against market outcomes"},
        {"feedback_daily", {"validate_predictions_daily"}, "daily",
         "Update feedback metrics and retrain signals"},
        {"trading_cycle_intraday", {"feedback_daily"}, "intraday",
         "Execute trading cycle"},
    };
    return specs;
}

void registerPipelineTasks(runner::TaskRegistry& registry, const Config& cfg)
{
    int configured = 0;
    for (const auto& spec : pipelineTaskSpecs()) {
        const std::string command = cfg.get<std::string>("pipeline.commands." + spec.name, "");
        if (!command.empty()) ++configured;

        registry.registerTask(spec.name,
                              std::make_shared<runner::CommandTaskBody>(spec.name, command),
                              spec.dependencies,
                              spec.cadence,
                              spec.description);
    }
    Logger::debug("Pipeline tasks registered: " + std::to_string(pipelineTaskSpecs().size()) +
                  " (" + std::to_string(configured) + " with commands)");
}

} // namespace pipehub::tasks
