#include "CsvAuditSink.h"
#include "DateTimeConverter.h"
#include "Logger.h"
#include "MovingAverageEngine.h"
#include "ReplayConfig.h"
#include "SyntheticPriceGenerator.h"

#include <fmt/core.h>

#include <memory>

int main(int argc, char * argv[])
{
    const auto path_opt = ReplayConfigLoader::config_path(argc, argv);
    if (!path_opt.has_value()) {
        LOG_ERROR("Usage: {} <config.json>", argc > 0 ? argv[0] : "sessionsma_replay");
        return 1;
    }

    const auto config_opt = ReplayConfigLoader::load(*path_opt);
    if (!config_opt.has_value()) {
        return 1;
    }
    const auto & config = *config_opt;
    Logger::set_min_log_level(config.log_level);

    MovingAverageEngine engine(config.engine);

    std::shared_ptr<CsvAuditSink> sink;
    if (!config.audit_csv.empty()) {
        sink = CsvAuditSink::open(config.audit_csv);
        if (!sink) {
            return 1;
        }
        engine.set_audit_sink(sink);
    }

    const TradingCalendar calendar(config.engine.trading_hours);
    const SyntheticPriceGenerator generator(calendar, config.generator);
    const auto samples = generator.generate(config.start);

    for (const auto & sample : samples) {
        engine.update(sample.timestamp, sample.price);
        const double sma = engine.get();
        LOG_INFO("{}  price: {}  sma: {}",
                 DateTimeConverter::date_time(sample.timestamp),
                 fmt::format("{:.2f}", sample.price),
                 fmt::format("{:.2f}", sma));
    }

    LOG_INFO("Processed {} samples, {} retained", samples.size(), engine.series().size());
    if (sink) {
        LOG_INFO("{} audit rows written to {}", sink->rows_written(), config.audit_csv);
    }
    return 0;
}
