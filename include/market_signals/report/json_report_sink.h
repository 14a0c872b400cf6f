/**
 * Report sink writing one JSON document per cycle
 */

#pragma once

#include <memory>
#include <string>
#include <nlohmann/json.hpp>

#include "market_signals/report/report_sink.h"

namespace market_signals {
namespace report {

class JsonReportSink : public ReportSink {
public:
    explicit JsonReportSink(const std::string& output_path);
    ~JsonReportSink() override;

    void publish(const SymbolReport& report) override;
    void publishSummary(const BatchSummary& summary) override;

    // Writes {"metadata": ..., "reports": [...]} and resets for the next cycle.
    // Throws std::runtime_error when the file cannot be written.
    void close() override;

    const std::string& getOutputPath() const;

    static nlohmann::json toJson(const SymbolReport& report);
    static nlohmann::json toJson(const signals::Signal& signal);
    static nlohmann::json toJson(const BatchSummary& summary);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace report
} // namespace market_signals
