/**
 * Report sink writing one JSON document per cycle
 */

#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>

#include "market_signals/common/logging.h"
#include "market_signals/report/json_report_sink.h"

namespace market_signals {
namespace report {

using json = nlohmann::json;

namespace {

json indicatorsToJson(const indicators::IndicatorSet& set) {
    json out = json::object();
    for (const auto& value : set.values()) {
        json entry;
        entry["status"] = indicators::indicatorStatusToString(value.status);
        if (value.available()) {
            entry["value"] = value.value;
            if (value.has_range) {
                entry["lower"] = value.lower;
                entry["upper"] = value.upper;
            }
            if (!value.components.empty()) {
                entry["components"] = value.components;
            }
        }
        if (!value.note.empty()) {
            entry["note"] = value.note;
        }
        out[value.name] = entry;
    }
    return out;
}

json optionToJson(const options::OptionAnalysis& option) {
    json out;
    out["confidence"] = option.confidence;
    out["has_recommendation"] = option.has_recommendation;
    if (!option.has_recommendation) {
        return out;
    }

    out["contract"] = option.contract_symbol;
    out["strike"] = option.recommended_strike;
    out["type"] = data::optionTypeToString(option.recommended_type);
    out["expiry"] = option.expiry;
    out["moneyness"] = options::moneynessToString(option.moneyness);
    out["low_liquidity"] = option.low_liquidity;
    out["iv_percentile"] = option.iv_percentile;
    out["atm_iv"] = option.atm_iv;
    out["max_pain"] = option.max_pain;
    out["current_price"] = option.option_current_price;
    out["target_price"] = option.option_target_price;
    out["stop_loss"] = option.option_stop_price;

    const auto& oi = option.open_interest;
    out["open_interest"] = {
        {"max_call_oi_strike", oi.max_call_oi_strike},
        {"max_put_oi_strike", oi.max_put_oi_strike},
        {"high_call_oi_strikes", oi.high_call_oi_strikes},
        {"high_put_oi_strikes", oi.high_put_oi_strikes},
        {"put_call_ratio", oi.put_call_ratio},
        {"summary", oi.summary}
    };
    return out;
}

} // namespace

// JSON report sink implementation
class JsonReportSink::Impl {
public:
    explicit Impl(const std::string& output_path)
        : output_path_(output_path),
          reports_(json::array()) {
    }

    void publish(const SymbolReport& report) {
        json entry = toJson(report);
        std::lock_guard<std::mutex> lock(mutex_);
        reports_.push_back(std::move(entry));
    }

    void publishSummary(const BatchSummary& summary) {
        json entry = toJson(summary);
        std::lock_guard<std::mutex> lock(mutex_);
        metadata_ = std::move(entry);
    }

    void close() {
        json document;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            document["metadata"] = metadata_.is_null() ? json::object() : metadata_;
            document["reports"] = reports_;
            reports_ = json::array();
            metadata_ = json();
        }

        std::filesystem::path path(output_path_);
        if (path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
        }

        std::ofstream file(output_path_);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open report file: " + output_path_);
        }
        file << document.dump(2) << std::endl;
        if (!file) {
            throw std::runtime_error("Failed to write report file: " + output_path_);
        }

        LOG_INFO("Wrote " + std::to_string(document["reports"].size()) + " reports to " + output_path_);
    }

    const std::string& getOutputPath() const { return output_path_; }

private:
    std::string output_path_;
    json reports_;
    json metadata_;
    std::mutex mutex_;
};

JsonReportSink::JsonReportSink(const std::string& output_path)
    : impl_(std::make_unique<Impl>(output_path)) {
}

JsonReportSink::~JsonReportSink() = default;

void JsonReportSink::publish(const SymbolReport& report) {
    impl_->publish(report);
}

void JsonReportSink::publishSummary(const BatchSummary& summary) {
    impl_->publishSummary(summary);
}

void JsonReportSink::close() {
    impl_->close();
}

const std::string& JsonReportSink::getOutputPath() const {
    return impl_->getOutputPath();
}

json JsonReportSink::toJson(const signals::Signal& signal) {
    json out;
    out["direction"] = signals::directionToString(signal.direction);
    out["raw_direction"] = signals::directionToString(signal.raw_direction);
    out["confidence"] = signal.confidence;
    out["profit_probability"] = signal.profit_probability;
    out["timestamp"] = signal.timestamp;
    out["current_price"] = signal.current_price;
    out["target_price"] = signal.target_price;
    out["stop_loss"] = signal.stop_loss;
    out["support"] = signal.support;
    out["resistance"] = signal.resistance;
    out["risk_reward"] = signal.risk_reward;
    out["days_to_target"] = signal.days_to_target;
    out["position"] = {
        {"method", signal.position.method},
        {"shares", signal.position.shares},
        {"value", signal.position.position_value},
        {"risk_amount", signal.position.risk_amount},
        {"account_pct", signal.position.account_pct},
        {"capped", signal.position.capped}
    };
    out["degraded"] = signal.degraded;
    out["unavailable_inputs"] = signal.unavailable_inputs;
    out["insufficient_inputs"] = signal.insufficient_inputs;
    out["indicators"] = indicatorsToJson(signal.indicators);
    if (signal.has_option) {
        out["option"] = optionToJson(signal.option);
    }
    return out;
}

json JsonReportSink::toJson(const SymbolReport& report) {
    json out;
    out["symbol"] = report.symbol;
    out["status"] = reportStatusToString(report.status);
    out["fetch"] = report.fetch_messages;
    if (!report.error.empty()) {
        out["error"] = report.error;
    }
    if (report.has_signal) {
        out["signal"] = toJson(report.signal);
    }
    return out;
}

json JsonReportSink::toJson(const BatchSummary& summary) {
    const auto& s = summary.scheduler;
    return json{
        {"total", summary.total},
        {"ok", summary.ok},
        {"degraded", summary.degraded},
        {"timed_out", summary.timed_out},
        {"failed", summary.failed},
        {"cache_hits", summary.cache_hits},
        {"started_at", summary.started_at},
        {"duration_ms", summary.duration_ms},
        {"scheduler", {
            {"submitted", s.submitted},
            {"dispatched", s.dispatched},
            {"completed", s.completed},
            {"deferred", s.deferred},
            {"cooled_down", s.cooled_down},
            {"rate_limited", s.rate_limited},
            {"retried", s.retried},
            {"failed", s.failed},
            {"timed_out", s.timed_out},
            {"max_concurrent", s.max_concurrent}
        }}
    };
}

} // namespace report
} // namespace market_signals
