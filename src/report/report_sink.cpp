/**
 * Destination for per-symbol reports
 */

#include "market_signals/report/report_sink.h"

namespace market_signals {
namespace report {

std::string reportStatusToString(ReportStatus status) {
    switch (status) {
        case ReportStatus::OK: return "ok";
        case ReportStatus::DEGRADED: return "degraded";
        case ReportStatus::TIMED_OUT: return "timed_out";
        case ReportStatus::FAILED: return "failed";
        default: return "unknown";
    }
}

} // namespace report
} // namespace market_signals
