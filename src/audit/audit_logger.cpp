#include "riglink/audit/audit_logger.hpp"

#include <sstream>
#include <utility>

namespace riglink::audit {

nlohmann::json to_json(const AuditRecord& record) {
    return {
        {"actor", record.actor},
        {"action", record.action},
        {"radioId", record.radio_id},
        {"result", common::to_string(record.result)},
        {"message", record.message},
        {"parameters", record.parameters}
    };
}

AuditLogger::AuditLogger(Sink sink)
    : sink_(std::move(sink)) {}

void AuditLogger::record(const AuditRecord& record) const {
    std::ostringstream oss;
    oss << "[AUDIT] " << to_json(record).dump();
    dts::common::core::getLogger().info(oss.str());
    if (sink_) {
        sink_(record);
    }
}

}  // namespace riglink::audit
