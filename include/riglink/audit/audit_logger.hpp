#pragma once

#include "riglink/common/types.hpp"

#include <dts/common/core/logging.hpp>
#include <nlohmann/json.hpp>

#include <functional>
#include <string>

namespace riglink::audit {

struct AuditRecord {
    std::string actor;
    std::string action;
    std::string radio_id;
    nlohmann::json parameters;
    common::ErrorCode result{common::ErrorCode::Ok};
    std::string message;
};

nlohmann::json to_json(const AuditRecord& record);

// Writes one [AUDIT] log line per record. An optional sink receives the
// record as well.
class AuditLogger {
public:
    using Sink = std::function<void(const AuditRecord&)>;

    AuditLogger() = default;
    explicit AuditLogger(Sink sink);

    void record(const AuditRecord& record) const;

private:
    Sink sink_;
};

}  // namespace riglink::audit
