#pragma once

#include "analysis_job.h"
#include "vm_controller.h"

#include <json/json.h>

#include <string>
#include <vector>

namespace malsand {

// JSON records handed to the web/reporting layer
class AnalysisReport {
public:
    // Finished-analysis record; requires snapshot.result
    static Json::Value build(const JobSnapshot& snapshot);

    static Json::Value status(const JobSnapshot& snapshot);
    static Json::Value artifacts(const std::vector<ArtifactInfo>& artifacts);
    static Json::Value vm_status(const VMStatus& status, const VMHandle& handle);

    static std::string to_string(const Json::Value& value, bool pretty = false);
};

} // namespace malsand
