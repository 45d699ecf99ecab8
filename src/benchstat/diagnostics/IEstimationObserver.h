#pragma once
#include "EstimationDiagnosticRecord.h"

namespace benchstat::diagnostics {

class IEstimationObserver {
public:
    virtual ~IEstimationObserver() = default;
    virtual void onEstimate(const EstimationDiagnosticRecord& record) = 0;
};

} // namespace benchstat::diagnostics
