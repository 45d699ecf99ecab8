#pragma once
#include "IEstimationObserver.h"

namespace benchstat::diagnostics {

class NullEstimationCollector : public IEstimationObserver {
public:
    NullEstimationCollector() = default;
    ~NullEstimationCollector() override = default;

    void onEstimate(const EstimationDiagnosticRecord& /*record*/) override {}
};

} // namespace benchstat::diagnostics
