#pragma once

#include "AnalysisResult.h"
#include "ReportEngine.h"

namespace FairnessReport {
// Renders the core result, and the extended sections when `extended` is non-null.
void render(ReportEngine& report, const AnalysisResult& result, const ExtendedAnalysisResult* extended);

std::string describeTest(const std::optional<SignificanceTestResult>& test);
}
