#pragma once

#include "AnalysisResult.h"
#include "Dataset.h"
#include "FairnessConfig.h"

#include <functional>
#include <string>

class BiasAnalyzer {
public:
    using ProgressCallback = std::function<void(const std::string& stage, const std::string& detail)>;

    /**
     * @brief Runs the core pipeline and, when requested, the extended stages over one snapshot.
     * @pre config has passed validate().
     * @post Never throws; failures come back as an AnalysisOutcome error.
     */
    static AnalysisOutcome analyze(const Dataset& data,
                                   const FairnessConfig& config,
                                   bool extended = false,
                                   const ProgressCallback& progress = nullptr);

    static AnalysisResult runCore(const Dataset& data, const FairnessConfig& config,
                                  const ProgressCallback& progress = nullptr);
    static ExtendedAnalysisResult runExtended(const Dataset& data, const AnalysisResult& core,
                                              const FairnessConfig& config,
                                              const ProgressCallback& progress = nullptr);

    // ISO-8601 UTC time of the call, second precision.
    static std::string currentTimestamp();
};
