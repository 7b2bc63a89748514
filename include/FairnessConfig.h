#pragma once

#include <cstddef>
#include <string>
#include <vector>

/**
 * Thresholds, keyword lists and work caps shared by every analysis stage.
 * Passed by const reference; stages never modify it.
 */
struct FairnessConfig {
    // Values strictly above this count as a positive outcome.
    static constexpr double kPositiveThreshold = 0.5;

    std::vector<std::string> protectedAttributeKeywords = {
        "gender", "sex", "race", "ethnicity", "age", "religion", "nationality", "disability", "marital"
    };
    // Demographic value words that also mark a header as protected.
    std::vector<std::string> fallbackDemographicKeywords = {
        "male", "female", "black", "white", "asian", "hispanic", "latino", "young", "elderly", "minority"
    };
    std::vector<std::string> targetKeywords = {
        "prediction", "predicted", "score", "label", "outcome", "approved", "decision", "result", "target",
        "hired", "accepted"
    };

    double disparateImpactThreshold = 0.8;
    double statisticalParityThreshold = 0.1;
    double equalOpportunityThreshold = 0.1;

    // Prefix sizes bounding the pairwise similarity scans.
    size_t individualFairnessMaxRecords = 100;
    size_t counterfactualMaxRecords = 50;

    std::string actualColumnSuffix = "_actual";

    /**
     * @brief Checks thresholds lie within [0,1], keyword lists are non-empty and caps are positive.
     * @throws FairLens::ConfigurationException on the first invalid value.
     */
    void validate() const;
};
