#pragma once

#include "FairnessConfig.h"

#include <string>
#include <vector>

struct RunConfig {
    std::string datasetPath;
    std::string reportFile = "fairness_report.md";
    std::string historyFile;
    char delimiter = ',';
    bool extended = true;
    bool verbose = false;

    FairnessConfig fairness;

    /**
     * @brief Builds config from CLI args and optional config file override.
     * @pre argv[1] holds the dataset path.
     * @post Returns a validated config object.
     * @throws FairLens::ConfigurationException on invalid arguments or values.
     */
    static RunConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads config values from a lightweight YAML/JSON-like key:value file.
     * @post Returns merged config using `base` as defaults.
     * @throws FairLens::ConfigurationException on parse/validation failures.
     */
    static RunConfig fromFile(const std::string& configPath, const RunConfig& base);

    static std::string usage();

    void validate() const;
};
