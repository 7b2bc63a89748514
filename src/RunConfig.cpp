#include "RunConfig.h"
#include "CommonUtils.h"
#include "FairLensExceptions.h"

#include <algorithm>
#include <fstream>
#include <unordered_map>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw FairLens::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const FairLens::FairLensException&) {
        throw;
    } catch (const std::exception& ex) {
        throw FairLens::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

size_t parseSizeStrict(const std::string& value, const std::string& key, size_t minValue) {
    const std::string trimmed = CommonUtils::trim(value);
    if (!trimmed.empty() && trimmed[0] == '-') {
        throw FairLens::ConfigurationException("Invalid unsigned integer for " + key + ": " + value);
    }
    unsigned long long parsed = parseNumericStrict<unsigned long long>(
        trimmed,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& v, size_t* pos) { return std::stoull(v, pos); });
    if (parsed < minValue) {
        throw FairLens::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return static_cast<size_t>(parsed);
}

double parseUnitIntervalStrict(const std::string& value, const std::string& key) {
    double parsed = parseNumericStrict<double>(
        CommonUtils::trim(value),
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (parsed < 0.0 || parsed > 1.0) {
        throw FairLens::ConfigurationException(key + " must be within [0,1]");
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw FairLens::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

char parseDelimiter(const std::string& value, const std::string& key) {
    if (value == "\\t" || CommonUtils::toLower(value) == "tab") return '\t';
    if (value.size() != 1) throw FairLens::ConfigurationException(key + " expects a single character");
    return value[0];
}

std::vector<std::string> parseKeywordList(const std::string& value) {
    std::vector<std::string> out;
    for (const auto& item : CommonUtils::splitList(value)) {
        out.push_back(CommonUtils::toLower(item));
    }
    return out;
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    for (char c : line) {
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}' || c == '[' || c == ']')) {
            continue;
        }
        out.push_back(c);
    }

    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && line[i] == sep) return i;
    }
    return std::string::npos;
}

// Removes every double quote so JSON-style lists ("a", "b") read like plain ones.
std::string unquote(std::string value) {
    value = CommonUtils::trim(value);
    value.erase(std::remove(value.begin(), value.end(), '"'), value.end());
    return CommonUtils::trim(value);
}

std::string normalizeConfigKey(std::string key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

void assignKeyValue(RunConfig& config, const std::string& key, const std::string& value) {
    static const std::unordered_map<std::string, std::string RunConfig::*> stringFields = {
        {"dataset", &RunConfig::datasetPath},
        {"report", &RunConfig::reportFile},
        {"history", &RunConfig::historyFile}
    };
    static const std::unordered_map<std::string, bool RunConfig::*> boolFields = {
        {"extended", &RunConfig::extended},
        {"verbose", &RunConfig::verbose}
    };
    static const std::unordered_map<std::string, double FairnessConfig::*> thresholdFields = {
        {"disparate_impact_threshold", &FairnessConfig::disparateImpactThreshold},
        {"statistical_parity_threshold", &FairnessConfig::statisticalParityThreshold},
        {"equal_opportunity_threshold", &FairnessConfig::equalOpportunityThreshold}
    };
    static const std::unordered_map<std::string, size_t FairnessConfig::*> capFields = {
        {"individual_fairness_max_records", &FairnessConfig::individualFairnessMaxRecords},
        {"counterfactual_max_records", &FairnessConfig::counterfactualMaxRecords}
    };
    static const std::unordered_map<std::string, std::vector<std::string> FairnessConfig::*> listFields = {
        {"protected_keywords", &FairnessConfig::protectedAttributeKeywords},
        {"fallback_keywords", &FairnessConfig::fallbackDemographicKeywords},
        {"target_keywords", &FairnessConfig::targetKeywords}
    };

    if (key == "delimiter") {
        config.delimiter = parseDelimiter(value, key);
        return;
    }
    if (key == "actual_suffix") {
        config.fairness.actualColumnSuffix = CommonUtils::toLower(value);
        return;
    }
    if (auto it = stringFields.find(key); it != stringFields.end()) {
        config.*(it->second) = value;
        return;
    }
    if (auto it = boolFields.find(key); it != boolFields.end()) {
        config.*(it->second) = parseBoolStrict(value, key);
        return;
    }
    if (auto it = thresholdFields.find(key); it != thresholdFields.end()) {
        config.fairness.*(it->second) = parseUnitIntervalStrict(value, key);
        return;
    }
    if (auto it = capFields.find(key); it != capFields.end()) {
        config.fairness.*(it->second) = parseSizeStrict(value, key, 1);
        return;
    }
    if (auto it = listFields.find(key); it != listFields.end()) {
        config.fairness.*(it->second) = parseKeywordList(value);
        return;
    }
    throw FairLens::ConfigurationException("Unknown config key: " + key);
}
} // namespace

void FairnessConfig::validate() const {
    auto checkUnit = [](double v, const char* name) {
        if (!(v >= 0.0 && v <= 1.0)) {
            throw FairLens::ConfigurationException(std::string(name) + " must be within [0,1]");
        }
    };
    checkUnit(disparateImpactThreshold, "disparate_impact_threshold");
    checkUnit(statisticalParityThreshold, "statistical_parity_threshold");
    checkUnit(equalOpportunityThreshold, "equal_opportunity_threshold");

    if (protectedAttributeKeywords.empty()) {
        throw FairLens::ConfigurationException("protected_keywords must not be empty");
    }
    if (targetKeywords.empty()) {
        throw FairLens::ConfigurationException("target_keywords must not be empty");
    }
    if (individualFairnessMaxRecords == 0) {
        throw FairLens::ConfigurationException("individual_fairness_max_records must be > 0");
    }
    if (counterfactualMaxRecords == 0) {
        throw FairLens::ConfigurationException("counterfactual_max_records must be > 0");
    }
    if (actualColumnSuffix.empty()) {
        throw FairLens::ConfigurationException("actual_suffix must not be empty");
    }
}

std::string RunConfig::usage() {
    return "Usage: fairlens <dataset.csv|dataset.parquet> [--config path] [--report file] [--history file] "
           "[--delimiter ,] [--extended true|false] [--verbose true|false] [--protected a,b] [--targets a,b] "
           "[--di-threshold 0..1] [--sp-threshold 0..1] [--eo-threshold 0..1] [--individual-cap N] "
           "[--counterfactual-cap N]";
}

RunConfig RunConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 2) {
        throw FairLens::ConfigurationException(usage());
    }

    RunConfig config;
    config.datasetPath = argv[1];

    // Config file values are the base; explicit flags override them.
    std::string configPath;
    for (int i = 2; i < argc; ++i) {
        if (std::string(argv[i]) == "--config" && i + 1 < argc) {
            configPath = argv[i + 1];
            break;
        }
    }
    if (!configPath.empty()) {
        config = fromFile(configPath, config);
        config.datasetPath = argv[1];
    }

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            ++i;
        } else if (arg == "--report" && i + 1 < argc) {
            config.reportFile = argv[++i];
        } else if (arg == "--history" && i + 1 < argc) {
            config.historyFile = argv[++i];
        } else if (arg == "--delimiter" && i + 1 < argc) {
            config.delimiter = parseDelimiter(argv[++i], "--delimiter");
        } else if (arg == "--extended" && i + 1 < argc) {
            config.extended = parseBoolStrict(argv[++i], "--extended");
        } else if (arg == "--verbose" && i + 1 < argc) {
            config.verbose = parseBoolStrict(argv[++i], "--verbose");
        } else if (arg == "--protected" && i + 1 < argc) {
            config.fairness.protectedAttributeKeywords = parseKeywordList(argv[++i]);
        } else if (arg == "--targets" && i + 1 < argc) {
            config.fairness.targetKeywords = parseKeywordList(argv[++i]);
        } else if (arg == "--di-threshold" && i + 1 < argc) {
            config.fairness.disparateImpactThreshold = parseUnitIntervalStrict(argv[++i], "--di-threshold");
        } else if (arg == "--sp-threshold" && i + 1 < argc) {
            config.fairness.statisticalParityThreshold = parseUnitIntervalStrict(argv[++i], "--sp-threshold");
        } else if (arg == "--eo-threshold" && i + 1 < argc) {
            config.fairness.equalOpportunityThreshold = parseUnitIntervalStrict(argv[++i], "--eo-threshold");
        } else if (arg == "--individual-cap" && i + 1 < argc) {
            config.fairness.individualFairnessMaxRecords = parseSizeStrict(argv[++i], "--individual-cap", 1);
        } else if (arg == "--counterfactual-cap" && i + 1 < argc) {
            config.fairness.counterfactualMaxRecords = parseSizeStrict(argv[++i], "--counterfactual-cap", 1);
        } else {
            throw FairLens::ConfigurationException("Unknown or incomplete argument: " + arg + "\n" + usage());
        }
    }

    config.validate();
    return config;
}

RunConfig RunConfig::fromFile(const std::string& configPath, const RunConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw FairLens::ConfigurationException("Could not open config file: " + configPath);

    RunConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Support loose YAML (key: value) and loose JSON-ish ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        const std::string key = normalizeConfigKey(unquote(line.substr(0, sep)));
        const std::string value = unquote(line.substr(sep + 1));

        try {
            assignKeyValue(config, key, value);
        } catch (const FairLens::FairLensException& ex) {
            throw FairLens::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    config.validate();

    return config;
}

void RunConfig::validate() const {
    if (datasetPath.empty()) {
        throw FairLens::ConfigurationException("dataset path must not be empty");
    }
    if (reportFile.empty()) {
        throw FairLens::ConfigurationException("report file must not be empty");
    }
    if (delimiter == '\n' || delimiter == '\r' || delimiter == '"') {
        throw FairLens::ConfigurationException("delimiter must not be a quote or line break");
    }
    fairness.validate();
}
