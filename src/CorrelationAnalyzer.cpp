#include "CorrelationAnalyzer.h"
#include "Statistics.h"

#include <algorithm>
#include <cmath>

double CorrelationAnalyzer::correlate(const Dataset& data, size_t columnA, size_t columnB) {
    std::vector<double> x;
    std::vector<double> y;
    for (const auto& record : data.records()) {
        const CellValue& a = record.at(columnA);
        const CellValue& b = record.at(columnB);
        if (!a.isNumber() || !b.isNumber()) continue;
        x.push_back(a.number);
        y.push_back(b.number);
    }
    return Statistics::pearson(x, y).value_or(0.0);
}

Severity CorrelationAnalyzer::riskFor(double correlation) {
    const double magnitude = std::abs(correlation);
    if (magnitude > kHighRisk) return Severity::HIGH;
    if (magnitude > kMediumRisk) return Severity::MEDIUM;
    return Severity::LOW;
}

std::string CorrelationAnalyzer::recommendationFor(Severity risk) {
    switch (risk) {
        case Severity::HIGH:
            return "Strong proxy for a protected attribute; consider removing or transforming this feature.";
        case Severity::MEDIUM:
            return "Moderate association with a protected attribute; monitor this feature for indirect bias.";
        case Severity::LOW:
            break;
    }
    return "Low proxy risk.";
}

std::vector<ProxyCorrelation> CorrelationAnalyzer::analyze(const Dataset& data, const ProfileResult& profile) {
    std::vector<ProxyCorrelation> out;
    auto contains = [](const std::vector<std::string>& list, const std::string& name) {
        return std::find(list.begin(), list.end(), name) != list.end();
    };

    for (const auto& attribute : profile.protectedAttributes) {
        const int attrIdx = data.findColumnIndex(attribute);
        if (attrIdx < 0) continue;

        for (size_t c = 0; c < data.colCount(); ++c) {
            const std::string& feature = data.columns()[c];
            if (contains(profile.protectedAttributes, feature) || contains(profile.targetColumns, feature)) continue;

            ProxyCorrelation pc;
            pc.feature = feature;
            pc.protectedAttribute = attribute;
            pc.correlation = correlate(data, c, static_cast<size_t>(attrIdx));
            pc.risk = riskFor(pc.correlation);
            pc.recommendation = recommendationFor(pc.risk);
            out.push_back(std::move(pc));
        }
    }
    return out;
}
