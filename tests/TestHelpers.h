#pragma once

#include "Dataset.h"

#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

namespace TestHelpers {

inline Dataset makeDataset(const std::vector<std::string>& header,
                           const std::vector<std::vector<std::string>>& rows) {
    return Dataset::fromRows(header, rows);
}

struct GroupSpec {
    std::string key;
    size_t count;
    size_t positives;
};

/**
 * Two-column dataset (attribute, target) where each group contributes `positives`
 * rows with outcome 1 followed by rows with outcome 0.
 */
inline Dataset makeBinaryOutcomes(const std::string& attribute,
                                  const std::string& target,
                                  const std::vector<GroupSpec>& groups) {
    std::vector<std::vector<std::string>> rows;
    for (const auto& g : groups) {
        for (size_t i = 0; i < g.count; ++i) {
            rows.push_back({g.key, i < g.positives ? "1" : "0"});
        }
    }
    return Dataset::fromRows({attribute, target}, rows);
}

// 70 Male at a 0.9 approval rate, 30 Female at 0.6.
inline Dataset genderApprovalDataset() {
    return makeBinaryOutcomes("gender", "approved", {{"Male", 70, 63}, {"Female", 30, 18}});
}

// Temporary file path removed when the guard goes out of scope.
class TempFile {
public:
    explicit TempFile(const std::string& name)
        : path_((std::filesystem::temp_directory_path() / ("fairlens_test_" + name)).string()) {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

} // namespace TestHelpers
