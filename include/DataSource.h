#pragma once

#include "Dataset.h"

#include <istream>
#include <string>

/**
 * Reads tabular stores into a Dataset snapshot. The analysis core never touches files;
 * callers load once here and hand the snapshot over.
 */
class DataSource {
public:
    /**
     * @brief Loads a dataset, choosing the reader from the file extension (.parquet or delimited text).
     * @throws FairLens::IOException when the file cannot be opened.
     * @throws FairLens::DatasetException on malformed input or missing Parquet support.
     */
    static Dataset load(const std::string& path, char delimiter = ',');

    static Dataset loadCsv(std::istream& in, char delimiter = ',');
    static Dataset loadCsvFile(const std::string& path, char delimiter = ',');
    static Dataset loadParquet(const std::string& path);

    static bool parquetSupported() noexcept;
};
