#include "DataSource.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include "FairLensExceptions.h"

#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>
#ifdef FAIRLENS_USE_NATIVE_PARQUET
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#endif

namespace {
#ifdef FAIRLENS_USE_NATIVE_PARQUET
int64_t timestampToSeconds(int64_t value, arrow::TimeUnit::type unit) {
    switch (unit) {
        case arrow::TimeUnit::SECOND: return value;
        case arrow::TimeUnit::MILLI: return value / 1000;
        case arrow::TimeUnit::MICRO: return value / 1000000;
        case arrow::TimeUnit::NANO: return value / 1000000000;
    }
    return value;
}

CellValue cellFromArray(const arrow::Array& array, int64_t i) {
    if (array.IsNull(i)) return CellValue{};

    switch (array.type_id()) {
        case arrow::Type::DOUBLE:
            return CellValue::fromNumber(static_cast<const arrow::DoubleArray&>(array).Value(i));
        case arrow::Type::FLOAT:
            return CellValue::fromNumber(static_cast<double>(static_cast<const arrow::FloatArray&>(array).Value(i)));
        case arrow::Type::INT32:
            return CellValue::fromNumber(static_cast<double>(static_cast<const arrow::Int32Array&>(array).Value(i)));
        case arrow::Type::INT64:
            return CellValue::fromNumber(static_cast<double>(static_cast<const arrow::Int64Array&>(array).Value(i)));
        case arrow::Type::BOOL:
            return CellValue::fromNumber(static_cast<const arrow::BooleanArray&>(array).Value(i) ? 1.0 : 0.0);
        case arrow::Type::STRING:
            return CellValue::parse(static_cast<const arrow::StringArray&>(array).GetString(i));
        case arrow::Type::LARGE_STRING:
            return CellValue::parse(static_cast<const arrow::LargeStringArray&>(array).GetString(i));
        case arrow::Type::DATE32:
            return CellValue::fromDate(static_cast<int64_t>(static_cast<const arrow::Date32Array&>(array).Value(i)) * 86400);
        case arrow::Type::TIMESTAMP: {
            const auto& ts = static_cast<const arrow::TimestampArray&>(array);
            const auto& tsType = static_cast<const arrow::TimestampType&>(*ts.type());
            return CellValue::fromDate(timestampToSeconds(ts.Value(i), tsType.unit()));
        }
        default: {
            auto scalar = array.GetScalar(i);
            if (!scalar.ok()) return CellValue{};
            return CellValue::parse(scalar.ValueOrDie()->ToString());
        }
    }
}
#endif
} // namespace

Dataset DataSource::load(const std::string& path, char delimiter) {
    const std::string ext = CommonUtils::toLower(std::filesystem::path(path).extension().string());
    if (ext == ".parquet") {
        return loadParquet(path);
    }
    return loadCsvFile(path, delimiter);
}

Dataset DataSource::loadCsvFile(const std::string& path, char delimiter) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw FairLens::IOException("Could not open file: " + path);
    return loadCsv(in, delimiter);
}

Dataset DataSource::loadCsv(std::istream& in, char delimiter) {
    CSVUtils::skipBOM(in);

    bool malformed = false;
    std::vector<std::string> header = CSVUtils::parseCSVLine(in, delimiter, &malformed);
    if (malformed || header.empty()) throw FairLens::DatasetException("Malformed or empty CSV header");

    std::vector<std::vector<std::string>> rows;
    while (in.peek() != EOF) {
        auto row = CSVUtils::parseCSVLine(in, delimiter, &malformed);
        if (row.empty() || malformed) continue;
        rows.push_back(std::move(row));
    }
    return Dataset::fromRows(header, rows);
}

bool DataSource::parquetSupported() noexcept {
#ifdef FAIRLENS_USE_NATIVE_PARQUET
    return true;
#else
    return false;
#endif
}

Dataset DataSource::loadParquet(const std::string& path) {
#ifdef FAIRLENS_USE_NATIVE_PARQUET
    auto openRes = arrow::io::ReadableFile::Open(path);
    if (!openRes.ok()) {
        throw FairLens::IOException("Could not open parquet file: " + path + " (" + openRes.status().ToString() + ")");
    }

    auto readerRes = parquet::arrow::OpenFile(openRes.ValueOrDie(), arrow::default_memory_pool());
    if (!readerRes.ok()) {
        throw FairLens::DatasetException("Not a readable parquet file: " + readerRes.status().ToString());
    }
    std::unique_ptr<parquet::arrow::FileReader> reader = readerRes.MoveValueUnsafe();

    std::shared_ptr<arrow::Table> table;
    auto status = reader->ReadTable(&table);
    if (!status.ok()) {
        throw FairLens::DatasetException("Parquet read failed: " + status.ToString());
    }

    std::vector<std::string> header;
    header.reserve(static_cast<size_t>(table->num_columns()));
    for (const auto& field : table->schema()->fields()) header.push_back(field->name());

    Dataset data = Dataset::fromRows(header, {});
    const size_t rows = static_cast<size_t>(table->num_rows());
    std::vector<std::vector<CellValue>> cells(rows, std::vector<CellValue>(header.size()));

    for (int c = 0; c < table->num_columns(); ++c) {
        const auto& column = table->column(c);
        size_t r = 0;
        for (int chunk = 0; chunk < column->num_chunks(); ++chunk) {
            const auto& arr = column->chunk(chunk);
            for (int64_t i = 0; i < arr->length() && r < rows; ++i, ++r) {
                cells[r][static_cast<size_t>(c)] = cellFromArray(*arr, i);
            }
        }
    }
    for (auto& row : cells) data.addRecord(std::move(row));
    return data;
#else
    throw FairLens::DatasetException("Parquet input requested for " + path +
                                     ", but this build was compiled without native parquet support. "
                                     "Rebuild with Arrow/Parquet libraries available or convert the file to CSV.");
#endif
}
