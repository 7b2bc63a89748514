#pragma once

#include <cstdint>
#include <string>
#include <vector>

enum class CellKind { EMPTY, NUMBER, TEXT, DATE };

/**
 * A single typed cell. Every non-empty cell keeps its trimmed source text so grouping
 * and equality checks see what the data source provided; numeric and date coercion
 * happen once, when the cell is created.
 */
struct CellValue {
    CellKind kind = CellKind::EMPTY;
    double number = 0.0;
    int64_t unixSeconds = 0;
    std::string text;

    /**
     * @brief Types a raw token: missing markers -> EMPTY, full numeric parse -> NUMBER,
     *        ISO date/datetime -> DATE, anything else -> TEXT.
     */
    static CellValue parse(const std::string& raw);
    static CellValue fromNumber(double value);
    static CellValue fromText(std::string value);
    static CellValue fromDate(int64_t unixSeconds);

    bool isEmpty() const noexcept { return kind == CellKind::EMPTY; }
    bool isNumber() const noexcept { return kind == CellKind::NUMBER; }
    bool isDate() const noexcept { return kind == CellKind::DATE; }
};

class Record {
public:
    explicit Record(std::vector<CellValue> values) : values_(std::move(values)) {}

    size_t size() const noexcept { return values_.size(); }
    const CellValue& at(size_t column) const;

private:
    std::vector<CellValue> values_;
};

/**
 * Ordered snapshot of records sharing one normalized header. Built once by a data
 * source and read-only for the rest of an analysis; subsets are new datasets.
 */
class Dataset {
public:
    Dataset() = default;
    explicit Dataset(std::vector<std::string> columns);

    /**
     * @brief Builds a dataset from raw string rows, normalizing the header and typing every cell.
     * @post Short rows are padded with EMPTY cells, long rows are truncated to the header width.
     */
    static Dataset fromRows(const std::vector<std::string>& header,
                            const std::vector<std::vector<std::string>>& rows);

    void addRecord(std::vector<CellValue> values);

    const std::vector<std::string>& columns() const noexcept { return columns_; }
    const std::vector<Record>& records() const noexcept { return records_; }
    size_t rowCount() const noexcept { return records_.size(); }
    size_t colCount() const noexcept { return columns_.size(); }

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;
    const CellValue& value(size_t row, size_t column) const;

    Dataset subset(const std::vector<size_t>& rows) const;

private:
    std::vector<std::string> columns_;
    std::vector<Record> records_;
};

namespace DateUtils {
bool parseIsoDateTime(const std::string& value, int64_t& outUnixSeconds);
void civilFromUnixSeconds(int64_t unixSeconds, int& year, int& month, int& day);
std::string formatIsoDate(int64_t unixSeconds);
}
