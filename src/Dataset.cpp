#include "Dataset.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include "FairLensExceptions.h"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <system_error>

namespace {
const CellValue kEmptyCell{};

bool isMissingToken(const std::string& trimmed) {
    if (trimmed.empty()) return true;
    const std::string s = CommonUtils::toLower(trimmed);
    return s == "na" || s == "n/a" || s == "null" || s == "nan";
}

bool parseNumber(const std::string& trimmed, double& out) {
    std::string cleaned = trimmed;
    if (!cleaned.empty() && cleaned.front() == '+') cleaned.erase(cleaned.begin());
    if (cleaned.empty()) return false;

    const char* b = cleaned.data();
    const char* e = b + cleaned.size();
    auto [p, ec] = std::from_chars(b, e, out, std::chars_format::general);
    return ec == std::errc{} && p == e && std::isfinite(out);
}

std::string formatNumber(double value) {
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{}) return std::to_string(value);
    return std::string(buf, ptr);
}

bool parseFixedInt(const std::string& s, size_t offset, size_t len, int& out) {
    if (offset + len > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < len; ++i) {
        unsigned char ch = static_cast<unsigned char>(s[offset + i]);
        if (ch < '0' || ch > '9') return false;
        value = value * 10 + static_cast<int>(ch - '0');
    }
    out = value;
    return true;
}

bool isLeapYear(int year) {
    if (year % 400 == 0) return true;
    if (year % 100 == 0) return false;
    return (year % 4 == 0);
}

int daysInMonth(int year, int month) {
    static const int kMonthDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2) return isLeapYear(year) ? 29 : 28;
    return kMonthDays[month - 1];
}

int64_t daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const int mp = static_cast<int>(m) + (m > 2 ? -3 : 9);
    const unsigned doy = (153 * static_cast<unsigned>(mp) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
}

// HH:MM or HH:MM:SS, optionally followed by fractional seconds or a trailing Z.
bool parseTimePart(const std::string& timePart, int& hour, int& minute, int& second) {
    hour = minute = second = 0;
    if (timePart.empty()) return true;
    if (timePart.size() < 5) return false;
    if (!parseFixedInt(timePart, 0, 2, hour) || timePart[2] != ':' || !parseFixedInt(timePart, 3, 2, minute)) {
        return false;
    }
    size_t pos = 5;
    if (pos < timePart.size() && timePart[pos] == ':') {
        if (!parseFixedInt(timePart, pos + 1, 2, second)) return false;
        pos += 3;
    }
    if (pos < timePart.size() && timePart[pos] == '.') {
        ++pos;
        while (pos < timePart.size() && std::isdigit(static_cast<unsigned char>(timePart[pos]))) ++pos;
    }
    if (pos < timePart.size() && timePart[pos] == 'Z') ++pos;
    return pos == timePart.size();
}
} // namespace

namespace DateUtils {

bool parseIsoDateTime(const std::string& value, int64_t& outUnixSeconds) {
    const std::string s = CommonUtils::trim(value);
    if (s.size() < 10 || s[4] != '-' || s[7] != '-') return false;

    int year = 0;
    int month = 0;
    int day = 0;
    if (!parseFixedInt(s, 0, 4, year) || !parseFixedInt(s, 5, 2, month) || !parseFixedInt(s, 8, 2, day)) {
        return false;
    }

    std::string timePart;
    if (s.size() > 10) {
        if (s[10] != ' ' && s[10] != 'T') return false;
        timePart = s.substr(11);
    }

    int hour = 0;
    int minute = 0;
    int second = 0;
    if (!parseTimePart(timePart, hour, minute, second)) return false;

    if (month < 1 || month > 12) return false;
    if (day < 1 || day > daysInMonth(year, month)) return false;
    if (hour > 23 || minute > 59 || second > 60) return false;

    const int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    outUnixSeconds = days * 86400 + static_cast<int64_t>(hour) * 3600 + static_cast<int64_t>(minute) * 60 + second;
    return true;
}

void civilFromUnixSeconds(int64_t unixSeconds, int& year, int& month, int& day) {
    int64_t days = unixSeconds / 86400;
    if (unixSeconds % 86400 < 0) --days;

    const int64_t z = days + 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    year = static_cast<int>(static_cast<int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0));
    month = static_cast<int>(m);
    day = static_cast<int>(d);
}

std::string formatIsoDate(int64_t unixSeconds) {
    int year = 0;
    int month = 0;
    int day = 0;
    civilFromUnixSeconds(unixSeconds, year, month, day);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

} // namespace DateUtils

CellValue CellValue::parse(const std::string& raw) {
    std::string s = CommonUtils::trim(raw);
    if (isMissingToken(s)) return CellValue{};

    CellValue cell;
    double number = 0.0;
    int64_t ts = 0;
    if (parseNumber(s, number)) {
        cell.kind = CellKind::NUMBER;
        cell.number = number;
    } else if (DateUtils::parseIsoDateTime(s, ts)) {
        cell.kind = CellKind::DATE;
        cell.unixSeconds = ts;
    } else {
        cell.kind = CellKind::TEXT;
    }
    cell.text = std::move(s);
    return cell;
}

CellValue CellValue::fromNumber(double value) {
    if (!std::isfinite(value)) return CellValue{};
    CellValue cell;
    cell.kind = CellKind::NUMBER;
    cell.number = value;
    cell.text = formatNumber(value);
    return cell;
}

CellValue CellValue::fromText(std::string value) {
    std::string s = CommonUtils::trim(value);
    if (s.empty()) return CellValue{};
    CellValue cell;
    cell.kind = CellKind::TEXT;
    cell.text = std::move(s);
    return cell;
}

CellValue CellValue::fromDate(int64_t unixSeconds) {
    CellValue cell;
    cell.kind = CellKind::DATE;
    cell.unixSeconds = unixSeconds;
    cell.text = DateUtils::formatIsoDate(unixSeconds);
    return cell;
}

const CellValue& Record::at(size_t column) const {
    if (column >= values_.size()) return kEmptyCell;
    return values_[column];
}

Dataset::Dataset(std::vector<std::string> columns) : columns_(std::move(columns)) {}

Dataset Dataset::fromRows(const std::vector<std::string>& header,
                          const std::vector<std::vector<std::string>>& rows) {
    if (header.empty()) throw FairLens::DatasetException("Header has no columns");

    Dataset data(CSVUtils::normalizeHeader(header));
    for (const auto& row : rows) {
        std::vector<CellValue> cells;
        cells.reserve(data.colCount());
        for (size_t c = 0; c < data.colCount(); ++c) {
            cells.push_back(c < row.size() ? CellValue::parse(row[c]) : CellValue{});
        }
        data.records_.emplace_back(std::move(cells));
    }
    return data;
}

void Dataset::addRecord(std::vector<CellValue> values) {
    values.resize(columns_.size());
    records_.emplace_back(std::move(values));
}

int Dataset::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i] == name) return static_cast<int>(i);
    return -1;
}

const CellValue& Dataset::value(size_t row, size_t column) const {
    if (row >= records_.size()) return kEmptyCell;
    return records_[row].at(column);
}

Dataset Dataset::subset(const std::vector<size_t>& rows) const {
    Dataset out(columns_);
    out.records_.reserve(rows.size());
    for (size_t r : rows) {
        if (r >= records_.size()) {
            throw FairLens::DatasetException("Subset row index out of range: " + std::to_string(r));
        }
        out.records_.push_back(records_[r]);
    }
    return out;
}
