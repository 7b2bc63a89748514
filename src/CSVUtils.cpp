#include "CSVUtils.h"
#include "CommonUtils.h"

#include <unordered_set>

namespace CSVUtils {

void skipBOM(std::istream& is) {
    if (!is.good()) return;
    static const unsigned char kBom[3] = {0xEF, 0xBB, 0xBF};

    const std::streampos start = is.tellg();
    for (unsigned char expected : kBom) {
        const int ch = is.peek();
        if (ch == EOF || static_cast<unsigned char>(ch) != expected) {
            is.clear();
            is.seekg(start);
            return;
        }
        is.get();
    }
}

std::vector<std::string> parseCSVLine(std::istream& is, char delimiter, bool* malformed) {
    if (malformed) *malformed = false;
    if (is.peek() == EOF) return {};

    std::vector<std::string> row;
    std::string val;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool sawDelimiter = false;
    char c;

    auto pushField = [&]() {
        row.push_back(fieldQuoted ? val : CommonUtils::trim(val));
        val.clear();
        fieldQuoted = false;
    };

    while (is.get(c)) {
        if (inQuotes) {
            if (c == '"') {
                if (is.peek() == '"') {
                    is.get();
                    val += '"';
                } else {
                    inQuotes = false;
                }
            } else if (c == '\r') {
                if (is.peek() == '\n') is.get();
                val += '\n';
            } else {
                val += c;
            }
            continue;
        }

        if (c == '"' && CommonUtils::trim(val).empty()) {
            val.clear();
            inQuotes = true;
            fieldQuoted = true;
        } else if (c == delimiter) {
            pushField();
            sawDelimiter = true;
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            break;
        } else {
            val += c;
        }
    }

    if (inQuotes && malformed) *malformed = true;

    if (!sawDelimiter && !fieldQuoted && CommonUtils::trim(val).empty()) {
        return {};
    }
    pushField();
    return row;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out;
    out.reserve(header.size());
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < header.size(); ++i) {
        std::string name = CommonUtils::toLower(CommonUtils::trim(header[i]));
        if (name.empty()) name = "column_" + std::to_string(i + 1);

        if (seen.count(name)) {
            size_t suffix = 2;
            while (seen.count(name + "_" + std::to_string(suffix))) ++suffix;
            name += "_" + std::to_string(suffix);
        }
        seen.insert(name);
        out.push_back(std::move(name));
    }
    return out;
}

} // namespace CSVUtils
