#pragma once

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Tokenizes delimited text into raw string fields. Typing is left to Dataset.

void skipBOM(std::istream& is);

/**
 * @brief Reads one logical CSV record, following quoted fields across line breaks.
 * @param malformed Set when the record ends inside an open quote.
 * @post Returns an empty vector at EOF or for a blank line.
 */
std::vector<std::string> parseCSVLine(std::istream& is, char delimiter, bool* malformed = nullptr);

/**
 * @brief Trims and lower-cases header names, naming blanks column_N and suffixing duplicates.
 */
std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);
}
