#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace CSVUtils {
// Record-level CSV tokenization and field quoting. No type inference happens here.

void skipBOM(std::istream& is);

/**
 * @brief Reads one logical CSV record (quoted fields may span lines).
 * @post Returns an empty vector at EOF or for a blank line.
 * @post *malformed is set when a quoted field is left unterminated.
 */
std::vector<std::string> parseCSVLine(std::istream& is, char delimiter, bool* malformed = nullptr);

// Quotes a field when it contains the delimiter, a quote or a line break.
std::string quoteField(const std::string& value, char delimiter);

void writeCSVLine(std::ostream& os, const std::vector<std::string>& fields, char delimiter);
}
