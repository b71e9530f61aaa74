#pragma once

#include <string>
#include <vector>

namespace drvkeep {

// RFC 4180 quoting: fields holding a comma, quote, CR or LF are wrapped in
// quotes with inner quotes doubled; all other fields are written verbatim.
std::string escapeCsvField(const std::string &field);

// Joins escaped fields with commas and terminates the row with '\n'.
std::string formatCsvRow(const std::vector<std::string> &fields);

// Parses a whole CSV document into rows of unescaped fields. Quoted fields
// may span lines. A trailing newline does not produce an empty row.
std::vector<std::vector<std::string>> parseCsv(const std::string &text);

} // namespace drvkeep
