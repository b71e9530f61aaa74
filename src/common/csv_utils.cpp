#include "common/csv_utils.hpp"

#include <utility>

namespace drvkeep {

std::string escapeCsvField(const std::string &field)
{
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }

    std::string escaped;
    escaped.reserve(field.size() + 2);
    escaped.push_back('"');
    for (const char ch : field) {
        if (ch == '"') {
            escaped.push_back('"');
        }
        escaped.push_back(ch);
    }
    escaped.push_back('"');
    return escaped;
}

std::string formatCsvRow(const std::vector<std::string> &fields)
{
    std::string row;
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            row.push_back(',');
        }
        row += escapeCsvField(fields[i]);
    }
    row.push_back('\n');
    return row;
}

std::vector<std::vector<std::string>> parseCsv(const std::string &text)
{
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> row;
    std::string field;
    bool inQuotes = false;
    bool rowHasContent = false;

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char ch = text[i];
        if (inQuotes) {
            if (ch == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field.push_back(ch);
            }
            continue;
        }

        switch (ch) {
        case '"':
            inQuotes = true;
            rowHasContent = true;
            break;
        case ',':
            row.push_back(std::move(field));
            field.clear();
            rowHasContent = true;
            break;
        case '\r':
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                break;
            }
            [[fallthrough]];
        case '\n':
            row.push_back(std::move(field));
            field.clear();
            rows.push_back(std::move(row));
            row.clear();
            rowHasContent = false;
            break;
        default:
            field.push_back(ch);
            rowHasContent = true;
            break;
        }
    }

    if (rowHasContent || !field.empty()) {
        row.push_back(std::move(field));
        rows.push_back(std::move(row));
    }
    return rows;
}

} // namespace drvkeep
