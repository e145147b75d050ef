#pragma once

#include "Row.hpp"
#include "Value.hpp"
#include <string>
#include <vector>

namespace sqlcursor {

// Options structs declared outside the class to avoid default argument issues
struct CSVOptions {
    char delimiter = ',';
    char quote = '"';
    std::string lineEnding = "\n";
    bool includeHeader = true;
    bool quoteAll = false;
    std::string nullText;       // NULL renders as an empty field by default
};

struct JSONOptions {
    bool pretty = true;
    int indent = 2;
    bool includeNull = true;
    bool arrayFormat = true;  // true = array of objects, false = object with columns and rows
};

// Renders result rows for output
class FormatConverter {
public:
    static std::string toCSV(const std::vector<std::string>& columns,
                             const std::vector<Row>& rows,
                             const CSVOptions& options = CSVOptions{});

    static std::string toJSON(const std::vector<std::string>& columns,
                              const std::vector<Row>& rows,
                              const JSONOptions& options = JSONOptions{});

    static std::string rowToJSON(const RowMapping& row, const JSONOptions& options = JSONOptions{});

    static std::string escapeCSVField(const std::string& field,
                                      const CSVOptions& options = CSVOptions{});

private:
    static json rowObject(const std::vector<std::string>& columns, const Row& row,
                          const JSONOptions& options);
};

}  // namespace sqlcursor
