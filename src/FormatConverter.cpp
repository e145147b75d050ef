#include "FormatConverter.hpp"
#include <algorithm>
#include <sstream>

namespace sqlcursor {

namespace {

// One CSV record; null entries render as the configured NULL text
void writeRecord(std::ostream& out, const std::vector<const Value*>& fields,
                 const CSVOptions& options) {
    bool first = true;
    for (const Value* field : fields) {
        if (!first) {
            out << options.delimiter;
        }
        first = false;
        out << (isNull(*field) ? options.nullText
                               : FormatConverter::escapeCSVField(toString(*field), options));
    }
    out << options.lineEnding;
}

std::string dump(const json& document, const JSONOptions& options) {
    return options.pretty ? document.dump(options.indent) : document.dump();
}

void setMember(json& obj, const std::string& key, const Value& value,
               const JSONOptions& options) {
    if (!isNull(value)) {
        obj[key] = toJson(value);
    } else if (options.includeNull) {
        obj[key] = nullptr;
    }
}

}  // namespace

std::string FormatConverter::toCSV(const std::vector<std::string>& columns,
                                   const std::vector<Row>& rows,
                                   const CSVOptions& options) {
    std::ostringstream out;

    if (options.includeHeader) {
        std::vector<Value> header(columns.begin(), columns.end());
        std::vector<const Value*> fields;
        fields.reserve(header.size());
        for (const auto& name : header) {
            fields.push_back(&name);
        }
        writeRecord(out, fields, options);
    }

    std::vector<const Value*> fields;
    for (const auto& row : rows) {
        fields.clear();
        for (const auto& value : row) {
            fields.push_back(&value);
        }
        writeRecord(out, fields, options);
    }

    return out.str();
}

json FormatConverter::rowObject(const std::vector<std::string>& columns, const Row& row,
                                const JSONOptions& options) {
    json obj = json::object();
    const size_t width = std::min(columns.size(), row.size());
    for (size_t i = 0; i < width; ++i) {
        setMember(obj, columns[i], row[i], options);
    }
    return obj;
}

std::string FormatConverter::toJSON(const std::vector<std::string>& columns,
                                    const std::vector<Row>& rows,
                                    const JSONOptions& options) {
    json records = json::array();
    for (const auto& row : rows) {
        records.push_back(rowObject(columns, row, options));
    }

    if (options.arrayFormat) {
        return dump(records, options);
    }
    return dump(json{{"columns", columns}, {"rows", std::move(records)}}, options);
}

std::string FormatConverter::rowToJSON(const RowMapping& row, const JSONOptions& options) {
    json obj = json::object();
    for (const auto& [key, value] : row.items()) {
        setMember(obj, key, value, options);
    }
    return dump(obj, options);
}

std::string FormatConverter::escapeCSVField(const std::string& field,
                                            const CSVOptions& options) {
    const bool special = std::any_of(field.begin(), field.end(), [&options](char c) {
        return c == options.delimiter || c == options.quote || c == '\n' || c == '\r';
    });
    if (!options.quoteAll && !special) {
        return field;
    }

    // Quote characters inside the field are doubled
    std::string quoted(1, options.quote);
    for (char c : field) {
        if (c == options.quote) {
            quoted += options.quote;
        }
        quoted += c;
    }
    quoted += options.quote;
    return quoted;
}

}  // namespace sqlcursor
