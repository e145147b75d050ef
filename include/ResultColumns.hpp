#pragma once

#include "Elements.hpp"
#include "Types.hpp"
#include <string>
#include <variant>
#include <vector>

namespace sqlcursor {

// Alternate lookup key of a result column: a name or a construct identity
using ObjectKey = std::variant<std::string, const ClauseElement*>;

// One column a compiled statement declared it would return
struct ResultColumn {
    std::string name;               // key name
    std::string renderedName;       // name as rendered in the SQL text
    std::vector<ObjectKey> objects; // alternate keys
    TypePtr type;
};

struct ResultColumnStruct {
    std::vector<ResultColumn> columns;
    bool colsAreOrdered = true;
    bool textualOrdered = false;
    bool looseColumnNameMatching = false;
};

}  // namespace sqlcursor
