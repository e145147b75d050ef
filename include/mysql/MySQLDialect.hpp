#pragma once

#include "Dialect.hpp"

namespace sqlcursor {

// Maps enum_field_types to the affinity of values MySQLCursor delivers
class MySQLDialect : public Dialect {
public:
    using Dialect::Dialect;

    std::string name() const override { return "mysql"; }

    std::string rawAffinity(int rawType) const override;
};

}  // namespace sqlcursor
