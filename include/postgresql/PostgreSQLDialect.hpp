#pragma once

#include "Dialect.hpp"

namespace sqlcursor {

// Maps Oids to the affinity of values PostgreSQLCursor delivers
class PostgreSQLDialect : public Dialect {
public:
    using Dialect::Dialect;

    std::string name() const override { return "postgresql"; }

    std::string rawAffinity(int rawType) const override;
};

}  // namespace sqlcursor
