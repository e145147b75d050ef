#pragma once

#include "Dialect.hpp"

namespace sqlcursor {

/**
 * @brief SQLite naming and type rules.
 *
 * SQLite may report "table.column" for columns of joins and compound
 * selects; the table prefix is stripped and the full name kept as an
 * untranslated alternate key.
 */
class SQLiteDialect : public Dialect {
public:
    using Dialect::Dialect;

    std::string name() const override { return "sqlite"; }

    std::optional<std::pair<std::string, std::string>>
    translateColname(const std::string& name) const override;

    std::string rawAffinity(int rawType) const override;
};

}  // namespace sqlcursor
