#pragma once

#include "Types.hpp"
#include <optional>
#include <string>
#include <utility>

namespace sqlcursor {

struct DialectOptions {
    bool caseSensitive = true;
    bool normalizeNames = false;
};

/**
 * @brief Backend-specific knowledge consumed by the result layer.
 *
 * Supplies column name translation and normalization, case sensitivity of
 * name lookups, and decoder selection from (logical type, raw type code).
 */
class Dialect {
public:
    explicit Dialect(DialectOptions options = {})
        : m_options(options) {}
    virtual ~Dialect() = default;

    virtual std::string name() const { return "default"; }

    bool caseSensitive() const { return m_options.caseSensitive; }
    bool requiresNameNormalize() const { return m_options.normalizeNames; }

    /**
     * @brief Translate a raw column name reported by the driver.
     * @return (translated, untranslated) when the driver decorated the name,
     *         std::nullopt when the name is used as is
     */
    virtual std::optional<std::pair<std::string, std::string>>
    translateColname(const std::string& name) const;

    // Backend-reported name to the case convention of the application
    virtual std::string normalizeName(const std::string& name) const;

    /**
     * @brief Affinity of values the driver delivers for a raw type code.
     *
     * Empty when the code is unknown; decoders are then always applied.
     */
    virtual std::string rawAffinity(int rawType) const;

    Decoder resultProcessor(const TypeEngine& type, int rawType) const {
        return type.resultProcessor(*this, rawType);
    }

    // Fold a lookup name according to case sensitivity
    std::string foldName(const std::string& name) const;

private:
    DialectOptions m_options;
};

}  // namespace sqlcursor
