#pragma once

#include "Value.hpp"
#include <memory>
#include <optional>
#include <string>

namespace sqlcursor {

class Dialect;

/**
 * @brief Logical column type attached to declared result columns.
 *
 * A type knows how to turn a raw driver value into its final form. Its
 * static cache key takes part in statement cache keys.
 */
class TypeEngine {
public:
    virtual ~TypeEngine() = default;

    /**
     * @brief Affinity shared by all types of the same family.
     *
     * Structural comparison treats two types as equal when their affinity
     * matches, and dialects use it to tell whether a raw value already has
     * the right shape.
     */
    virtual std::string affinity() const = 0;

    // Name including parameters, e.g. "VARCHAR(30)"
    virtual std::string name() const { return affinity(); }

    virtual json staticCacheKey() const;

    /**
     * @brief Decoder for raw values reported with the given driver type code.
     *
     * Returns an empty Decoder when the driver already delivers values in
     * final form.
     */
    virtual Decoder resultProcessor(const Dialect& dialect, int rawType) const;

protected:
    // Conversion applied when the raw value does not have this type's shape
    virtual Decoder converter() const { return {}; }
};

using TypePtr = std::shared_ptr<const TypeEngine>;

class NullType : public TypeEngine {
public:
    std::string affinity() const override { return "null"; }
    Decoder resultProcessor(const Dialect&, int) const override { return {}; }
};

class Integer : public TypeEngine {
public:
    std::string affinity() const override { return "integer"; }

protected:
    Decoder converter() const override;
};

class Float : public TypeEngine {
public:
    std::string affinity() const override { return "float"; }

protected:
    Decoder converter() const override;
};

class String : public TypeEngine {
public:
    explicit String(std::optional<size_t> length = std::nullopt)
        : m_length(length) {}

    std::string affinity() const override { return "string"; }
    std::string name() const override;
    json staticCacheKey() const override;

    std::optional<size_t> length() const { return m_length; }

protected:
    Decoder converter() const override;

private:
    std::optional<size_t> m_length;
};

class Boolean : public TypeEngine {
public:
    std::string affinity() const override { return "boolean"; }

protected:
    Decoder converter() const override;
};

class LargeBinary : public TypeEngine {
public:
    std::string affinity() const override { return "binary"; }

protected:
    Decoder converter() const override;
};

/**
 * @brief Application-defined type layered over a base type.
 *
 * The base type's decoder runs first, then the user function.
 */
class DecoratedType : public TypeEngine {
public:
    DecoratedType(TypePtr impl, std::string name, Decoder processResult);

    std::string affinity() const override { return m_impl->affinity(); }
    std::string name() const override { return m_name; }
    json staticCacheKey() const override;
    Decoder resultProcessor(const Dialect& dialect, int rawType) const override;

private:
    TypePtr m_impl;
    std::string m_name;
    Decoder m_processResult;
};

// Shared instances
TypePtr nullType();
TypePtr integerType();
TypePtr floatType();
TypePtr stringType();
TypePtr booleanType();
TypePtr binaryType();

}  // namespace sqlcursor
