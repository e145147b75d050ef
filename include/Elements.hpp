#pragma once

/**
 * @file Elements.hpp
 * @brief Statement construct tree consumed by cache key generation,
 *        structural comparison and result-column declaration.
 *
 * Every node describes its own attributes through traverseInternals():
 * an ordered list of (attribute name, visit kind, value) entries. Cache key
 * generation and comparison are driven entirely by that metadata, so new
 * node types only have to describe themselves.
 */

#include "Types.hpp"
#include "Value.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sqlcursor {

// How a traversal attribute takes part in cache keys and comparison
enum class VisitKind {
    ClauseElement,          // single nested node
    ClauseElementList,      // ordered list of nested nodes
    ClauseElementTuples,    // ordered list of tuples of nested nodes
    PlainValue,             // literal embedded in the key
    String,
    Boolean,
    Operator,
    Type,                   // contributes the type's static cache key
    AnonName,               // name rendered through the anonymous map
    UnorderedSet,           // nested nodes whose order does not matter
    BindValue,              // extracted as a parameter, never part of the key
    UnknownStructure        // no traversal metadata: element is uncacheable
};

constexpr size_t kVisitKindCount = 12;

enum class Operator {
    And,
    Or,
    Comma,
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
    Add,
    Sub,
    Mul,
    Div,
    Concat,
    Like,
    In,
    Is,
    IsNot,
    Not,
    Neg,
    Asc,
    Desc
};

struct OperatorInfo {
    const char* name;
    bool commutative;
    bool associative;
    bool comparison;
};

const OperatorInfo& operatorInfo(Operator op);

class ClauseElement;
class Column;

using ElementPtr = std::shared_ptr<const ClauseElement>;
using ElementList = std::vector<const ClauseElement*>;
using ElementTuples = std::vector<ElementList>;

// Name that is either fixed or derived from the identity of its owner
struct AnonName {
    const ClauseElement* owner = nullptr;   // nullptr for a fixed name
    std::string base;

    bool anonymous() const { return owner != nullptr; }

    bool operator==(const AnonName& other) const {
        return owner == other.owner && base == other.base;
    }
};

using Attribute = std::variant<std::monostate,
                               const ClauseElement*,
                               ElementList,
                               ElementTuples,
                               Value,
                               std::string,
                               bool,
                               Operator,
                               TypePtr,
                               AnonName>;

struct TraversalEntry {
    std::string name;
    VisitKind kind;
    Attribute value;
};

class ClauseElement {
public:
    virtual ~ClauseElement() = default;

    virtual std::string visitName() const = 0;
    virtual std::vector<TraversalEntry> traverseInternals() const = 0;

    virtual TypePtr type() const { return nullType(); }

    // Columns a row-returning statement exports, in select-list order
    virtual ElementList exportedColumns() const { return {}; }

    // Elements this one was derived from, itself included
    virtual ElementList proxySet() const { return {this}; }

    bool sharesLineage(const ClauseElement& other) const;
};

class FromClause : public ClauseElement {
public:
    const std::vector<std::shared_ptr<const Column>>& columns() const { return m_columns; }

    // Column by name; throws InvalidRequestError when absent
    std::shared_ptr<const Column> c(const std::string& name) const;

protected:
    std::vector<std::shared_ptr<const Column>> m_columns;
};

class Table : public FromClause, public std::enable_shared_from_this<Table> {
public:
    static std::shared_ptr<Table> create(std::string name,
                                         std::vector<std::pair<std::string, TypePtr>> columns);

    std::string visitName() const override { return "table"; }
    std::vector<TraversalEntry> traverseInternals() const override;

    const std::string& name() const { return m_name; }

    // Aliased copy; anonymous unless a name is given
    std::shared_ptr<const class Alias> alias(std::optional<std::string> name = std::nullopt) const;

private:
    explicit Table(std::string name)
        : m_name(std::move(name)) {}

    std::string m_name;
};

class Alias : public FromClause {
public:
    Alias(std::shared_ptr<const Table> element, std::optional<std::string> name);

    std::string visitName() const override { return "alias"; }
    std::vector<TraversalEntry> traverseInternals() const override;

    const Table& element() const { return *m_element; }
    const AnonName& name() const { return m_name; }

private:
    std::shared_ptr<const Table> m_element;
    AnonName m_name;
};

class Column : public ClauseElement {
public:
    Column(std::string name, TypePtr type, const FromClause* table = nullptr,
           const Column* proxied = nullptr, bool isLiteral = false);

    std::string visitName() const override { return "column"; }
    std::vector<TraversalEntry> traverseInternals() const override;
    TypePtr type() const override { return m_type; }
    ElementList proxySet() const override;

    const std::string& name() const { return m_name; }
    const FromClause* table() const { return m_table; }

private:
    std::string m_name;
    TypePtr m_type;
    const FromClause* m_table;
    const Column* m_proxied;
    bool m_isLiteral;
};

class Label : public ClauseElement {
public:
    // Anonymous label when no name is given
    Label(std::optional<std::string> name, ElementPtr element);

    std::string visitName() const override { return "label"; }
    std::vector<TraversalEntry> traverseInternals() const override;
    TypePtr type() const override { return m_element->type(); }
    ElementList proxySet() const override;

    const AnonName& name() const { return m_name; }
    const ClauseElement& element() const { return *m_element; }

private:
    AnonName m_name;
    ElementPtr m_element;
};

class BindParameter : public ClauseElement {
public:
    // Anonymous key when none is given; type inferred from the value when null
    BindParameter(std::optional<std::string> key, Value value, TypePtr type = nullptr);

    std::string visitName() const override { return "bindparam"; }
    std::vector<TraversalEntry> traverseInternals() const override;
    TypePtr type() const override { return m_type; }

    const AnonName& key() const { return m_key; }
    const Value& value() const { return m_value; }

private:
    AnonName m_key;
    Value m_value;
    TypePtr m_type;
};

class Null : public ClauseElement {
public:
    std::string visitName() const override { return "null"; }
    std::vector<TraversalEntry> traverseInternals() const override { return {}; }
};

class BinaryExpression : public ClauseElement {
public:
    BinaryExpression(ElementPtr left, Operator op, ElementPtr right);

    std::string visitName() const override { return "binary"; }
    std::vector<TraversalEntry> traverseInternals() const override;
    TypePtr type() const override;

    const ClauseElement& left() const { return *m_left; }
    const ClauseElement& right() const { return *m_right; }
    Operator op() const { return m_operator; }

private:
    ElementPtr m_left;
    ElementPtr m_right;
    Operator m_operator;
};

class ClauseList : public ClauseElement {
public:
    ClauseList(Operator op, std::vector<ElementPtr> clauses);

    std::string visitName() const override { return "clauselist"; }
    std::vector<TraversalEntry> traverseInternals() const override;
    TypePtr type() const override { return booleanType(); }

    Operator op() const { return m_operator; }
    ElementList clauses() const;

private:
    Operator m_operator;
    std::vector<ElementPtr> m_clauses;
};

class UnaryExpression : public ClauseElement {
public:
    UnaryExpression(Operator op, ElementPtr element);

    std::string visitName() const override { return "unary"; }
    std::vector<TraversalEntry> traverseInternals() const override;
    TypePtr type() const override { return m_element->type(); }

private:
    Operator m_operator;
    ElementPtr m_element;
};

class FunctionCall : public ClauseElement {
public:
    FunctionCall(std::string name, std::vector<ElementPtr> arguments, TypePtr type);

    std::string visitName() const override { return "function"; }
    std::vector<TraversalEntry> traverseInternals() const override;
    TypePtr type() const override { return m_type; }

    const std::string& name() const { return m_name; }

private:
    std::string m_name;
    std::vector<ElementPtr> m_arguments;
    TypePtr m_type;
};

class Case : public ClauseElement {
public:
    using When = std::pair<ElementPtr, ElementPtr>;

    Case(std::vector<When> whens, ElementPtr elseResult = nullptr);

    std::string visitName() const override { return "case"; }
    std::vector<TraversalEntry> traverseInternals() const override;
    TypePtr type() const override;

private:
    std::vector<When> m_whens;
    ElementPtr m_else;
};

class TextClause : public ClauseElement {
public:
    explicit TextClause(std::string text, std::vector<ElementPtr> bindParameters = {});

    std::string visitName() const override { return "textclause"; }
    std::vector<TraversalEntry> traverseInternals() const override;

    const std::string& text() const { return m_text; }

private:
    std::string m_text;
    std::vector<ElementPtr> m_bindParameters;
};

/**
 * @brief Column-bearing element without traversal metadata.
 *
 * Stands for application constructs the key generator cannot see into;
 * any statement containing one is uncacheable.
 */
class OpaqueElement : public ClauseElement {
public:
    explicit OpaqueElement(std::string description)
        : m_description(std::move(description)) {}

    std::string visitName() const override { return "opaque"; }
    std::vector<TraversalEntry> traverseInternals() const override;

private:
    std::string m_description;
};

struct ResultColumnStruct;

// Common base for row-returning statements
class SelectBase : public ClauseElement {
public:
    // Declared result columns, as a compiler would record them
    virtual ResultColumnStruct resultColumns() const = 0;
};

/**
 * @brief Textual SQL with the columns it is expected to return.
 *
 * Positional columns are matched to the raw result by position, others by
 * name with loose matching on each column's alternate names.
 */
class TextualSelect : public SelectBase {
public:
    TextualSelect(std::shared_ptr<const TextClause> text, std::vector<ElementPtr> columns,
                  bool positional);

    std::string visitName() const override { return "textual_select"; }
    std::vector<TraversalEntry> traverseInternals() const override;
    ElementList exportedColumns() const override;
    ResultColumnStruct resultColumns() const override;

private:
    std::shared_ptr<const TextClause> m_text;
    std::vector<ElementPtr> m_columns;
    bool m_positional;
};

class Select : public SelectBase {
public:
    explicit Select(std::vector<ElementPtr> columns);

    std::string visitName() const override { return "select"; }
    std::vector<TraversalEntry> traverseInternals() const override;
    ElementList exportedColumns() const override;
    ResultColumnStruct resultColumns() const override;

    Select& from(ElementPtr fromClause);
    Select& where(ElementPtr criteria);
    Select& orderBy(ElementPtr clause);
    Select& groupBy(ElementPtr clause);
    Select& limit(int64_t count);
    Select& distinct(bool value = true);
    Select& correlate(ElementPtr fromClause);

private:
    std::vector<ElementPtr> m_columns;
    std::vector<ElementPtr> m_froms;
    std::vector<ElementPtr> m_where;
    std::vector<ElementPtr> m_orderBy;
    std::vector<ElementPtr> m_groupBy;
    std::vector<ElementPtr> m_correlate;
    ElementPtr m_limit;
    bool m_distinct = false;
};

// Construct builders
std::shared_ptr<Column> column(std::string name, TypePtr type = nullType());
std::shared_ptr<BindParameter> literal(Value value, TypePtr type = nullptr);
std::shared_ptr<BindParameter> bindparam(std::string key, Value value = {}, TypePtr type = nullptr);
std::shared_ptr<Null> null();
std::shared_ptr<BinaryExpression> binary(ElementPtr left, Operator op, ElementPtr right);
std::shared_ptr<BinaryExpression> eq(ElementPtr left, ElementPtr right);
std::shared_ptr<ClauseList> and_(std::vector<ElementPtr> clauses);
std::shared_ptr<ClauseList> or_(std::vector<ElementPtr> clauses);
std::shared_ptr<UnaryExpression> not_(ElementPtr element);
std::shared_ptr<UnaryExpression> desc(ElementPtr element);
std::shared_ptr<FunctionCall> func(std::string name, std::vector<ElementPtr> arguments,
                                   TypePtr type = nullptr);
std::shared_ptr<Label> label(std::string name, ElementPtr element);
std::shared_ptr<Label> anonLabel(ElementPtr element);
std::shared_ptr<TextClause> text(std::string sql);
std::shared_ptr<TextualSelect> textualSelect(std::shared_ptr<const TextClause> text,
                                             std::vector<ElementPtr> columns,
                                             bool positional = false);
std::shared_ptr<Select> select(std::vector<ElementPtr> columns);
std::shared_ptr<OpaqueElement> opaque(std::string description);

}  // namespace sqlcursor
