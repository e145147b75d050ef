#include "Elements.hpp"
#include "ErrorHandler.hpp"
#include "ResultColumns.hpp"
#include <algorithm>
#include <map>

namespace sqlcursor {

namespace {

ElementList rawList(const std::vector<ElementPtr>& elements) {
    ElementList result;
    result.reserve(elements.size());
    for (const auto& element : elements) {
        result.push_back(element.get());
    }
    return result;
}

TypePtr inferType(const Value& value) {
    switch (value.index()) {
        case 1:
            return booleanType();
        case 2:
            return integerType();
        case 3:
            return floatType();
        case 4:
            return stringType();
        case 5:
            return binaryType();
        default:
            return nullType();
    }
}

// Compile-time names for anonymous labels, stable per owning element
class AnonRenderer {
public:
    std::string render(const AnonName& name) {
        if (!name.anonymous()) {
            return name.base;
        }
        auto it = m_names.find(name.owner);
        if (it != m_names.end()) {
            return it->second;
        }
        std::string rendered = name.base + "_" + std::to_string(++m_counters[name.base]);
        m_names.emplace(name.owner, rendered);
        return rendered;
    }

private:
    std::map<const ClauseElement*, std::string> m_names;
    std::map<std::string, int> m_counters;
};

ResultColumn describeColumn(const ClauseElement& element, AnonRenderer& anon) {
    ResultColumn result;
    result.type = element.type();
    if (const auto* col = dynamic_cast<const Column*>(&element)) {
        result.name = col->name();
        result.renderedName = col->name();
        result.objects = {col, col->name()};
    } else if (const auto* lbl = dynamic_cast<const Label*>(&element)) {
        result.name = anon.render(lbl->name());
        result.renderedName = result.name;
        result.objects = {lbl, result.name, &lbl->element()};
    } else {
        // Unlabeled expressions get an anonymous label at compile time
        result.name = anon.render(AnonName{&element, "anon"});
        result.renderedName = result.name;
        result.objects = {&element, result.name};
    }
    return result;
}

}  // namespace

const OperatorInfo& operatorInfo(Operator op) {
    static const OperatorInfo table[] = {
        {"and", false, true, false},
        {"or", false, true, false},
        {"comma", false, false, false},
        {"eq", true, true, true},
        {"ne", true, true, true},
        {"lt", false, false, true},
        {"le", false, false, true},
        {"gt", false, false, true},
        {"ge", false, false, true},
        {"add", true, true, false},
        {"sub", false, false, false},
        {"mul", true, true, false},
        {"div", false, false, false},
        {"concat", false, true, false},
        {"like", false, false, true},
        {"in", false, false, true},
        {"is", false, false, true},
        {"is_not", false, false, true},
        {"not", false, false, false},
        {"neg", false, false, false},
        {"asc", false, false, false},
        {"desc", false, false, false},
    };
    return table[static_cast<size_t>(op)];
}

bool ClauseElement::sharesLineage(const ClauseElement& other) const {
    const auto mine = proxySet();
    const auto theirs = other.proxySet();
    return std::any_of(mine.begin(), mine.end(), [&theirs](const ClauseElement* element) {
        return std::find(theirs.begin(), theirs.end(), element) != theirs.end();
    });
}

std::shared_ptr<const Column> FromClause::c(const std::string& name) const {
    for (const auto& col : m_columns) {
        if (col->name() == name) {
            return col;
        }
    }
    throw InvalidRequestError("No column named '" + name + "'");
}

// ============================================================================
// Tables and aliases
// ============================================================================

std::shared_ptr<Table> Table::create(std::string name,
                                     std::vector<std::pair<std::string, TypePtr>> columns) {
    std::shared_ptr<Table> table(new Table(std::move(name)));
    for (auto& [colName, type] : columns) {
        table->m_columns.push_back(
            std::make_shared<Column>(std::move(colName), type ? type : nullType(), table.get()));
    }
    return table;
}

std::vector<TraversalEntry> Table::traverseInternals() const {
    ElementList cols;
    for (const auto& col : m_columns) {
        cols.push_back(col.get());
    }
    return {
        {"columns", VisitKind::ClauseElementList, cols},
        {"name", VisitKind::String, m_name},
    };
}

std::shared_ptr<const Alias> Table::alias(std::optional<std::string> name) const {
    return std::make_shared<Alias>(shared_from_this(), std::move(name));
}

Alias::Alias(std::shared_ptr<const Table> element, std::optional<std::string> name)
    : m_element(std::move(element)) {
    if (name) {
        m_name = AnonName{nullptr, *name};
    } else {
        m_name = AnonName{this, m_element->name()};
    }
    for (const auto& col : m_element->columns()) {
        m_columns.push_back(std::make_shared<Column>(col->name(), col->type(), this, col.get()));
    }
}

std::vector<TraversalEntry> Alias::traverseInternals() const {
    return {
        {"element", VisitKind::ClauseElement, static_cast<const ClauseElement*>(m_element.get())},
        {"name", VisitKind::AnonName, m_name},
    };
}

// ============================================================================
// Column expressions
// ============================================================================

Column::Column(std::string name, TypePtr type, const FromClause* table,
               const Column* proxied, bool isLiteral)
    : m_name(std::move(name))
    , m_type(type ? std::move(type) : nullType())
    , m_table(table)
    , m_proxied(proxied)
    , m_isLiteral(isLiteral) {
}

std::vector<TraversalEntry> Column::traverseInternals() const {
    return {
        {"name", VisitKind::String, m_name},
        {"type", VisitKind::Type, m_type},
        {"table", VisitKind::ClauseElement, static_cast<const ClauseElement*>(m_table)},
        {"is_literal", VisitKind::Boolean, m_isLiteral},
    };
}

ElementList Column::proxySet() const {
    ElementList result{this};
    if (m_proxied) {
        auto inherited = m_proxied->proxySet();
        result.insert(result.end(), inherited.begin(), inherited.end());
    }
    return result;
}

Label::Label(std::optional<std::string> name, ElementPtr element)
    : m_element(std::move(element)) {
    if (name) {
        m_name = AnonName{nullptr, *name};
    } else {
        m_name = AnonName{this, "anon"};
    }
}

std::vector<TraversalEntry> Label::traverseInternals() const {
    return {
        {"name", VisitKind::AnonName, m_name},
        {"element", VisitKind::ClauseElement, m_element.get()},
        {"type", VisitKind::Type, type()},
    };
}

ElementList Label::proxySet() const {
    ElementList result{this};
    auto inherited = m_element->proxySet();
    result.insert(result.end(), inherited.begin(), inherited.end());
    return result;
}

BindParameter::BindParameter(std::optional<std::string> key, Value value, TypePtr type)
    : m_value(std::move(value))
    , m_type(type ? std::move(type) : inferType(m_value)) {
    if (key) {
        m_key = AnonName{nullptr, *key};
    } else {
        m_key = AnonName{this, "param"};
    }
}

std::vector<TraversalEntry> BindParameter::traverseInternals() const {
    return {
        {"key", VisitKind::AnonName, m_key},
        {"type", VisitKind::Type, m_type},
        {"value", VisitKind::BindValue, m_value},
    };
}

BinaryExpression::BinaryExpression(ElementPtr left, Operator op, ElementPtr right)
    : m_left(std::move(left))
    , m_right(std::move(right))
    , m_operator(op) {
}

std::vector<TraversalEntry> BinaryExpression::traverseInternals() const {
    return {
        {"left", VisitKind::ClauseElement, m_left.get()},
        {"right", VisitKind::ClauseElement, m_right.get()},
        {"operator", VisitKind::Operator, m_operator},
        {"type", VisitKind::Type, type()},
    };
}

TypePtr BinaryExpression::type() const {
    if (operatorInfo(m_operator).comparison) {
        return booleanType();
    }
    return m_left->type();
}

ClauseList::ClauseList(Operator op, std::vector<ElementPtr> clauses)
    : m_operator(op)
    , m_clauses(std::move(clauses)) {
}

std::vector<TraversalEntry> ClauseList::traverseInternals() const {
    return {
        {"clauses", VisitKind::ClauseElementList, clauses()},
        {"operator", VisitKind::Operator, m_operator},
    };
}

ElementList ClauseList::clauses() const {
    return rawList(m_clauses);
}

UnaryExpression::UnaryExpression(Operator op, ElementPtr element)
    : m_operator(op)
    , m_element(std::move(element)) {
}

std::vector<TraversalEntry> UnaryExpression::traverseInternals() const {
    return {
        {"element", VisitKind::ClauseElement, m_element.get()},
        {"operator", VisitKind::Operator, m_operator},
    };
}

FunctionCall::FunctionCall(std::string name, std::vector<ElementPtr> arguments, TypePtr type)
    : m_name(std::move(name))
    , m_arguments(std::move(arguments))
    , m_type(type ? std::move(type) : nullType()) {
}

std::vector<TraversalEntry> FunctionCall::traverseInternals() const {
    return {
        {"name", VisitKind::String, m_name},
        {"clauses", VisitKind::ClauseElementList, rawList(m_arguments)},
        {"type", VisitKind::Type, m_type},
    };
}

Case::Case(std::vector<When> whens, ElementPtr elseResult)
    : m_whens(std::move(whens))
    , m_else(std::move(elseResult)) {
}

std::vector<TraversalEntry> Case::traverseInternals() const {
    ElementTuples whens;
    for (const auto& [condition, result] : m_whens) {
        whens.push_back({condition.get(), result.get()});
    }
    return {
        {"whens", VisitKind::ClauseElementTuples, whens},
        {"else", VisitKind::ClauseElement, m_else.get()},
    };
}

TypePtr Case::type() const {
    if (!m_whens.empty()) {
        return m_whens.front().second->type();
    }
    return nullType();
}

// ============================================================================
// Text and opaque constructs
// ============================================================================

TextClause::TextClause(std::string text, std::vector<ElementPtr> bindParameters)
    : m_text(std::move(text))
    , m_bindParameters(std::move(bindParameters)) {
}

std::vector<TraversalEntry> TextClause::traverseInternals() const {
    return {
        {"text", VisitKind::String, m_text},
        {"bindparams", VisitKind::ClauseElementList, rawList(m_bindParameters)},
    };
}

std::vector<TraversalEntry> OpaqueElement::traverseInternals() const {
    return {
        {"payload", VisitKind::UnknownStructure, m_description},
    };
}

TextualSelect::TextualSelect(std::shared_ptr<const TextClause> text,
                             std::vector<ElementPtr> columns, bool positional)
    : m_text(std::move(text))
    , m_columns(std::move(columns))
    , m_positional(positional) {
}

std::vector<TraversalEntry> TextualSelect::traverseInternals() const {
    return {
        {"element", VisitKind::ClauseElement, static_cast<const ClauseElement*>(m_text.get())},
        {"column_args", VisitKind::ClauseElementList, rawList(m_columns)},
        {"positional", VisitKind::Boolean, m_positional},
    };
}

ElementList TextualSelect::exportedColumns() const {
    return rawList(m_columns);
}

ResultColumnStruct TextualSelect::resultColumns() const {
    ResultColumnStruct result;
    AnonRenderer anon;
    for (const auto& element : m_columns) {
        result.columns.push_back(describeColumn(*element, anon));
    }
    result.colsAreOrdered = m_positional;
    result.textualOrdered = m_positional;
    result.looseColumnNameMatching = !m_positional && !m_columns.empty();
    return result;
}

// ============================================================================
// Select
// ============================================================================

Select::Select(std::vector<ElementPtr> columns)
    : m_columns(std::move(columns)) {
}

std::vector<TraversalEntry> Select::traverseInternals() const {
    return {
        {"raw_columns", VisitKind::ClauseElementList, rawList(m_columns)},
        {"from_obj", VisitKind::ClauseElementList, rawList(m_froms)},
        {"where_criteria", VisitKind::ClauseElementList, rawList(m_where)},
        {"order_by", VisitKind::ClauseElementList, rawList(m_orderBy)},
        {"group_by", VisitKind::ClauseElementList, rawList(m_groupBy)},
        {"correlate", VisitKind::UnorderedSet, rawList(m_correlate)},
        {"limit", VisitKind::ClauseElement, m_limit.get()},
        {"distinct", VisitKind::Boolean, m_distinct},
    };
}

ElementList Select::exportedColumns() const {
    return rawList(m_columns);
}

ResultColumnStruct Select::resultColumns() const {
    ResultColumnStruct result;
    AnonRenderer anon;
    for (const auto& element : m_columns) {
        result.columns.push_back(describeColumn(*element, anon));
    }
    return result;
}

Select& Select::from(ElementPtr fromClause) {
    m_froms.push_back(std::move(fromClause));
    return *this;
}

Select& Select::where(ElementPtr criteria) {
    m_where.push_back(std::move(criteria));
    return *this;
}

Select& Select::orderBy(ElementPtr clause) {
    m_orderBy.push_back(std::move(clause));
    return *this;
}

Select& Select::groupBy(ElementPtr clause) {
    m_groupBy.push_back(std::move(clause));
    return *this;
}

Select& Select::limit(int64_t count) {
    m_limit = std::make_shared<BindParameter>(std::nullopt, count, integerType());
    return *this;
}

Select& Select::distinct(bool value) {
    m_distinct = value;
    return *this;
}

Select& Select::correlate(ElementPtr fromClause) {
    m_correlate.push_back(std::move(fromClause));
    return *this;
}

// ============================================================================
// Builders
// ============================================================================

std::shared_ptr<Column> column(std::string name, TypePtr type) {
    return std::make_shared<Column>(std::move(name), std::move(type));
}

std::shared_ptr<BindParameter> literal(Value value, TypePtr type) {
    return std::make_shared<BindParameter>(std::nullopt, std::move(value), std::move(type));
}

std::shared_ptr<BindParameter> bindparam(std::string key, Value value, TypePtr type) {
    return std::make_shared<BindParameter>(std::move(key), std::move(value), std::move(type));
}

std::shared_ptr<Null> null() {
    return std::make_shared<Null>();
}

std::shared_ptr<BinaryExpression> binary(ElementPtr left, Operator op, ElementPtr right) {
    return std::make_shared<BinaryExpression>(std::move(left), op, std::move(right));
}

std::shared_ptr<BinaryExpression> eq(ElementPtr left, ElementPtr right) {
    return binary(std::move(left), Operator::Eq, std::move(right));
}

std::shared_ptr<ClauseList> and_(std::vector<ElementPtr> clauses) {
    return std::make_shared<ClauseList>(Operator::And, std::move(clauses));
}

std::shared_ptr<ClauseList> or_(std::vector<ElementPtr> clauses) {
    return std::make_shared<ClauseList>(Operator::Or, std::move(clauses));
}

std::shared_ptr<UnaryExpression> not_(ElementPtr element) {
    return std::make_shared<UnaryExpression>(Operator::Not, std::move(element));
}

std::shared_ptr<UnaryExpression> desc(ElementPtr element) {
    return std::make_shared<UnaryExpression>(Operator::Desc, std::move(element));
}

std::shared_ptr<FunctionCall> func(std::string name, std::vector<ElementPtr> arguments,
                                   TypePtr type) {
    return std::make_shared<FunctionCall>(std::move(name), std::move(arguments), std::move(type));
}

std::shared_ptr<Label> label(std::string name, ElementPtr element) {
    return std::make_shared<Label>(std::move(name), std::move(element));
}

std::shared_ptr<Label> anonLabel(ElementPtr element) {
    return std::make_shared<Label>(std::nullopt, std::move(element));
}

std::shared_ptr<TextClause> text(std::string sql) {
    return std::make_shared<TextClause>(std::move(sql));
}

std::shared_ptr<TextualSelect> textualSelect(std::shared_ptr<const TextClause> text,
                                             std::vector<ElementPtr> columns, bool positional) {
    return std::make_shared<TextualSelect>(std::move(text), std::move(columns), positional);
}

std::shared_ptr<Select> select(std::vector<ElementPtr> columns) {
    return std::make_shared<Select>(std::move(columns));
}

std::shared_ptr<OpaqueElement> opaque(std::string description) {
    return std::make_shared<OpaqueElement>(std::move(description));
}

}  // namespace sqlcursor
