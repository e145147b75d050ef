#include "Types.hpp"
#include "Dialect.hpp"
#include <cmath>
#include <stdexcept>

namespace sqlcursor {

json TypeEngine::staticCacheKey() const {
    return json::array({name()});
}

Decoder TypeEngine::resultProcessor(const Dialect& dialect, int rawType) const {
    if (dialect.rawAffinity(rawType) == affinity()) {
        return {};
    }
    return converter();
}

Decoder Integer::converter() const {
    return [](const Value& raw) -> Value {
        switch (raw.index()) {
            case 1:
                return static_cast<int64_t>(std::get<bool>(raw) ? 1 : 0);
            case 3:
                return static_cast<int64_t>(std::llround(std::get<double>(raw)));
            case 4:
                return static_cast<int64_t>(std::stoll(std::get<std::string>(raw)));
            default:
                return raw;
        }
    };
}

Decoder Float::converter() const {
    return [](const Value& raw) -> Value {
        switch (raw.index()) {
            case 2:
                return static_cast<double>(std::get<int64_t>(raw));
            case 4:
                return std::stod(std::get<std::string>(raw));
            default:
                return raw;
        }
    };
}

std::string String::name() const {
    if (m_length) {
        return "VARCHAR(" + std::to_string(*m_length) + ")";
    }
    return "VARCHAR";
}

json String::staticCacheKey() const {
    json key = json::array({affinity()});
    if (m_length) {
        key.push_back(*m_length);
    }
    return key;
}

Decoder String::converter() const {
    return [](const Value& raw) -> Value {
        if (isNull(raw) || std::holds_alternative<std::string>(raw)) {
            return raw;
        }
        if (const auto* blob = std::get_if<Blob>(&raw)) {
            return std::string(blob->begin(), blob->end());
        }
        return toString(raw);
    };
}

Decoder Boolean::converter() const {
    return [](const Value& raw) -> Value {
        switch (raw.index()) {
            case 2:
                return std::get<int64_t>(raw) != 0;
            case 3:
                return std::get<double>(raw) != 0.0;
            case 4: {
                const auto& text = std::get<std::string>(raw);
                if (text == "t" || text == "true" || text == "1") return true;
                if (text == "f" || text == "false" || text == "0") return false;
                throw std::invalid_argument("Not a boolean value: '" + text + "'");
            }
            default:
                return raw;
        }
    };
}

Decoder LargeBinary::converter() const {
    return [](const Value& raw) -> Value {
        if (const auto* text = std::get_if<std::string>(&raw)) {
            return Blob(text->begin(), text->end());
        }
        return raw;
    };
}

DecoratedType::DecoratedType(TypePtr impl, std::string name, Decoder processResult)
    : m_impl(std::move(impl))
    , m_name(std::move(name))
    , m_processResult(std::move(processResult)) {
}

json DecoratedType::staticCacheKey() const {
    return json::array({m_name, m_impl->staticCacheKey()});
}

Decoder DecoratedType::resultProcessor(const Dialect& dialect, int rawType) const {
    Decoder base = m_impl->resultProcessor(dialect, rawType);
    if (!m_processResult) {
        return base;
    }
    if (!base) {
        return m_processResult;
    }
    return [base, process = m_processResult](const Value& raw) {
        return process(base(raw));
    };
}

TypePtr nullType() {
    static const TypePtr instance = std::make_shared<NullType>();
    return instance;
}

TypePtr integerType() {
    static const TypePtr instance = std::make_shared<Integer>();
    return instance;
}

TypePtr floatType() {
    static const TypePtr instance = std::make_shared<Float>();
    return instance;
}

TypePtr stringType() {
    static const TypePtr instance = std::make_shared<String>();
    return instance;
}

TypePtr booleanType() {
    static const TypePtr instance = std::make_shared<Boolean>();
    return instance;
}

TypePtr binaryType() {
    static const TypePtr instance = std::make_shared<LargeBinary>();
    return instance;
}

}  // namespace sqlcursor
