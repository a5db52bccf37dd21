#include "core/Pojo.hpp"
#include <stdexcept>
#include <string>

namespace marshal {

// =============================================================================
// Pojo
// =============================================================================

Pojo::Pojo() : m_scalar(std::monostate{}) {}

Pojo::Pojo(std::nullptr_t) : m_scalar(std::monostate{}) {}

Pojo::Pojo(bool value) : m_scalar(value) {}

Pojo::Pojo(int value) : m_scalar(static_cast<int64_t>(value)) {}

Pojo::Pojo(int64_t value) : m_scalar(value) {}

Pojo::Pojo(double value) : m_scalar(value) {}

Pojo::Pojo(std::string value) : m_scalar(std::move(value)) {}

Pojo::Pojo(const char* value) : m_scalar(std::string(value ? value : "")) {
    if (!value) {
        m_scalar = std::monostate{};
    }
}

Pojo Pojo::list(PojoList items) {
    return object(std::make_shared<PojoList>(std::move(items)));
}

Pojo Pojo::map(PojoMap entries) {
    return object(std::make_shared<PojoMap>(std::move(entries)));
}

Pojo Pojo::map() {
    return object(std::make_shared<PojoMap>());
}

bool Pojo::isNull() const {
    return !m_object && std::holds_alternative<std::monostate>(m_scalar);
}

bool Pojo::isScalar() const {
    return !m_object && !std::holds_alternative<std::monostate>(m_scalar);
}

bool Pojo::isList() const {
    return m_object && m_type == std::type_index(typeid(PojoList));
}

bool Pojo::isMap() const {
    return m_object && m_type == std::type_index(typeid(PojoMap));
}

bool Pojo::getBool() const {
    if (isBool()) {
        return std::get<bool>(m_scalar);
    }
    throw std::runtime_error("Cannot get bool from " + kindName());
}

int64_t Pojo::getInt() const {
    if (isInt()) {
        return std::get<int64_t>(m_scalar);
    }
    if (isDouble()) {
        double d = std::get<double>(m_scalar);
        if (!(d >= -9223372036854775808.0 && d < 9223372036854775808.0)) {
            throw std::out_of_range("Double " + std::to_string(d) + " does not fit an int64");
        }
        return static_cast<int64_t>(d);
    }
    throw std::runtime_error("Cannot get int from " + kindName());
}

double Pojo::getDouble() const {
    if (isDouble()) {
        return std::get<double>(m_scalar);
    }
    if (isInt()) {
        return static_cast<double>(std::get<int64_t>(m_scalar));
    }
    throw std::runtime_error("Cannot get double from " + kindName());
}

const std::string& Pojo::getString() const {
    if (isString()) {
        return std::get<std::string>(m_scalar);
    }
    throw std::runtime_error("Cannot get string from " + kindName());
}

PojoList& Pojo::asList() {
    if (!isList()) {
        throw std::runtime_error("Cannot get list from " + kindName());
    }
    return *std::static_pointer_cast<PojoList>(m_object);
}

const PojoList& Pojo::asList() const {
    if (!isList()) {
        throw std::runtime_error("Cannot get list from " + kindName());
    }
    return *std::static_pointer_cast<PojoList>(m_object);
}

PojoMap& Pojo::asMap() {
    if (!isMap()) {
        throw std::runtime_error("Cannot get map from " + kindName());
    }
    return *std::static_pointer_cast<PojoMap>(m_object);
}

const PojoMap& Pojo::asMap() const {
    if (!isMap()) {
        throw std::runtime_error("Cannot get map from " + kindName());
    }
    return *std::static_pointer_cast<PojoMap>(m_object);
}

std::type_index Pojo::type() const {
    if (m_object) return m_type;
    if (isBool()) return std::type_index(typeid(bool));
    if (isInt()) return std::type_index(typeid(int64_t));
    if (isDouble()) return std::type_index(typeid(double));
    if (isString()) return std::type_index(typeid(std::string));
    return std::type_index(typeid(void));
}

std::string Pojo::kindName() const {
    if (isList()) return "list";
    if (isMap()) return "map";
    if (m_object) return std::string("object<") + m_type.name() + ">";
    if (isBool()) return "bool";
    if (isInt()) return "int";
    if (isDouble()) return "double";
    if (isString()) return "string";
    return "null";
}

bool Pojo::operator==(const Pojo& other) const {
    if (isNull() || other.isNull()) {
        return isNull() && other.isNull();
    }
    if (isNumber() && other.isNumber()) {
        if (isInt() && other.isInt()) {
            return getInt() == other.getInt();
        }
        return getDouble() == other.getDouble();
    }
    if (isScalar() || other.isScalar()) {
        return m_scalar == other.m_scalar;
    }
    if (m_object == other.m_object) {
        return true;
    }
    if (isList() && other.isList()) {
        return asList() == other.asList();
    }
    if (isMap() && other.isMap()) {
        return asMap() == other.asMap();
    }
    return false;
}

// =============================================================================
// PojoMap
// =============================================================================

PojoMap::PojoMap(std::initializer_list<Entry> entries) {
    for (const auto& [key, value] : entries) {
        put(key, value);
    }
}

void PojoMap::put(const Pojo& key, const Pojo& value) {
    for (auto& entry : m_entries) {
        if (entry.first == key) {
            entry.second = value;
            return;
        }
    }
    m_entries.emplace_back(key, value);
}

const Pojo* PojoMap::find(const Pojo& key) const {
    for (const auto& entry : m_entries) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

Pojo PojoMap::get(const Pojo& key) const {
    const Pojo* value = find(key);
    return value ? *value : Pojo();
}

bool PojoMap::contains(const Pojo& key) const {
    return find(key) != nullptr;
}

bool PojoMap::erase(const Pojo& key) {
    for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
        if (it->first == key) {
            m_entries.erase(it);
            return true;
        }
    }
    return false;
}

bool PojoMap::operator==(const PojoMap& other) const {
    if (m_entries.size() != other.m_entries.size()) {
        return false;
    }
    for (const auto& [key, value] : m_entries) {
        const Pojo* otherValue = other.find(key);
        if (!otherValue || !(*otherValue == value)) {
            return false;
        }
    }
    return true;
}

} // namespace marshal
