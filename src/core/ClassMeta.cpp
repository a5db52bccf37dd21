#include "core/ClassMeta.hpp"
#include <stdexcept>

namespace marshal {

std::string typeKindToString(TypeKind kind) {
    switch (kind) {
        case TypeKind::Any:        return "any";
        case TypeKind::Boolean:    return "boolean";
        case TypeKind::Integer:    return "integer";
        case TypeKind::Double:     return "double";
        case TypeKind::String:     return "string";
        case TypeKind::List:       return "list";
        case TypeKind::Map:        return "map";
        case TypeKind::Bean:       return "bean";
        case TypeKind::CharStream: return "charstream";
        case TypeKind::ByteStream: return "bytestream";
        case TypeKind::Reference:  return "reference";
        case TypeKind::Other:      return "other";
    }
    return "unknown";
}

static ClassMetaPtr makeScalar(const std::string& name, TypeKind kind, std::type_index type) {
    ClassMeta::Definition definition;
    definition.name = name;
    definition.kind = kind;
    definition.type = type;
    return std::make_shared<const ClassMeta>(std::move(definition));
}

ClassMeta::ClassMeta(Definition definition)
    : m_definition(std::move(definition))
{
    if (m_definition.kind == TypeKind::List && !m_definition.elementType) {
        m_definition.elementType = any();
    }
    if (m_definition.kind == TypeKind::Map) {
        if (!m_definition.keyType) m_definition.keyType = any();
        if (!m_definition.valueType) m_definition.valueType = any();
    }
}

ClassMetaPtr ClassMeta::any() {
    static const ClassMetaPtr instance = [] {
        Definition definition;
        definition.name = "Object";
        definition.kind = TypeKind::Any;
        return std::make_shared<const ClassMeta>(std::move(definition));
    }();
    return instance;
}

ClassMetaPtr ClassMeta::boolean() {
    static const ClassMetaPtr instance = makeScalar("Boolean", TypeKind::Boolean, typeid(bool));
    return instance;
}

ClassMetaPtr ClassMeta::integer() {
    static const ClassMetaPtr instance = makeScalar("Integer", TypeKind::Integer, typeid(int64_t));
    return instance;
}

ClassMetaPtr ClassMeta::number() {
    static const ClassMetaPtr instance = makeScalar("Double", TypeKind::Double, typeid(double));
    return instance;
}

ClassMetaPtr ClassMeta::string() {
    static const ClassMetaPtr instance = makeScalar("String", TypeKind::String, typeid(std::string));
    return instance;
}

ClassMetaPtr ClassMeta::listOf(ClassMetaPtr elementType) {
    Definition definition;
    definition.kind = TypeKind::List;
    definition.type = std::type_index(typeid(PojoList));
    definition.elementType = elementType ? std::move(elementType) : any();
    definition.name = "List<" + definition.elementType->toString() + ">";
    return std::make_shared<const ClassMeta>(std::move(definition));
}

ClassMetaPtr ClassMeta::mapOf(ClassMetaPtr keyType, ClassMetaPtr valueType) {
    Definition definition;
    definition.kind = TypeKind::Map;
    definition.type = std::type_index(typeid(PojoMap));
    definition.keyType = keyType ? std::move(keyType) : any();
    definition.valueType = valueType ? std::move(valueType) : any();
    definition.name = "Map<" + definition.keyType->toString() + "," + definition.valueType->toString() + ">";
    return std::make_shared<const ClassMeta>(std::move(definition));
}

ClassMetaPtr ClassMeta::reference(std::type_index type, const std::string& name) {
    Definition definition;
    definition.kind = TypeKind::Reference;
    definition.type = type;
    definition.name = name.empty() ? type.name() : name;
    return std::make_shared<const ClassMeta>(std::move(definition));
}

const BeanProperty* ClassMeta::findProperty(const std::string& name) const {
    for (const auto& prop : m_definition.properties) {
        if (prop.name == name) {
            return &prop;
        }
    }
    return nullptr;
}

const FromStringFunction* ClassMeta::findStaticMethod(const std::string& name) const {
    for (const auto& [methodName, fn] : m_definition.staticMethods) {
        if (methodName == name && fn) {
            return &fn;
        }
    }
    return nullptr;
}

Pojo ClassMeta::newInstance() const {
    if (!m_definition.factory) {
        throw std::logic_error("Type '" + m_definition.name + "' has no no-arg constructor");
    }
    return m_definition.factory();
}

bool ClassMeta::isScalar() const {
    return m_definition.kind == TypeKind::Boolean ||
           m_definition.kind == TypeKind::Integer ||
           m_definition.kind == TypeKind::Double ||
           m_definition.kind == TypeKind::String;
}

bool ClassMeta::isStream() const {
    return m_definition.kind == TypeKind::CharStream ||
           m_definition.kind == TypeKind::ByteStream;
}

std::string ClassMeta::toString() const {
    return m_definition.name;
}

} // namespace marshal
