#include "core/TypeRegistry.hpp"
#include "core/BuiltinTypes.hpp"
#include "core/VirtualBean.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace marshal {

namespace {

template <typename T>
ClassMetaPtr makeBuiltin(const std::string& name, TypeKind kind) {
    ClassMeta::Definition definition;
    definition.name = name;
    definition.kind = kind;
    definition.type = std::type_index(typeid(T));
    return std::make_shared<const ClassMeta>(std::move(definition));
}

ClassMetaPtr makeLocale() {
    ClassMeta::Definition definition;
    definition.name = "Locale";
    definition.kind = TypeKind::Other;
    definition.type = std::type_index(typeid(Locale));
    definition.toStringFunction = [](const Pojo& value) {
        return value.as<Locale>()->toString();
    };
    definition.stringConstructor = [](const std::string& text) {
        return Pojo::object(std::make_shared<Locale>(text));
    };
    return std::make_shared<const ClassMeta>(std::move(definition));
}

ClassMetaPtr makeTimeZone() {
    ClassMeta::Definition definition;
    definition.name = "TimeZone";
    definition.kind = TypeKind::Other;
    definition.type = std::type_index(typeid(TimeZone));
    definition.staticMethods.emplace_back("forName", [](const std::string& text) {
        return Pojo::object(std::make_shared<TimeZone>(TimeZone::forName(text)));
    });
    return std::make_shared<const ClassMeta>(std::move(definition));
}

} // namespace

TypeRegistry::TypeRegistry() {
    for (const auto& meta : {ClassMeta::boolean(), ClassMeta::integer(),
                             ClassMeta::number(), ClassMeta::string(),
                             ClassMeta::listOf(nullptr),
                             ClassMeta::mapOf(nullptr, nullptr),
                             makeBuiltin<CharStream>("CharStream", TypeKind::CharStream),
                             makeBuiltin<ByteStream>("ByteStream", TypeKind::ByteStream),
                             makeLocale(), makeTimeZone()}) {
        m_types[*meta->getType()] = meta;
    }
}

void TypeRegistry::registerType(ClassMetaPtr meta) {
    if (!meta || !meta->getType()) {
        throw std::invalid_argument("Only descriptors with a C++ type can be registered");
    }
    if (meta->isReference()) {
        throw std::invalid_argument("Cannot register a type reference: " + meta->getName());
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_frozen) {
        throw std::logic_error("Type registry is frozen, cannot register '" + meta->getName() + "'");
    }

    auto type = *meta->getType();
    auto existing = m_types.find(type);
    if (existing != m_types.end()) {
        LOG_DEBUG("Replacing type registration: " + existing->second->getName());
        const auto& oldName = existing->second->getDictionaryName();
        if (!oldName.empty()) {
            m_dictionary.erase(oldName);
        }
    }
    if (!meta->getDictionaryName().empty()) {
        m_dictionary[meta->getDictionaryName()] = meta;
    }
    m_types[type] = std::move(meta);
}

void TypeRegistry::freeze() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_frozen = true;
}

bool TypeRegistry::isFrozen() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_frozen;
}

ClassMetaPtr TypeRegistry::lookup(std::type_index type) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_types.find(type);
    return it != m_types.end() ? it->second : nullptr;
}

ClassMetaPtr TypeRegistry::lookupByDictionaryName(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_dictionary.find(name);
    return it != m_dictionary.end() ? it->second : nullptr;
}

bool TypeRegistry::isRegistered(std::type_index type) const {
    return lookup(type) != nullptr;
}

ClassMetaPtr TypeRegistry::resolve(const ClassMetaPtr& declared) const {
    if (!declared) {
        return ClassMeta::any();
    }
    if (declared->isReference()) {
        return lookup(*declared->getType());
    }
    return declared;
}

ClassMetaPtr TypeRegistry::forObject(const Pojo& value) const {
    if (value.isNull()) {
        return nullptr;
    }
    if (auto bean = value.as<VirtualBean>()) {
        return bean->getInterfaceType();
    }
    return lookup(value.type());
}

std::vector<std::string> TypeRegistry::getTypeNames() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> names;
    names.reserve(m_types.size());
    for (const auto& [type, meta] : m_types) {
        names.push_back(meta->getName());
    }
    std::sort(names.begin(), names.end());
    return names;
}

size_t TypeRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_types.size();
}

} // namespace marshal
