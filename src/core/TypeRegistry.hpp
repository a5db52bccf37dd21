#pragma once

#include "core/ClassMeta.hpp"
#include "core/Pojo.hpp"
#include <mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace marshal {

/**
 * Registry of type descriptors, keyed by C++ type
 *
 * Pre-populated with the scalar wrappers, the generic containers
 * (PojoList, PojoMap), the stream types, Locale and TimeZone.
 *
 * Usage:
 *   TypeRegistry types;
 *   BeanBuilder<Person>("Person").property("name", &Person::name)
 *       .buildAndRegister(types);
 *   auto meta = types.lookup(typeid(Person));
 */
class TypeRegistry {
public:
    TypeRegistry();

    // Non-copyable, non-movable (the categorizer keeps a reference)
    TypeRegistry(const TypeRegistry&) = delete;
    TypeRegistry& operator=(const TypeRegistry&) = delete;

    // === Registration ===

    /**
     * Register a descriptor under its C++ type
     * Overwrites an existing registration for the same type
     * Throws std::invalid_argument if the descriptor has no C++ type,
     * std::logic_error once frozen
     */
    void registerType(ClassMetaPtr meta);

    /**
     * Make the registry read-only
     */
    void freeze();
    bool isFrozen() const;

    // === Lookup ===

    /**
     * Descriptor for a C++ type, nullptr if not registered
     */
    ClassMetaPtr lookup(std::type_index type) const;

    /**
     * Descriptor by its dictionary name ("_type" value), nullptr if unknown
     */
    ClassMetaPtr lookupByDictionaryName(const std::string& name) const;

    bool isRegistered(std::type_index type) const;

    /**
     * Resolve a declared type: nullptr => Any, Reference => registered
     * descriptor (nullptr when unregistered), anything else unchanged
     */
    ClassMetaPtr resolve(const ClassMetaPtr& declared) const;

    /**
     * Runtime descriptor of a value
     * Virtual beans report their interface type. Returns nullptr for null
     * and for instances of unregistered types.
     */
    ClassMetaPtr forObject(const Pojo& value) const;

    // === Enumeration ===

    std::vector<std::string> getTypeNames() const;
    size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::type_index, ClassMetaPtr> m_types;
    std::unordered_map<std::string, ClassMetaPtr> m_dictionary;
    bool m_frozen = false;
};

} // namespace marshal
