#pragma once

#include "core/Pojo.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <utility>
#include <vector>

namespace marshal {

/**
 * Structural kind of a type descriptor.
 *
 * - Any:        unconstrained declared type ("Object")
 * - Boolean, Integer, Double, String: scalar wrappers
 * - List, Map:  containers with element / key+value types
 * - Bean:       structured record with named properties
 * - CharStream, ByteStream: stream-like values
 * - Reference:  declared C++ type whose descriptor lives in a TypeRegistry
 * - Other:      everything else (string-convertible or opaque)
 */
enum class TypeKind {
    Any,
    Boolean,
    Integer,
    Double,
    String,
    List,
    Map,
    Bean,
    CharStream,
    ByteStream,
    Reference,
    Other
};

std::string typeKindToString(TypeKind kind);

class ClassMeta;
using ClassMetaPtr = std::shared_ptr<const ClassMeta>;

using PropertyGetter = std::function<Pojo(const Pojo& bean)>;
using PropertySetter = std::function<void(const Pojo& bean, const Pojo& value)>;
using InstanceFactory = std::function<Pojo()>;
using ToStringFunction = std::function<std::string(const Pojo& value)>;
using FromStringFunction = std::function<Pojo(const std::string& text)>;

/**
 * Capability descriptor of one bean property
 */
struct BeanProperty {
    std::string name;
    ClassMetaPtr type;
    PropertyGetter getter;
    PropertySetter setter;  // empty => read-only

    bool isReadable() const { return static_cast<bool>(getter); }
    bool isWritable() const { return static_cast<bool>(setter); }
};

/**
 * Type descriptor - immutable after creation
 *
 * Computed once per type (by BeanBuilder, ClassMetaBuilder or the static
 * factories below) and shared through ClassMetaPtr. The categorizer, the
 * tree walker and the string conversions only ever look at a type through
 * this descriptor.
 */
class ClassMeta {
public:
    /**
     * Everything a descriptor holds; filled by the builders
     */
    struct Definition {
        std::string name;
        TypeKind kind = TypeKind::Other;
        std::optional<std::type_index> type;

        // List / Map
        ClassMetaPtr elementType;
        ClassMetaPtr keyType;
        ClassMetaPtr valueType;

        // Bean
        std::vector<BeanProperty> properties;
        InstanceFactory factory;
        bool isInterface = false;
        std::string dictionaryName;

        // String conversions
        ToStringFunction toStringFunction;
        std::vector<std::pair<std::string, FromStringFunction>> staticMethods;
        FromStringFunction stringConstructor;
    };

    explicit ClassMeta(Definition definition);

    // === Shared descriptors ===

    static ClassMetaPtr any();
    static ClassMetaPtr boolean();
    static ClassMetaPtr integer();
    static ClassMetaPtr number();
    static ClassMetaPtr string();

    /**
     * List with the given element type (nullptr => Any)
     */
    static ClassMetaPtr listOf(ClassMetaPtr elementType);

    /**
     * Map with the given key and value types (nullptr => Any)
     */
    static ClassMetaPtr mapOf(ClassMetaPtr keyType, ClassMetaPtr valueType);

    /**
     * Lazy reference to the descriptor registered for a C++ type
     */
    static ClassMetaPtr reference(std::type_index type, const std::string& name = "");

    // === Getters ===

    const std::string& getName() const { return m_definition.name; }
    TypeKind getKind() const { return m_definition.kind; }
    const std::optional<std::type_index>& getType() const { return m_definition.type; }

    const ClassMetaPtr& getElementType() const { return m_definition.elementType; }
    const ClassMetaPtr& getKeyType() const { return m_definition.keyType; }
    const ClassMetaPtr& getValueType() const { return m_definition.valueType; }

    const std::vector<BeanProperty>& getProperties() const { return m_definition.properties; }
    const std::string& getDictionaryName() const { return m_definition.dictionaryName; }
    bool isInterface() const { return m_definition.isInterface; }

    const ToStringFunction& getToStringFunction() const { return m_definition.toStringFunction; }
    const FromStringFunction& getStringConstructor() const { return m_definition.stringConstructor; }

    /**
     * Find a bean property by name
     * Returns nullptr if not found
     */
    const BeanProperty* findProperty(const std::string& name) const;

    /**
     * Find a static from-string factory by method name
     * Returns nullptr if the type has no method of that name
     */
    const FromStringFunction* findStaticMethod(const std::string& name) const;

    bool hasFactory() const { return static_cast<bool>(m_definition.factory); }

    /**
     * Create a new instance with the no-arg factory
     * Throws std::logic_error if the type has none
     */
    Pojo newInstance() const;

    // === Kind checks ===

    bool isAny() const { return m_definition.kind == TypeKind::Any; }
    bool isScalar() const;
    bool isList() const { return m_definition.kind == TypeKind::List; }
    bool isMap() const { return m_definition.kind == TypeKind::Map; }
    bool isBean() const { return m_definition.kind == TypeKind::Bean; }
    bool isStream() const;
    bool isReference() const { return m_definition.kind == TypeKind::Reference; }

    /**
     * Human readable form, e.g. "List<Person>" or "Map<String,Integer>"
     */
    std::string toString() const;

private:
    Definition m_definition;
};

} // namespace marshal
