#pragma once

#include "core/ClassMeta.hpp"
#include "core/PojoTraits.hpp"
#include "core/TypeRegistry.hpp"
#include "core/VirtualBean.hpp"
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace marshal {

/**
 * Fluent API for describing a bean type
 *
 * Example usage:
 *   BeanBuilder<Person>("Person")
 *       .property("name", &Person::name)
 *       .property<int64_t>("age",
 *           [](const Person& p) { return p.age; },
 *           [](Person& p, int64_t v) { p.age = v; })
 *       .readOnly<std::string>("display", [](const Person& p) { return p.name; })
 *       .dictionaryName("person")
 *       .buildAndRegister(types);
 *
 * Interfaces are described with interfaceOnly() and typed property<V>(name)
 * declarations; their instances are VirtualBeans.
 */
template <typename T>
class BeanBuilder {
public:
    explicit BeanBuilder(const std::string& name) {
        m_definition.name = name;
        m_definition.kind = TypeKind::Bean;
        m_definition.type = std::type_index(typeid(T));
        if constexpr (std::is_default_constructible_v<T> && !std::is_abstract_v<T>) {
            m_definition.factory = [] { return Pojo::object(std::make_shared<T>()); };
        }
    }

    // === Properties ===

    /**
     * Read-write property backed by a data member
     */
    template <typename V>
    BeanBuilder& property(const std::string& name, V T::*member) {
        return add(name, PojoTraits<V>::meta(), fieldGetter(name, member), fieldSetter(name, member));
    }

    /**
     * Read-write property backed by accessor functions
     */
    template <typename V>
    BeanBuilder& property(const std::string& name,
                          std::function<V(const T&)> getter,
                          std::function<void(T&, V)> setter) {
        return add(name, PojoTraits<V>::meta(), accessorGetter(name, std::move(getter)),
                   accessorSetter(name, std::move(setter)));
    }

    /**
     * Property declared on an interface (values live in the VirtualBean)
     */
    template <typename V>
    BeanBuilder& property(const std::string& name) {
        if (!m_definition.isInterface) {
            throw std::logic_error("Bean '" + m_definition.name + "': accessor-less property '" +
                                   name + "' requires interfaceOnly()");
        }
        PropertyGetter getter = [name](const Pojo& bean) {
            auto instance = bean.as<VirtualBean>();
            return instance ? instance->get(name) : Pojo();
        };
        PropertySetter setter = [name](const Pojo& bean, const Pojo& value) {
            auto instance = bean.as<VirtualBean>();
            if (!instance) {
                throw std::invalid_argument("Not a virtual bean: " + bean.kindName());
            }
            instance->set(name, value);
        };
        return add(name, PojoTraits<V>::meta(), std::move(getter), std::move(setter));
    }

    /**
     * Read-only property backed by a data member
     */
    template <typename V>
    BeanBuilder& readOnly(const std::string& name, V T::*member) {
        return add(name, PojoTraits<V>::meta(), fieldGetter(name, member), nullptr);
    }

    /**
     * Read-only property backed by a getter
     */
    template <typename V>
    BeanBuilder& readOnly(const std::string& name, std::function<V(const T&)> getter) {
        return add(name, PojoTraits<V>::meta(), accessorGetter(name, std::move(getter)), nullptr);
    }

    // === Options ===

    /**
     * Override the declared type of the last added property
     */
    BeanBuilder& as(ClassMetaPtr declaredType) {
        if (m_definition.properties.empty()) {
            throw std::logic_error("Bean '" + m_definition.name + "': as() needs a property");
        }
        m_definition.properties.back().type = std::move(declaredType);
        return *this;
    }

    /**
     * Replace the default no-arg factory
     */
    BeanBuilder& constructor(std::function<std::shared_ptr<T>()> factory) {
        m_definition.factory = [factory = std::move(factory)] { return Pojo::object(factory()); };
        return *this;
    }

    /**
     * Declare that the type can't be created without arguments
     */
    BeanBuilder& noDefaultConstructor() {
        m_definition.factory = nullptr;
        return *this;
    }

    /**
     * Declared interface with no implementation: parsed into VirtualBeans
     */
    BeanBuilder& interfaceOnly() {
        m_definition.isInterface = true;
        m_definition.factory = nullptr;
        return *this;
    }

    /**
     * Name written as the "_type" hint and resolved when parsing into Any
     */
    BeanBuilder& dictionaryName(const std::string& name) {
        m_definition.dictionaryName = name;
        return *this;
    }

    // === Build ===

    ClassMetaPtr build() {
        return std::make_shared<const ClassMeta>(m_definition);
    }

    ClassMetaPtr buildAndRegister(TypeRegistry& registry) {
        auto meta = build();
        registry.registerType(meta);
        return meta;
    }

private:
    BeanBuilder& add(const std::string& name, ClassMetaPtr type,
                     PropertyGetter getter, PropertySetter setter) {
        if (m_definition.isInterface && !getter) {
            throw std::logic_error("Interface '" + m_definition.name + "' property '" + name +
                                   "' must be declared with property<V>(name)");
        }
        m_definition.properties.push_back(BeanProperty{name, std::move(type),
                                                 std::move(getter), std::move(setter)});
        return *this;
    }

    template <typename V>
    PropertyGetter fieldGetter(const std::string& name, V T::*member) const {
        std::string beanName = m_definition.name;
        return [name, beanName, member](const Pojo& bean) {
            auto instance = bean.as<T>();
            if (!instance) {
                throw std::invalid_argument("Property '" + name + "' of '" + beanName +
                                            "' applied to " + bean.kindName());
            }
            return PojoTraits<V>::toPojo((*instance).*member);
        };
    }

    template <typename V>
    PropertySetter fieldSetter(const std::string& name, V T::*member) const {
        std::string beanName = m_definition.name;
        return [name, beanName, member](const Pojo& bean, const Pojo& value) {
            auto instance = bean.as<T>();
            if (!instance) {
                throw std::invalid_argument("Property '" + name + "' of '" + beanName +
                                            "' applied to " + bean.kindName());
            }
            (*instance).*member = PojoTraits<V>::fromPojo(value);
        };
    }

    template <typename V>
    PropertyGetter accessorGetter(const std::string& name, std::function<V(const T&)> getter) const {
        std::string beanName = m_definition.name;
        return [name, beanName, getter = std::move(getter)](const Pojo& bean) {
            auto instance = bean.as<T>();
            if (!instance) {
                throw std::invalid_argument("Property '" + name + "' of '" + beanName +
                                            "' applied to " + bean.kindName());
            }
            return PojoTraits<V>::toPojo(getter(*instance));
        };
    }

    template <typename V>
    PropertySetter accessorSetter(const std::string& name, std::function<void(T&, V)> setter) const {
        std::string beanName = m_definition.name;
        return [name, beanName, setter = std::move(setter)](const Pojo& bean, const Pojo& value) {
            auto instance = bean.as<T>();
            if (!instance) {
                throw std::invalid_argument("Property '" + name + "' of '" + beanName +
                                            "' applied to " + bean.kindName());
            }
            setter(*instance, PojoTraits<V>::fromPojo(value));
        };
    }

    ClassMeta::Definition m_definition;
};

/**
 * Fluent API for describing a non-bean type and its string conversions
 *
 * Example usage:
 *   ClassMetaBuilder<Color>("Color")
 *       .toStringMethod([](const Color& c) { return c.name(); })
 *       .staticMethod("parse", [](const std::string& s) { return Color::parse(s); })
 *       .buildAndRegister(types);
 */
template <typename T>
class ClassMetaBuilder {
public:
    explicit ClassMetaBuilder(const std::string& name) {
        m_definition.name = name;
        m_definition.kind = TypeKind::Other;
        m_definition.type = std::type_index(typeid(T));
    }

    /**
     * Conversion used when the value is written as a string
     */
    ClassMetaBuilder& toStringMethod(std::function<std::string(const T&)> fn) {
        std::string typeName = m_definition.name;
        m_definition.toStringFunction = [typeName, fn = std::move(fn)](const Pojo& value) {
            auto instance = value.as<T>();
            if (!instance) {
                throw std::invalid_argument("toString of '" + typeName + "' applied to " +
                                            value.kindName());
            }
            return fn(*instance);
        };
        return *this;
    }

    /**
     * Static factory taking one string argument, registered under its name
     * (fromString, valueOf, parse, parseString, forName, forString)
     */
    ClassMetaBuilder& staticMethod(const std::string& methodName,
                                   std::function<T(const std::string&)> fn) {
        m_definition.staticMethods.emplace_back(methodName, wrap(std::move(fn)));
        return *this;
    }

    /**
     * Constructor taking one string argument
     */
    ClassMetaBuilder& stringConstructor(std::function<T(const std::string&)> fn) {
        m_definition.stringConstructor = wrap(std::move(fn));
        return *this;
    }

    ClassMetaBuilder& dictionaryName(const std::string& name) {
        m_definition.dictionaryName = name;
        return *this;
    }

    ClassMetaPtr build() {
        return std::make_shared<const ClassMeta>(m_definition);
    }

    ClassMetaPtr buildAndRegister(TypeRegistry& registry) {
        auto meta = build();
        registry.registerType(meta);
        return meta;
    }

private:
    static FromStringFunction wrap(std::function<T(const std::string&)> fn) {
        return [fn = std::move(fn)](const std::string& text) {
            return Pojo::object(std::make_shared<T>(fn(text)));
        };
    }

    ClassMeta::Definition m_definition;
};

} // namespace marshal
