#pragma once

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

namespace marshal {

class Pojo;
class PojoMap;

/**
 * Ordered sequence of values (lists and arrays alike)
 */
using PojoList = std::vector<Pojo>;

/**
 * Value handle used by every stage of the pipeline.
 *
 * A Pojo is one of:
 * - null
 * - a scalar: bool, int64_t, double, std::string
 * - an object reference: shared ownership of an instance plus its C++ type
 *
 * Lists and maps are object references to PojoList / PojoMap. Object
 * identity (the instance address) is what recursion detection tracks, so
 * copying a Pojo never copies the referenced instance.
 */
class Pojo {
public:
    using Scalar = std::variant<std::monostate, bool, int64_t, double, std::string>;

    // Null
    Pojo();
    Pojo(std::nullptr_t);

    // Scalars
    Pojo(bool value);
    Pojo(int value);
    Pojo(int64_t value);
    Pojo(double value);
    Pojo(std::string value);
    Pojo(const char* value);

    /**
     * Wrap a shared instance. A null pointer yields a null Pojo.
     */
    template <typename T>
    static Pojo object(std::shared_ptr<T> instance) {
        Pojo p;
        if (instance) {
            p.m_object = std::const_pointer_cast<void>(
                std::static_pointer_cast<const void>(std::move(instance)));
            p.m_type = std::type_index(typeid(T));
        }
        return p;
    }

    static Pojo list(PojoList items = {});
    static Pojo map(PojoMap entries);
    static Pojo map();

    // === Kind checks ===

    bool isNull() const;
    bool isScalar() const;
    bool isBool() const { return std::holds_alternative<bool>(m_scalar); }
    bool isInt() const { return std::holds_alternative<int64_t>(m_scalar); }
    bool isDouble() const { return std::holds_alternative<double>(m_scalar); }
    bool isNumber() const { return isInt() || isDouble(); }
    bool isString() const { return std::holds_alternative<std::string>(m_scalar); }
    bool isObject() const { return m_object != nullptr; }
    bool isList() const;
    bool isMap() const;

    // === Value extraction (throws std::runtime_error on wrong kind) ===

    bool getBool() const;
    int64_t getInt() const;
    double getDouble() const;
    const std::string& getString() const;

    PojoList& asList();
    const PojoList& asList() const;
    PojoMap& asMap();
    const PojoMap& asMap() const;

    /**
     * Typed access to an object reference, nullptr when the type differs
     */
    template <typename T>
    std::shared_ptr<T> as() const {
        if (!m_object || m_type != std::type_index(typeid(T))) {
            return nullptr;
        }
        return std::static_pointer_cast<T>(m_object);
    }

    /**
     * Runtime type: typeid(void) for null, the scalar's C++ type, or the
     * referenced instance's type
     */
    std::type_index type() const;

    /**
     * Address of the referenced instance, nullptr for null and scalars
     */
    const void* identity() const { return m_object.get(); }

    const Scalar& scalar() const { return m_scalar; }

    /**
     * Short description of the value kind for error messages
     */
    std::string kindName() const;

    /**
     * Structural equality for scalars, lists and maps (numbers compare by
     * value across int/double); identity for any other object
     */
    bool operator==(const Pojo& other) const;
    bool operator!=(const Pojo& other) const { return !(*this == other); }

private:
    Scalar m_scalar;
    std::shared_ptr<void> m_object;
    std::type_index m_type{typeid(void)};
};

/**
 * Insertion-ordered map with Pojo keys (null keys allowed).
 *
 * put() on an existing key replaces the value in place, keeping the
 * original position. No implicit sorting is ever applied.
 */
class PojoMap {
public:
    using Entry = std::pair<Pojo, Pojo>;
    using const_iterator = std::vector<Entry>::const_iterator;
    using iterator = std::vector<Entry>::iterator;

    PojoMap() = default;
    PojoMap(std::initializer_list<Entry> entries);

    void put(const Pojo& key, const Pojo& value);

    /**
     * Pointer to the value for key, nullptr if absent
     */
    const Pojo* find(const Pojo& key) const;

    /**
     * Value for key, null Pojo if absent
     */
    Pojo get(const Pojo& key) const;

    bool contains(const Pojo& key) const;
    bool erase(const Pojo& key);
    void clear() { m_entries.clear(); }

    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    const_iterator begin() const { return m_entries.begin(); }
    const_iterator end() const { return m_entries.end(); }
    iterator begin() { return m_entries.begin(); }
    iterator end() { return m_entries.end(); }

    /**
     * Same key set with equal values, regardless of order
     */
    bool operator==(const PojoMap& other) const;
    bool operator!=(const PojoMap& other) const { return !(*this == other); }

private:
    std::vector<Entry> m_entries;
};

} // namespace marshal
