#pragma once

#include "core/ClassMeta.hpp"
#include "core/Errors.hpp"
#include "core/Pojo.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <typeindex>
#include <vector>

namespace marshal {

/**
 * Conversion between a C++ property type and the Pojo handle, plus the
 * declared type descriptor for that C++ type.
 *
 * The primary template covers copyable class types held by value (Locale,
 * user value types): they are boxed into a shared instance and resolved
 * through the TypeRegistry.
 */
template <typename T, typename Enable = void>
struct PojoTraits {
    static_assert(std::is_class_v<T>, "Unsupported property type");

    static Pojo toPojo(const T& value) {
        return Pojo::object(std::make_shared<T>(value));
    }

    static T fromPojo(const Pojo& pojo) {
        if (pojo.isNull()) {
            return T{};
        }
        auto instance = pojo.template as<T>();
        if (!instance) {
            throw ParseError("Cannot assign " + pojo.kindName() + " to '" +
                             std::string(typeid(T).name()) + "'");
        }
        return *instance;
    }

    static ClassMetaPtr meta() {
        return ClassMeta::reference(std::type_index(typeid(T)));
    }
};

template <>
struct PojoTraits<bool> {
    static Pojo toPojo(bool value) { return Pojo(value); }
    static bool fromPojo(const Pojo& pojo) { return pojo.isNull() ? false : pojo.getBool(); }
    static ClassMetaPtr meta() { return ClassMeta::boolean(); }
};

template <typename T>
struct PojoTraits<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static Pojo toPojo(T value) { return Pojo(static_cast<int64_t>(value)); }
    static T fromPojo(const Pojo& pojo) { return pojo.isNull() ? T{} : static_cast<T>(pojo.getInt()); }
    static ClassMetaPtr meta() { return ClassMeta::integer(); }
};

template <typename T>
struct PojoTraits<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static Pojo toPojo(T value) { return Pojo(static_cast<double>(value)); }
    static T fromPojo(const Pojo& pojo) { return pojo.isNull() ? T{} : static_cast<T>(pojo.getDouble()); }
    static ClassMetaPtr meta() { return ClassMeta::number(); }
};

template <>
struct PojoTraits<std::string> {
    static Pojo toPojo(const std::string& value) { return Pojo(value); }
    static std::string fromPojo(const Pojo& pojo) { return pojo.isNull() ? std::string() : pojo.getString(); }
    static ClassMetaPtr meta() { return ClassMeta::string(); }
};

template <>
struct PojoTraits<Pojo> {
    static Pojo toPojo(const Pojo& value) { return value; }
    static Pojo fromPojo(const Pojo& pojo) { return pojo; }
    static ClassMetaPtr meta() { return ClassMeta::any(); }
};

template <typename T>
struct PojoTraits<std::shared_ptr<T>> {
    static Pojo toPojo(const std::shared_ptr<T>& value) { return Pojo::object(value); }

    static std::shared_ptr<T> fromPojo(const Pojo& pojo) {
        if (pojo.isNull()) {
            return nullptr;
        }
        auto instance = pojo.template as<T>();
        if (!instance) {
            throw ParseError("Cannot assign " + pojo.kindName() + " to '" +
                             std::string(typeid(T).name()) + "'");
        }
        return instance;
    }

    static ClassMetaPtr meta() { return PojoTraits<T>::meta(); }
};

template <typename T>
struct PojoTraits<std::vector<T>> {
    static Pojo toPojo(const std::vector<T>& value) {
        PojoList items;
        items.reserve(value.size());
        for (const auto& item : value) {
            items.push_back(PojoTraits<T>::toPojo(item));
        }
        return Pojo::list(std::move(items));
    }

    static std::vector<T> fromPojo(const Pojo& pojo) {
        std::vector<T> result;
        if (pojo.isNull()) {
            return result;
        }
        for (const auto& item : pojo.asList()) {
            result.push_back(PojoTraits<T>::fromPojo(item));
        }
        return result;
    }

    static ClassMetaPtr meta() { return ClassMeta::listOf(PojoTraits<T>::meta()); }
};

template <typename T>
struct PojoTraits<std::map<std::string, T>> {
    static Pojo toPojo(const std::map<std::string, T>& value) {
        PojoMap entries;
        for (const auto& [key, item] : value) {
            entries.put(key, PojoTraits<T>::toPojo(item));
        }
        return Pojo::map(std::move(entries));
    }

    static std::map<std::string, T> fromPojo(const Pojo& pojo) {
        std::map<std::string, T> result;
        if (pojo.isNull()) {
            return result;
        }
        for (const auto& [key, item] : pojo.asMap()) {
            if (key.isNull()) {
                throw ParseError("Null key not allowed in a string-keyed map");
            }
            result[key.getString()] = PojoTraits<T>::fromPojo(item);
        }
        return result;
    }

    static ClassMetaPtr meta() {
        return ClassMeta::mapOf(ClassMeta::string(), PojoTraits<T>::meta());
    }
};

template <typename T>
struct PojoTraits<std::optional<T>> {
    static Pojo toPojo(const std::optional<T>& value) {
        return value ? PojoTraits<T>::toPojo(*value) : Pojo();
    }

    static std::optional<T> fromPojo(const Pojo& pojo) {
        if (pojo.isNull()) {
            return std::nullopt;
        }
        return PojoTraits<T>::fromPojo(pojo);
    }

    static ClassMetaPtr meta() { return PojoTraits<T>::meta(); }
};

} // namespace marshal
