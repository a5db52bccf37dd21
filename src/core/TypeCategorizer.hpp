#pragma once

#include "core/Category.hpp"
#include "core/ClassMeta.hpp"
#include "core/MediaType.hpp"
#include "core/Pojo.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <tuple>

namespace marshal {

class TypeRegistry;
class SwapRegistry;
class StringConvertibility;

/**
 * Assigns a Category to values and types
 *
 * Classification order, first match wins:
 * 1. null => no category
 * 2. boolean, integer, double, string => PRIMITIVE
 * 3. applicable swap => SWAPPED_TWOWAY / SWAPPED_ONEWAY
 * 4. stream type => STREAM_LIKE
 * 5. list / map => COLLECTION_STANDARD or COLLECTION_NONSTANDARD
 * 6. bean => BEAN_VIRTUAL, BEAN_READONLY, BEAN_NONSTANDARD or BEAN_STANDARD
 * 7. to-string (+ from-string) => STRINGIFIABLE_ONEWAY / STRINGIFIABLE_TWOWAY
 * 8. OPAQUE
 *
 * Results are cached per (type, media type). The cache is filled lazily
 * under a mutex, so one instance serves concurrent walks.
 */
class TypeCategorizer {
public:
    TypeCategorizer(const TypeRegistry& types, const SwapRegistry& swaps,
                    const StringConvertibility& strings);

    TypeCategorizer(const TypeCategorizer&) = delete;
    TypeCategorizer& operator=(const TypeCategorizer&) = delete;

    /**
     * Category of a value, std::nullopt for null
     */
    std::optional<Category> categorize(const Pojo& value, const ClassMetaPtr& declaredType,
                                       const MediaType& mediaType) const;

    /**
     * Category of a type. An unresolvable reference is OPAQUE; Any is
     * PRIMITIVE since it is parsed into the generic value form.
     */
    Category categorizeType(const ClassMetaPtr& meta, const MediaType& mediaType) const;

    /**
     * Category of a type ignoring swaps registered for the type itself
     */
    Category categorizeStructure(const ClassMetaPtr& meta, const MediaType& mediaType) const;

    /**
     * Type used to walk a value: the declared container type when the
     * runtime value is a container of the same kind, else the runtime type.
     * nullptr for null and for unregistered runtime types.
     */
    ClassMetaPtr effectiveType(const Pojo& value, const ClassMetaPtr& declaredType) const;

    /**
     * Whether values of a declared member type can be reconstructed by a parser
     */
    bool isStandardMember(const ClassMetaPtr& meta, const MediaType& mediaType) const;

    void clearCache();
    size_t cacheSize() const;

private:
    using InProgress = std::set<const ClassMeta*>;
    using CacheKey = std::tuple<ClassMetaPtr, std::string, bool>;

    Category cached(const ClassMetaPtr& meta, const MediaType& mediaType, bool useSwaps) const;
    Category compute(const ClassMetaPtr& meta, const MediaType& mediaType, bool useSwaps,
                     InProgress& inProgress) const;
    bool isStandardMember(const ClassMetaPtr& meta, const MediaType& mediaType,
                          InProgress& inProgress) const;

    const TypeRegistry& m_types;
    const SwapRegistry& m_swaps;
    const StringConvertibility& m_strings;

    mutable std::mutex m_mutex;
    mutable std::map<CacheKey, Category> m_cache;
};

} // namespace marshal
