#include "core/TypeCategorizer.hpp"
#include "core/StringConvertibility.hpp"
#include "core/SwapRegistry.hpp"
#include "core/TypeRegistry.hpp"

namespace marshal {

TypeCategorizer::TypeCategorizer(const TypeRegistry& types, const SwapRegistry& swaps,
                                 const StringConvertibility& strings)
    : m_types(types)
    , m_swaps(swaps)
    , m_strings(strings)
{}

std::optional<Category> TypeCategorizer::categorize(const Pojo& value,
                                                    const ClassMetaPtr& declaredType,
                                                    const MediaType& mediaType) const {
    if (value.isNull()) {
        return std::nullopt;
    }
    if (value.isScalar()) {
        return Category::PRIMITIVE;
    }
    auto meta = effectiveType(value, declaredType);
    if (!meta) {
        return Category::OPAQUE;
    }
    return categorizeType(meta, mediaType);
}

Category TypeCategorizer::categorizeType(const ClassMetaPtr& meta, const MediaType& mediaType) const {
    return cached(meta, mediaType, true);
}

Category TypeCategorizer::categorizeStructure(const ClassMetaPtr& meta, const MediaType& mediaType) const {
    return cached(meta, mediaType, false);
}

ClassMetaPtr TypeCategorizer::effectiveType(const Pojo& value, const ClassMetaPtr& declaredType) const {
    auto runtime = m_types.forObject(value);
    if (!runtime) {
        return nullptr;
    }
    if (declaredType && !declaredType->isAny()) {
        auto declared = m_types.resolve(declaredType);
        if (declared && declared->getKind() == runtime->getKind() &&
            (runtime->isList() || runtime->isMap())) {
            return declared;
        }
    }
    return runtime;
}

bool TypeCategorizer::isStandardMember(const ClassMetaPtr& meta, const MediaType& mediaType) const {
    InProgress inProgress;
    return isStandardMember(meta, mediaType, inProgress);
}

void TypeCategorizer::clearCache() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cache.clear();
}

size_t TypeCategorizer::cacheSize() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cache.size();
}

Category TypeCategorizer::cached(const ClassMetaPtr& meta, const MediaType& mediaType, bool useSwaps) const {
    CacheKey key{meta ? meta : ClassMeta::any(), mediaType.toString(), useSwaps};
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_cache.find(key);
        if (it != m_cache.end()) {
            return it->second;
        }
    }

    InProgress inProgress;
    Category category = compute(std::get<0>(key), mediaType, useSwaps, inProgress);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_cache.emplace(std::move(key), category);
    return category;
}

Category TypeCategorizer::compute(const ClassMetaPtr& declared, const MediaType& mediaType,
                                  bool useSwaps, InProgress& inProgress) const {
    auto meta = m_types.resolve(declared);
    if (!meta) {
        return Category::OPAQUE;
    }

    switch (meta->getKind()) {
        case TypeKind::Any:
        case TypeKind::Boolean:
        case TypeKind::Integer:
        case TypeKind::Double:
        case TypeKind::String:
            return Category::PRIMITIVE;
        default:
            break;
    }

    if (useSwaps && meta->getType()) {
        if (auto def = m_swaps.lookup(*meta->getType(), mediaType)) {
            return def->isOneWay() ? Category::SWAPPED_ONEWAY : Category::SWAPPED_TWOWAY;
        }
    }

    switch (meta->getKind()) {
        case TypeKind::CharStream:
        case TypeKind::ByteStream:
            return Category::STREAM_LIKE;

        case TypeKind::List:
            return isStandardMember(meta->getElementType(), mediaType, inProgress)
                ? Category::COLLECTION_STANDARD
                : Category::COLLECTION_NONSTANDARD;

        case TypeKind::Map:
            return isStandardMember(meta->getKeyType(), mediaType, inProgress) &&
                   isStandardMember(meta->getValueType(), mediaType, inProgress)
                ? Category::COLLECTION_STANDARD
                : Category::COLLECTION_NONSTANDARD;

        case TypeKind::Bean: {
            if (meta->isInterface()) {
                return Category::BEAN_VIRTUAL;
            }
            if (!meta->hasFactory()) {
                return Category::BEAN_READONLY;
            }
            for (const auto& prop : meta->getProperties()) {
                if (!prop.isWritable()) {
                    return Category::BEAN_READONLY;
                }
            }
            // Recursive references to this bean are assumed standard
            inProgress.insert(meta.get());
            for (const auto& prop : meta->getProperties()) {
                if (!isStandardMember(prop.type, mediaType, inProgress)) {
                    inProgress.erase(meta.get());
                    return Category::BEAN_NONSTANDARD;
                }
            }
            inProgress.erase(meta.get());
            return Category::BEAN_STANDARD;
        }

        default:
            break;
    }

    if (m_strings.hasToString(meta)) {
        return m_strings.hasFromString(meta) ? Category::STRINGIFIABLE_TWOWAY
                                             : Category::STRINGIFIABLE_ONEWAY;
    }
    return Category::OPAQUE;
}

bool TypeCategorizer::isStandardMember(const ClassMetaPtr& declared, const MediaType& mediaType,
                                       InProgress& inProgress) const {
    if (!declared || declared->isAny()) {
        return true;
    }
    auto meta = m_types.resolve(declared);
    if (!meta) {
        return false;
    }
    if (inProgress.count(meta.get()) > 0) {
        return true;
    }
    return isParsable(compute(meta, mediaType, true, inProgress));
}

} // namespace marshal
