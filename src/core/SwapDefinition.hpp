#pragma once

#include "core/ClassMeta.hpp"
#include "core/MediaType.hpp"
#include "core/Pojo.hpp"
#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <vector>

namespace marshal {

class Session;

/**
 * Forward transformation: source value -> serializable intermediate
 */
using SwapFunction = std::function<Pojo(const Pojo& value, const Session& session)>;

/**
 * Inverse transformation: parsed intermediate -> value of targetType
 */
using UnswapFunction = std::function<Pojo(const Pojo& intermediate,
                                          const ClassMetaPtr& targetType,
                                          const Session& session)>;

/**
 * Registered pair of transformations for one source type
 *
 * A definition with media ranges is conditional: it applies only when one
 * of its ranges matches the session media type.
 */
class SwapDefinition {
public:
    SwapDefinition(std::string name,
                   std::type_index sourceType,
                   ClassMetaPtr targetType,
                   SwapFunction forward,
                   UnswapFunction inverse = nullptr,
                   std::vector<MediaRange> mediaRanges = {});

    const std::string& getName() const { return m_name; }
    std::type_index getSourceType() const { return m_sourceType; }

    /**
     * Declared intermediate type (Any when the swap doesn't fix one)
     */
    const ClassMetaPtr& getTargetType() const { return m_targetType; }

    const std::vector<MediaRange>& getMediaRanges() const { return m_mediaRanges; }

    bool isOneWay() const { return !m_inverse; }
    bool isConditional() const { return !m_mediaRanges.empty(); }

    /**
     * Best match score of the media ranges against mediaType
     * Unconditional definitions always score 0
     */
    int matchScore(const MediaType& mediaType) const;

    /**
     * Unconditional, or at least one range matches
     */
    bool appliesTo(const MediaType& mediaType) const;

    Pojo swap(const Pojo& value, const Session& session) const;

    /**
     * Throws UnswapError if the definition is one-way
     */
    Pojo unswap(const Pojo& intermediate, const ClassMetaPtr& targetType,
                const Session& session) const;

private:
    std::string m_name;
    std::type_index m_sourceType;
    ClassMetaPtr m_targetType;
    SwapFunction m_forward;
    UnswapFunction m_inverse;
    std::vector<MediaRange> m_mediaRanges;
};

using SwapDefinitionPtr = std::shared_ptr<const SwapDefinition>;

} // namespace marshal
