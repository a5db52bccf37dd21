#include "core/SwapDefinition.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <stdexcept>

namespace marshal {

SwapDefinition::SwapDefinition(std::string name,
                               std::type_index sourceType,
                               ClassMetaPtr targetType,
                               SwapFunction forward,
                               UnswapFunction inverse,
                               std::vector<MediaRange> mediaRanges)
    : m_name(std::move(name))
    , m_sourceType(sourceType)
    , m_targetType(targetType ? std::move(targetType) : ClassMeta::any())
    , m_forward(std::move(forward))
    , m_inverse(std::move(inverse))
    , m_mediaRanges(std::move(mediaRanges))
{
    if (!m_forward) {
        throw std::invalid_argument("Swap '" + m_name + "' has no forward function");
    }
}

int SwapDefinition::matchScore(const MediaType& mediaType) const {
    int best = 0;
    for (const auto& range : m_mediaRanges) {
        best = std::max(best, range.match(mediaType));
    }
    return best;
}

bool SwapDefinition::appliesTo(const MediaType& mediaType) const {
    return !isConditional() || matchScore(mediaType) > 0;
}

Pojo SwapDefinition::swap(const Pojo& value, const Session& session) const {
    return m_forward(value, session);
}

Pojo SwapDefinition::unswap(const Pojo& intermediate, const ClassMetaPtr& targetType,
                            const Session& session) const {
    if (!m_inverse) {
        throw UnswapError("Swap '" + m_name + "' is one-way, cannot parse into '" +
                          (targetType ? targetType->getName() : std::string("Object")) + "'");
    }
    return m_inverse(intermediate, targetType, session);
}

} // namespace marshal
