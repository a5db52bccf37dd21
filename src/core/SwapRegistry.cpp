#include "core/SwapRegistry.hpp"
#include "util/Logger.hpp"
#include <stdexcept>

namespace marshal {

void SwapRegistry::registerSwap(SwapDefinitionPtr definition) {
    if (!definition) {
        throw std::invalid_argument("Cannot register a null swap definition");
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_frozen) {
        throw std::logic_error("Swap registry is frozen, cannot register '" +
                               definition->getName() + "'");
    }
    LOG_DEBUG("Registered swap: " + definition->getName());
    m_swaps[definition->getSourceType()].push_back(std::move(definition));
}

void SwapRegistry::freeze() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_frozen = true;
    }
    for (const auto& [first, second] : findAmbiguities()) {
        LOG_WARN("Ambiguous swaps '" + first->getName() + "' and '" + second->getName() +
                 "' share a media range; '" + first->getName() + "' takes precedence");
    }
}

SwapDefinitionPtr SwapRegistry::lookup(std::type_index type, const MediaType& mediaType) const {
    if (m_frozen) {
        return lookupUnlocked(type, mediaType);
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    return lookupUnlocked(type, mediaType);
}

SwapDefinitionPtr SwapRegistry::lookupUnlocked(std::type_index type, const MediaType& mediaType) const {
    auto it = m_swaps.find(type);
    if (it == m_swaps.end()) {
        return nullptr;
    }

    SwapDefinitionPtr bestConditional;
    int bestScore = 0;
    SwapDefinitionPtr lastUnconditional;

    for (const auto& def : it->second) {
        if (def->isConditional()) {
            int score = def->matchScore(mediaType);
            if (score > bestScore) {
                bestScore = score;
                bestConditional = def;
            }
        } else {
            lastUnconditional = def;
        }
    }
    return bestConditional ? bestConditional : lastUnconditional;
}

bool SwapRegistry::hasSwaps(std::type_index type) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_swaps.count(type) > 0;
}

std::vector<SwapDefinitionPtr> SwapRegistry::getSwaps(std::type_index type) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_swaps.find(type);
    return it != m_swaps.end() ? it->second : std::vector<SwapDefinitionPtr>{};
}

std::vector<std::pair<SwapDefinitionPtr, SwapDefinitionPtr>> SwapRegistry::findAmbiguities() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::pair<SwapDefinitionPtr, SwapDefinitionPtr>> result;

    for (const auto& [type, defs] : m_swaps) {
        for (size_t i = 0; i < defs.size(); ++i) {
            if (!defs[i]->isConditional()) continue;
            for (size_t j = i + 1; j < defs.size(); ++j) {
                if (!defs[j]->isConditional()) continue;
                bool overlap = false;
                for (const auto& range : defs[i]->getMediaRanges()) {
                    // Equal ranges score the same against every media type
                    for (const auto& other : defs[j]->getMediaRanges()) {
                        if (range == other) overlap = true;
                    }
                }
                if (overlap) {
                    result.emplace_back(defs[i], defs[j]);
                }
            }
        }
    }
    return result;
}

size_t SwapRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t total = 0;
    for (const auto& [type, defs] : m_swaps) {
        total += defs.size();
    }
    return total;
}

} // namespace marshal
