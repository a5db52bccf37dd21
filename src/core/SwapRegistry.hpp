#pragma once

#include "core/SwapDefinition.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace marshal {

/**
 * Registry of swap definitions, keyed by source type
 *
 * Lookup rules for one source type:
 * - conditional definitions are tried before unconditional ones
 * - among matching conditional definitions the highest media range score
 *   wins, ties go to the first registered
 * - among unconditional definitions the last registered wins
 *
 * Registration happens during setup; after freeze() the registry is
 * read-only and lookups take no lock.
 */
class SwapRegistry {
public:
    SwapRegistry() = default;

    // Non-copyable, non-movable (the categorizer keeps a reference)
    SwapRegistry(const SwapRegistry&) = delete;
    SwapRegistry& operator=(const SwapRegistry&) = delete;

    // === Registration ===

    /**
     * Throws std::logic_error once frozen
     */
    void registerSwap(SwapDefinitionPtr definition);

    /**
     * Make the registry read-only and log every ambiguity as a warning
     */
    void freeze();
    bool isFrozen() const { return m_frozen; }

    // === Lookup ===

    /**
     * Definition applying to type under mediaType, nullptr if none
     */
    SwapDefinitionPtr lookup(std::type_index type, const MediaType& mediaType) const;

    bool hasSwaps(std::type_index type) const;

    /**
     * All definitions for a type in registration order
     */
    std::vector<SwapDefinitionPtr> getSwaps(std::type_index type) const;

    /**
     * Pairs of conditional definitions on the same type that share a media
     * range of equal specificity; the first of each pair wins at lookup
     */
    std::vector<std::pair<SwapDefinitionPtr, SwapDefinitionPtr>> findAmbiguities() const;

    size_t size() const;

private:
    SwapDefinitionPtr lookupUnlocked(std::type_index type, const MediaType& mediaType) const;

    mutable std::mutex m_mutex;
    std::unordered_map<std::type_index, std::vector<SwapDefinitionPtr>> m_swaps;
    std::atomic<bool> m_frozen{false};
};

} // namespace marshal
