#pragma once

#include "core/MediaType.hpp"
#include <cstddef>
#include <unordered_set>

namespace marshal {

/**
 * Per-walk traversal state: the identities currently open on the path
 * from the root and the nesting depth. Owned by exactly one walk.
 */
class TraversalContext {
public:
    /**
     * maxDepth 0 means unbounded
     */
    TraversalContext(const MediaType& mediaType, bool detectRecursions, size_t maxDepth);

    TraversalContext(const TraversalContext&) = delete;
    TraversalContext& operator=(const TraversalContext&) = delete;

    const MediaType& getMediaType() const { return m_mediaType; }
    size_t depth() const { return m_depth; }
    bool isOpen(const void* identity) const;

    /**
     * RAII scope of one container or bean on the path
     *
     * Entering an identity that is already open (with recursion detection
     * on) produces a frame where isRecursion() is true; nothing is pushed.
     * Throws SerializeError when the depth bound is exceeded.
     */
    class Frame {
    public:
        Frame(TraversalContext& context, const void* identity);
        ~Frame();

        Frame(const Frame&) = delete;
        Frame& operator=(const Frame&) = delete;

        bool isRecursion() const { return m_recursion; }

    private:
        TraversalContext& m_context;
        const void* m_identity;
        bool m_pushed = false;
        bool m_recursion = false;
    };

private:
    MediaType m_mediaType;
    bool m_detectRecursions;
    size_t m_maxDepth;
    size_t m_depth = 0;
    std::unordered_set<const void*> m_open;
};

} // namespace marshal
