#include "core/TraversalContext.hpp"
#include "core/Errors.hpp"

namespace marshal {

TraversalContext::TraversalContext(const MediaType& mediaType, bool detectRecursions, size_t maxDepth)
    : m_mediaType(mediaType)
    , m_detectRecursions(detectRecursions)
    , m_maxDepth(maxDepth)
{}

bool TraversalContext::isOpen(const void* identity) const {
    return m_open.count(identity) > 0;
}

TraversalContext::Frame::Frame(TraversalContext& context, const void* identity)
    : m_context(context)
    , m_identity(identity)
{
    if (m_context.m_detectRecursions && m_identity) {
        if (m_context.isOpen(m_identity)) {
            m_recursion = true;
            return;
        }
    }
    if (m_context.m_maxDepth > 0 && m_context.m_depth >= m_context.m_maxDepth) {
        throw SerializeError("Maximum depth of " + std::to_string(m_context.m_maxDepth) +
                             " exceeded");
    }
    if (m_context.m_detectRecursions && m_identity) {
        m_context.m_open.insert(m_identity);
        m_pushed = true;
    }
    ++m_context.m_depth;
}

TraversalContext::Frame::~Frame() {
    if (m_recursion) {
        return;
    }
    if (m_pushed) {
        m_context.m_open.erase(m_identity);
    }
    --m_context.m_depth;
}

} // namespace marshal
