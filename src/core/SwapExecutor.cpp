#include "core/SwapExecutor.hpp"
#include "core/Errors.hpp"
#include "core/SwapRegistry.hpp"
#include "core/TypeRegistry.hpp"
#include "util/Logger.hpp"
#include <stdexcept>

namespace marshal {

SwapExecutor::SwapExecutor(const Session& session)
    : m_session(session)
{}

SwapDefinitionPtr SwapExecutor::resolve(const ClassMetaPtr& targetType) const {
    if (!targetType || !targetType->getType()) {
        return nullptr;
    }
    return m_session.swaps().lookup(*targetType->getType(), m_session.getMediaType());
}

Pojo SwapExecutor::forward(const Pojo& value) const {
    auto def = m_session.swaps().lookup(value.type(), m_session.getMediaType());
    if (!def) {
        throw std::logic_error("No swap applies to " + value.kindName() + " under " +
                               m_session.getMediaType().toString());
    }
    LOG_DEBUG("Applying swap '" + def->getName() + "'");
    return def->swap(value, m_session);
}

Pojo SwapExecutor::backward(const Pojo& intermediate, const ClassMetaPtr& targetType) const {
    auto def = resolve(targetType);
    if (!def) {
        throw UnswapError("No swap applies to '" +
                          (targetType ? targetType->getName() : std::string("Object")) +
                          "' under " + m_session.getMediaType().toString());
    }
    LOG_DEBUG("Reversing swap '" + def->getName() + "'");
    return def->unswap(intermediate, targetType, m_session);
}

} // namespace marshal
