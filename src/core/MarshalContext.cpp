#include "core/MarshalContext.hpp"
#include "util/Logger.hpp"

namespace marshal {

MarshalContext::MarshalContext()
    : m_strings(m_types)
    , m_categorizer(m_types, m_swaps, m_strings)
{}

void MarshalContext::freeze() {
    m_types.freeze();
    m_swaps.freeze();
    m_categorizer.clearCache();
    LOG_INFO("Marshal context frozen: " + std::to_string(m_types.size()) + " types, " +
             std::to_string(m_swaps.size()) + " swaps");
}

bool MarshalContext::isFrozen() const {
    return m_types.isFrozen() && m_swaps.isFrozen();
}

} // namespace marshal
