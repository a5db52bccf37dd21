#include "core/VirtualBean.hpp"
#include <stdexcept>

namespace marshal {

VirtualBean::VirtualBean(ClassMetaPtr interfaceType)
    : m_interfaceType(std::move(interfaceType))
{
    if (!m_interfaceType || !m_interfaceType->isInterface()) {
        throw std::invalid_argument("VirtualBean requires an interface bean type");
    }
}

Pojo VirtualBean::create(ClassMetaPtr interfaceType) {
    return Pojo::object(std::make_shared<VirtualBean>(std::move(interfaceType)));
}

Pojo VirtualBean::get(const std::string& name) const {
    return m_values.get(name);
}

void VirtualBean::set(const std::string& name, const Pojo& value) {
    if (!m_interfaceType->findProperty(name)) {
        throw std::invalid_argument("Interface '" + m_interfaceType->getName() +
                                    "' has no property '" + name + "'");
    }
    m_values.put(name, value);
}

} // namespace marshal
