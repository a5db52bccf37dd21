#pragma once

#include "core/ClassMeta.hpp"
#include "core/Pojo.hpp"
#include "core/PojoTraits.hpp"
#include <memory>
#include <string>

namespace marshal {

/**
 * Runtime-synthesized instance of an interface bean.
 *
 * Holds property values by name. Only properties declared on the interface
 * can be set.
 */
class VirtualBean {
public:
    explicit VirtualBean(ClassMetaPtr interfaceType);

    static Pojo create(ClassMetaPtr interfaceType);

    const ClassMetaPtr& getInterfaceType() const { return m_interfaceType; }

    Pojo get(const std::string& name) const;

    template <typename V>
    V get(const std::string& name) const {
        return PojoTraits<V>::fromPojo(get(name));
    }

    /**
     * Throws std::invalid_argument for a name the interface doesn't declare
     */
    void set(const std::string& name, const Pojo& value);

    const PojoMap& values() const { return m_values; }

private:
    ClassMetaPtr m_interfaceType;
    PojoMap m_values;
};

} // namespace marshal
