#pragma once

#include "core/StringConvertibility.hpp"
#include "core/SwapRegistry.hpp"
#include "core/TypeCategorizer.hpp"
#include "core/TypeRegistry.hpp"

namespace marshal {

/**
 * Long-lived registries shared by every serialize and parse call
 *
 * Usage:
 *   MarshalContext context;
 *   BeanBuilder<Person>("Person")...buildAndRegister(context.types());
 *   SwapBuilder<Color>("ColorSwap")...buildAndRegister(context.swaps());
 *   context.freeze();
 *   // context is now read-only and can be shared across threads
 */
class MarshalContext {
public:
    MarshalContext();

    MarshalContext(const MarshalContext&) = delete;
    MarshalContext& operator=(const MarshalContext&) = delete;

    TypeRegistry& types() { return m_types; }
    const TypeRegistry& types() const { return m_types; }

    SwapRegistry& swaps() { return m_swaps; }
    const SwapRegistry& swaps() const { return m_swaps; }

    const StringConvertibility& strings() const { return m_strings; }
    const TypeCategorizer& categorizer() const { return m_categorizer; }
    TypeCategorizer& categorizer() { return m_categorizer; }

    /**
     * End of setup: both registries become read-only and swap ambiguities
     * are logged
     */
    void freeze();
    bool isFrozen() const;

private:
    TypeRegistry m_types;
    SwapRegistry m_swaps;
    StringConvertibility m_strings;
    TypeCategorizer m_categorizer;
};

} // namespace marshal
