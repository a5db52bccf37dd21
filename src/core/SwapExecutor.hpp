#pragma once

#include "core/ClassMeta.hpp"
#include "core/Pojo.hpp"
#include "core/Session.hpp"
#include "core/SwapDefinition.hpp"

namespace marshal {

/**
 * Applies the swap selected for the session media type
 */
class SwapExecutor {
public:
    explicit SwapExecutor(const Session& session);

    /**
     * Definition that applies to values of targetType, nullptr if none
     */
    SwapDefinitionPtr resolve(const ClassMetaPtr& targetType) const;

    /**
     * Transform value into its intermediate form
     * Throws std::logic_error when no swap applies to the value's type
     */
    Pojo forward(const Pojo& value) const;

    /**
     * Rebuild a value of targetType from a parsed intermediate
     * Throws UnswapError when no swap applies or the swap is one-way
     */
    Pojo backward(const Pojo& intermediate, const ClassMetaPtr& targetType) const;

private:
    const Session& m_session;
};

} // namespace marshal
