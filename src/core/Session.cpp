#include "core/Session.hpp"
#include "core/MarshalContext.hpp"

namespace marshal {

Session::Session(const MarshalContext& context, MediaType mediaType, SessionOptions options)
    : m_context(context)
    , m_mediaType(std::move(mediaType))
    , m_options(std::move(options))
{}

const TypeRegistry& Session::types() const { return m_context.types(); }
const SwapRegistry& Session::swaps() const { return m_context.swaps(); }
const TypeCategorizer& Session::categorizer() const { return m_context.categorizer(); }
const StringConvertibility& Session::strings() const { return m_context.strings(); }

} // namespace marshal
