#pragma once

#include "core/MediaType.hpp"
#include "core/SessionOptions.hpp"

namespace marshal {

class MarshalContext;
class TypeRegistry;
class SwapRegistry;
class TypeCategorizer;
class StringConvertibility;

/**
 * One serialize or parse call: context, negotiated media type and options.
 * Never shared between concurrent walks.
 */
class Session {
public:
    Session(const MarshalContext& context, MediaType mediaType, SessionOptions options = {});

    const MarshalContext& getContext() const { return m_context; }
    const MediaType& getMediaType() const { return m_mediaType; }
    const SessionOptions& getOptions() const { return m_options; }

    const TypeRegistry& types() const;
    const SwapRegistry& swaps() const;
    const TypeCategorizer& categorizer() const;
    const StringConvertibility& strings() const;

private:
    const MarshalContext& m_context;
    MediaType m_mediaType;
    SessionOptions m_options;
};

} // namespace marshal
