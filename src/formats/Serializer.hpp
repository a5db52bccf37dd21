#pragma once

#include "core/ClassMeta.hpp"
#include "core/MarshalContext.hpp"
#include "core/MediaType.hpp"
#include "core/NodeEvent.hpp"
#include "core/Pojo.hpp"
#include "core/Session.hpp"
#include "core/SessionOptions.hpp"
#include <memory>
#include <string>

namespace marshal::formats {

/**
 * Consumer of the NodeEvents of one serialization call
 */
class EventWriter {
public:
    explicit EventWriter(const Session& session) : m_session(session) {}
    virtual ~EventWriter() = default;

    virtual void onEvent(const NodeEvent& event) = 0;

    /**
     * Called once after the last event
     */
    virtual void finish() {}

protected:
    /**
     * Returns when the recursion should be written as null, throws
     * SerializeError when recursions are not ignored
     */
    void checkRecursion(const NodeEvent& event) const;

    const Session& m_session;
};

/**
 * Base class of all format serializers
 *
 * serialize() runs a TreeWalker over the value and feeds its events to the
 * writer created by the format.
 */
class Serializer {
public:
    explicit Serializer(const std::string& mediaType);
    virtual ~Serializer() = default;

    const MediaType& getMediaType() const { return m_mediaType; }

    /**
     * Serialize under this serializer's media type
     * declaredType nullptr means Any
     */
    std::string serialize(const MarshalContext& context, const Pojo& value,
                          const ClassMetaPtr& declaredType = nullptr,
                          const SessionOptions& options = {}) const;

    /**
     * Serialize under an existing session (its media type may carry
     * parameters that conditional swaps match on)
     */
    std::string serialize(const Session& session, const Pojo& value,
                          const ClassMetaPtr& declaredType = nullptr) const;

    /**
     * True when the output is binary rather than text
     */
    virtual bool isBinary() const { return false; }

protected:
    virtual std::unique_ptr<EventWriter> createWriter(const Session& session, std::string& out) const = 0;

private:
    MediaType m_mediaType;
};

using SerializerPtr = std::shared_ptr<const Serializer>;

} // namespace marshal::formats
