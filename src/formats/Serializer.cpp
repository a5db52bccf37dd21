#include "formats/Serializer.hpp"
#include "core/Errors.hpp"
#include "core/TreeWalker.hpp"
#include "util/Profiler.hpp"

namespace marshal::formats {

void EventWriter::checkRecursion(const NodeEvent& event) const {
    if (!m_session.getOptions().ignoreRecursions) {
        throw SerializeError("Recursion detected on type '" + event.typeName + "'");
    }
}

Serializer::Serializer(const std::string& mediaType)
    : m_mediaType(MediaType::parse(mediaType))
{}

std::string Serializer::serialize(const MarshalContext& context, const Pojo& value,
                                  const ClassMetaPtr& declaredType,
                                  const SessionOptions& options) const {
    Session session(context, m_mediaType, options);
    return serialize(session, value, declaredType);
}

std::string Serializer::serialize(const Session& session, const Pojo& value,
                                  const ClassMetaPtr& declaredType) const {
    util::ProfileScope scope("serialize", m_mediaType.toString());

    std::string out;
    auto writer = createWriter(session, out);
    TreeWalker walker(session);
    walker.walk(value, declaredType, [&writer](const NodeEvent& event) {
        writer->onEvent(event);
    });
    writer->finish();
    scope.setBytes(out.size());
    return out;
}

} // namespace marshal::formats
