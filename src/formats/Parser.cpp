#include "formats/Parser.hpp"
#include "core/TreeWalker.hpp"
#include "util/Profiler.hpp"

namespace marshal::formats {

Parser::Parser(const std::string& mediaType)
    : m_mediaType(MediaType::parse(mediaType))
{}

Pojo Parser::parse(const MarshalContext& context, const std::string& input,
                   const ClassMetaPtr& targetType, const SessionOptions& options) const {
    Session session(context, m_mediaType, options);
    return parse(session, input, targetType);
}

Pojo Parser::parse(const Session& session, const std::string& input,
                   const ClassMetaPtr& targetType) const {
    util::ProfileScope scope("parse", m_mediaType.toString());
    scope.setBytes(input.size());

    Pojo node = read(input);
    TreeWalker walker(session);
    return walker.reconstruct(node, targetType);
}

} // namespace marshal::formats
