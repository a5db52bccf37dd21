#pragma once

#include "core/ClassMeta.hpp"
#include "core/MarshalContext.hpp"
#include "core/MediaType.hpp"
#include "core/Pojo.hpp"
#include "core/Session.hpp"
#include "core/SessionOptions.hpp"
#include <memory>
#include <string>

namespace marshal::formats {

/**
 * Base class of all format parsers
 *
 * parse() reads the input into the generic form (scalars, PojoList,
 * PojoMap) and lets the TreeWalker rebuild the target type from it.
 */
class Parser {
public:
    explicit Parser(const std::string& mediaType);
    virtual ~Parser() = default;

    const MediaType& getMediaType() const { return m_mediaType; }

    /**
     * Parse into targetType (nullptr means Any)
     */
    Pojo parse(const MarshalContext& context, const std::string& input,
               const ClassMetaPtr& targetType = nullptr,
               const SessionOptions& options = {}) const;

    Pojo parse(const Session& session, const std::string& input,
               const ClassMetaPtr& targetType = nullptr) const;

    /**
     * Read the input into generic form
     * Throws ParseError on malformed input
     */
    virtual Pojo read(const std::string& input) const = 0;

private:
    MediaType m_mediaType;
};

using ParserPtr = std::shared_ptr<const Parser>;

} // namespace marshal::formats
