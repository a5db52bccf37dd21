#pragma once

#include "formats/JsonSerializer.hpp"

namespace marshal::formats {

/**
 * octal/msgpack - the JSON document model packed with MessagePack
 */
class MsgPackSerializer : public Serializer {
public:
    MsgPackSerializer() : Serializer("octal/msgpack") {}

    bool isBinary() const override { return true; }

protected:
    std::unique_ptr<EventWriter> createWriter(const Session& session, std::string& out) const override;
};

class MsgPackParser : public Parser {
public:
    MsgPackParser() : Parser("octal/msgpack") {}

    Pojo read(const std::string& input) const override;
};

} // namespace marshal::formats
