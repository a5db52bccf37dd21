#include "formats/MsgPackSerializer.hpp"
#include "core/Errors.hpp"

namespace marshal::formats {

namespace {

class MsgPackWriter : public JsonWriter {
public:
    using JsonWriter::JsonWriter;

    void finish() override {
        std::vector<std::uint8_t> bytes = ordered_json::to_msgpack(document());
        m_out.assign(bytes.begin(), bytes.end());
    }
};

} // namespace

std::unique_ptr<EventWriter> MsgPackSerializer::createWriter(const Session& session, std::string& out) const {
    return std::make_unique<MsgPackWriter>(session, out);
}

Pojo MsgPackParser::read(const std::string& input) const {
    ordered_json j;
    try {
        j = ordered_json::from_msgpack(input);
    } catch (const nlohmann::json::exception& e) {
        throw ParseError(std::string("Invalid MessagePack: ") + e.what());
    }
    return JsonParser::jsonToPojo(j);
}

} // namespace marshal::formats
