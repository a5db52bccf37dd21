#pragma once

#include "formats/Parser.hpp"
#include "formats/Serializer.hpp"
#include <nlohmann/json.hpp>
#include <vector>

namespace marshal::formats {

using ordered_json = nlohmann::ordered_json;

/**
 * Builds an ordered_json document from NodeEvents
 *
 * Map entries keep their walk order. A null key is written as "null".
 */
class JsonWriter : public EventWriter {
public:
    JsonWriter(const Session& session, std::string& out);

    void onEvent(const NodeEvent& event) override;
    void finish() override;

    const ordered_json& document() const { return m_root; }

protected:
    std::string& m_out;

private:
    ordered_json* place(ordered_json value);

    ordered_json m_root;
    std::vector<ordered_json*> m_stack;
    std::string m_pendingKey;
};

/**
 * application/json
 */
class JsonSerializer : public Serializer {
public:
    JsonSerializer() : Serializer("application/json") {}

protected:
    std::unique_ptr<EventWriter> createWriter(const Session& session, std::string& out) const override;
};

class JsonParser : public Parser {
public:
    JsonParser() : Parser("application/json") {}

    Pojo read(const std::string& input) const override;

    // === Helpers (shared with MessagePack) ===

    static ordered_json scalarToJson(const Pojo& value);
    static Pojo jsonToPojo(const ordered_json& j);
};

} // namespace marshal::formats
