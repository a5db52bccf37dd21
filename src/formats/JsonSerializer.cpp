#include "formats/JsonSerializer.hpp"
#include "core/Errors.hpp"
#include <limits>

namespace marshal::formats {

// =============================================================================
// JsonWriter
// =============================================================================

JsonWriter::JsonWriter(const Session& session, std::string& out)
    : EventWriter(session)
    , m_out(out)
{}

void JsonWriter::onEvent(const NodeEvent& event) {
    switch (event.type) {
        case NodeEventType::EnterMap:
            m_stack.push_back(place(ordered_json::object()));
            break;
        case NodeEventType::EnterSequence:
            m_stack.push_back(place(ordered_json::array()));
            break;
        case NodeEventType::ExitMap:
        case NodeEventType::ExitSequence:
            m_stack.pop_back();
            break;
        case NodeEventType::MapEntry:
            m_pendingKey = event.value.isNull() ? "null" : event.value.getString();
            break;
        case NodeEventType::SequenceElement:
            break;
        case NodeEventType::Scalar:
            place(JsonParser::scalarToJson(event.value));
            break;
        case NodeEventType::Null:
            place(nullptr);
            break;
        case NodeEventType::RecursionDetected:
            checkRecursion(event);
            place(nullptr);
            break;
    }
}

void JsonWriter::finish() {
    m_out = m_root.dump(m_session.getOptions().useWhitespace ? 2 : -1);
}

ordered_json* JsonWriter::place(ordered_json value) {
    if (m_stack.empty()) {
        m_root = std::move(value);
        return &m_root;
    }
    ordered_json* top = m_stack.back();
    if (top->is_object()) {
        ordered_json& slot = (*top)[m_pendingKey];
        slot = std::move(value);
        return &slot;
    }
    top->push_back(std::move(value));
    return &top->back();
}

// =============================================================================
// JsonSerializer / JsonParser
// =============================================================================

std::unique_ptr<EventWriter> JsonSerializer::createWriter(const Session& session, std::string& out) const {
    return std::make_unique<JsonWriter>(session, out);
}

Pojo JsonParser::read(const std::string& input) const {
    ordered_json j;
    try {
        j = ordered_json::parse(input);
    } catch (const nlohmann::json::parse_error& e) {
        throw ParseError(std::string("Invalid JSON: ") + e.what());
    }
    return jsonToPojo(j);
}

ordered_json JsonParser::scalarToJson(const Pojo& value) {
    if (value.isBool()) return value.getBool();
    if (value.isInt()) return value.getInt();
    if (value.isDouble()) return value.getDouble();
    if (value.isString()) return value.getString();
    return nullptr;
}

Pojo JsonParser::jsonToPojo(const ordered_json& j) {
    switch (j.type()) {
        case ordered_json::value_t::null:
            return Pojo();
        case ordered_json::value_t::boolean:
            return Pojo(j.get<bool>());
        case ordered_json::value_t::number_integer:
            return Pojo(j.get<int64_t>());
        case ordered_json::value_t::number_unsigned: {
            auto value = j.get<uint64_t>();
            if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return Pojo(static_cast<double>(value));
            }
            return Pojo(static_cast<int64_t>(value));
        }
        case ordered_json::value_t::number_float:
            return Pojo(j.get<double>());
        case ordered_json::value_t::string:
            return Pojo(j.get<std::string>());
        case ordered_json::value_t::binary: {
            const auto& bytes = j.get_binary();
            return Pojo(std::string(bytes.begin(), bytes.end()));
        }
        case ordered_json::value_t::array: {
            PojoList items;
            items.reserve(j.size());
            for (const auto& item : j) {
                items.push_back(jsonToPojo(item));
            }
            return Pojo::list(std::move(items));
        }
        case ordered_json::value_t::object: {
            PojoMap entries;
            for (auto it = j.begin(); it != j.end(); ++it) {
                entries.put(it.key(), jsonToPojo(it.value()));
            }
            return Pojo::map(std::move(entries));
        }
        case ordered_json::value_t::discarded:
            break;
    }
    throw ParseError("Unsupported JSON value");
}

} // namespace marshal::formats
