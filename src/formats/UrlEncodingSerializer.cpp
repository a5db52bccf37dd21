#include "formats/UrlEncodingSerializer.hpp"
#include "core/Errors.hpp"
#include "formats/UonSerializer.hpp"
#include <cctype>

namespace marshal::formats {

const std::string UrlEncodingSerializer::VALUE_PARAMETER = "_value";

namespace {

/**
 * Splits the root map into pairs and streams each value through a
 * UonWriter into a buffer that is percent-encoded when the pair ends
 */
class UrlEncodingWriter : public EventWriter {
public:
    UrlEncodingWriter(const Session& session, std::string& out)
        : EventWriter(session)
        , m_out(out)
    {}

    void onEvent(const NodeEvent& event) override {
        if (!m_started) {
            m_started = true;
            if (event.type == NodeEventType::EnterMap) {
                m_rootMap = true;
                return;
            }
            m_out += UrlEncodingSerializer::VALUE_PARAMETER + "=";
            startValue();
        }

        if (m_rootMap && event.depth == 0) {
            if (event.type == NodeEventType::MapEntry) {
                flushValue();
                if (!m_firstPair) m_out += "&";
                m_firstPair = false;
                std::string key = event.value.isNull()
                    ? "null" : UonWriter::stringToken(event.value.getString());
                m_out += UrlEncodingSerializer::percentEncode(key) + "=";
                startValue();
                return;
            }
            if (event.type == NodeEventType::ExitMap) {
                flushValue();
                return;
            }
        }
        m_value->onEvent(event);
    }

    void finish() override {
        flushValue();
    }

private:
    void startValue() {
        m_buffer.clear();
        m_value = std::make_unique<UonWriter>(m_session, m_buffer);
    }

    void flushValue() {
        if (m_value) {
            m_value->finish();
            m_out += UrlEncodingSerializer::percentEncode(m_buffer);
            m_value.reset();
        }
    }

    std::string& m_out;
    std::string m_buffer;
    std::unique_ptr<UonWriter> m_value;
    bool m_started = false;
    bool m_rootMap = false;
    bool m_firstPair = true;
};

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string UrlEncodingSerializer::percentEncode(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
            c == '(' || c == ')' || c == '@' || c == ',' || c == '\'' ||
            c == '!' || c == '*' || c == ':') {
            result += static_cast<char>(c);
        } else {
            static const char HEX[] = "0123456789ABCDEF";
            result += '%';
            result += HEX[c >> 4];
            result += HEX[c & 0x0F];
        }
    }
    return result;
}

std::string UrlEncodingSerializer::percentDecode(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '+') {
            result += ' ';
        } else if (text[i] == '%') {
            int high = i + 2 < text.size() ? hexValue(text[i + 1]) : -1;
            int low = i + 2 < text.size() ? hexValue(text[i + 2]) : -1;
            if (high < 0 || low < 0) {
                throw ParseError("Invalid percent-encoding at position " + std::to_string(i));
            }
            result += static_cast<char>(high * 16 + low);
            i += 2;
        } else {
            result += text[i];
        }
    }
    return result;
}

std::unique_ptr<EventWriter> UrlEncodingSerializer::createWriter(const Session& session, std::string& out) const {
    return std::make_unique<UrlEncodingWriter>(session, out);
}

Pojo UrlEncodingParser::read(const std::string& input) const {
    PojoMap entries;
    size_t start = 0;
    while (start < input.size()) {
        size_t end = input.find('&', start);
        if (end == std::string::npos) end = input.size();
        std::string pair = input.substr(start, end - start);
        start = end + 1;
        if (pair.empty()) continue;

        size_t eq = pair.find('=');
        std::string keyText = UrlEncodingSerializer::percentDecode(pair.substr(0, eq));
        Pojo key = UonReader(keyText).readAll();
        if (!key.isNull() && !key.isString()) {
            key = Pojo(UonWriter::scalarToken(key));
        }
        Pojo value;
        if (eq != std::string::npos) {
            std::string valueText = UrlEncodingSerializer::percentDecode(pair.substr(eq + 1));
            value = UonReader(valueText).readAll();
        }
        entries.put(key, value);
    }

    if (entries.size() == 1) {
        const Pojo* value = entries.find(Pojo(UrlEncodingSerializer::VALUE_PARAMETER));
        if (value) {
            return *value;
        }
    }
    return Pojo::map(std::move(entries));
}

} // namespace marshal::formats
