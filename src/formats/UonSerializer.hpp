#pragma once

#include "formats/Parser.hpp"
#include "formats/Serializer.hpp"
#include <string>
#include <vector>

namespace marshal::formats {

/**
 * Streams UON notation from NodeEvents
 *
 *   map:    (key=value,key=value)
 *   list:   @(a,b,c)
 *   null:   null
 *   string: abc, or 'quoted' when it would read as something else
 *
 * Inside quotes ' and ~ are escaped with ~.
 */
class UonWriter : public EventWriter {
public:
    UonWriter(const Session& session, std::string& out);

    void onEvent(const NodeEvent& event) override;

    /**
     * Token for a scalar: numbers and booleans as is, strings quoted when
     * needed
     */
    static std::string scalarToken(const Pojo& value);

    /**
     * Quote and escape a string unless it can be written bare
     */
    static std::string stringToken(const std::string& value);

private:
    struct Frame {
        bool first = true;
    };

    void separator();
    void newline(size_t level);

    std::string& m_out;
    std::vector<Frame> m_frames;
    bool m_indent;
};

/**
 * Recursive-descent reader of UON notation into generic values
 */
class UonReader {
public:
    explicit UonReader(const std::string& input);

    /**
     * Read exactly one value spanning the whole input
     * Throws ParseError on malformed input
     */
    Pojo readAll();

private:
    Pojo readValue();
    Pojo readMap();
    Pojo readList();
    std::string readQuoted();
    Pojo readBare();
    void skipWhitespace();
    void expect(char c);
    [[noreturn]] void fail(const std::string& message) const;

    const std::string& m_input;
    size_t m_pos = 0;
};

/**
 * text/uon
 */
class UonSerializer : public Serializer {
public:
    UonSerializer() : Serializer("text/uon") {}

protected:
    std::unique_ptr<EventWriter> createWriter(const Session& session, std::string& out) const override;
};

class UonParser : public Parser {
public:
    UonParser() : Parser("text/uon") {}

    Pojo read(const std::string& input) const override;
};

} // namespace marshal::formats
