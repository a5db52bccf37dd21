#include <catch2/catch.hpp>
#include "TestTypes.hpp"
#include "core/BuiltinTypes.hpp"
#include "formats/FormatRegistry.hpp"
#include "formats/JsonSerializer.hpp"
#include "formats/XmlSerializer.hpp"

using namespace marshal;
using namespace marshal::formats;

// =============================================================================
// Fixtures: beans swapped to character streams
// =============================================================================

namespace {

const std::vector<std::string> FORMATS = {"json", "xml", "html", "uon", "urlencoding", "msgpack", "rdf"};

/**
 * Always swapped to a stream holding "foo"
 */
struct Report {
    std::string title;
};

struct Folder {
    std::shared_ptr<Report> report;
};

/**
 * Swapped to a stream of its text under JSON and XML, walked as a bean otherwise
 */
struct Memo {
    std::string text;
};

class StreamContext {
public:
    StreamContext() {
        auto& types = m_context.types();
        auto& swaps = m_context.swaps();
        auto stream = ClassMeta::reference(std::type_index(typeid(CharStream)), "CharStream");

        BeanBuilder<Report>("Report")
            .property("title", &Report::title)
            .buildAndRegister(types);
        BeanBuilder<Folder>("Folder")
            .property("report", &Folder::report)
            .buildAndRegister(types);
        BeanBuilder<Memo>("Memo")
            .property("text", &Memo::text)
            .buildAndRegister(types);

        auto calls = m_reportSwaps;
        SwapBuilder<Report>("ReportStreamSwap")
            .to(stream)
            .swap([calls](const Report&, const Session&) {
                ++*calls;
                return Pojo::object(CharStream::fromString("foo"));
            })
            .buildAndRegister(swaps);

        SwapBuilder<Memo>("MemoStreamSwap")
            .to(stream)
            .forward([](const Pojo& value, const Session& session) {
                const auto& subType = session.getMediaType().getSubType();
                if (subType == "json" || subType == "xml") {
                    return Pojo::object(CharStream::fromString(value.as<Memo>()->text));
                }
                return value;
            })
            .buildAndRegister(swaps);

        m_context.freeze();
    }

    const MarshalContext& get() const { return m_context; }
    int reportSwaps() const { return *m_reportSwaps; }

private:
    MarshalContext m_context;
    std::shared_ptr<int> m_reportSwaps = std::make_shared<int>(0);
};

std::string serialize(const std::string& format, const MarshalContext& context, const Pojo& value) {
    auto serializer = FormatRegistry::instance().getSerializer(FormatRegistry::resolveFormatName(format));
    return serializer->serialize(context, value);
}

Pojo readBack(const std::string& format, const MarshalContext& context, const std::string& text) {
    auto parser = FormatRegistry::instance().getParser(FormatRegistry::resolveFormatName(format));
    return parser->parse(context, text);
}

Pojo mapOf(const std::string& key, const Pojo& value) {
    PojoMap entries;
    entries.put(Pojo(key), value);
    return Pojo::map(std::move(entries));
}

} // namespace

// =============================================================================
// Stream leaves
// =============================================================================

TEST_CASE("Stream leaves serialize as their content", "[StreamSwap]") {
    StreamContext ctx;
    for (const auto& format : FORMATS) {
        INFO("format: " << format);
        auto chars = Pojo::object(CharStream::fromString("foo"));
        REQUIRE(readBack(format, ctx.get(), serialize(format, ctx.get(), chars)) == Pojo("foo"));

        auto bytes = Pojo::object(ByteStream::fromString("bar"));
        REQUIRE(readBack(format, ctx.get(), serialize(format, ctx.get(), bytes)) == Pojo("bar"));
    }
}

TEST_CASE("Character streams are consumed by serialization", "[StreamSwap]") {
    StreamContext ctx;
    auto chars = Pojo::object(CharStream::fromString("foo"));
    REQUIRE(JsonSerializer().serialize(ctx.get(), chars) == R"("foo")");
    REQUIRE(JsonSerializer().serialize(ctx.get(), chars) == R"("")");
}

// =============================================================================
// Swaps producing streams
// =============================================================================

TEST_CASE("Swap to a stream serializes as a scalar in every format", "[StreamSwap]") {
    StreamContext ctx;
    auto folder = std::make_shared<Folder>();
    folder->report = std::make_shared<Report>(Report{"quarterly"});

    for (const auto& format : FORMATS) {
        INFO("format: " << format);
        auto root = serialize(format, ctx.get(), Pojo::object(folder->report));
        REQUIRE(readBack(format, ctx.get(), root) == Pojo("foo"));

        auto nested = serialize(format, ctx.get(), Pojo::object(folder));
        REQUIRE(readBack(format, ctx.get(), nested) == mapOf("report", Pojo("foo")));
    }
}

TEST_CASE("Swap to a stream runs once per serialization", "[StreamSwap]") {
    StreamContext ctx;
    auto folder = std::make_shared<Folder>();
    folder->report = std::make_shared<Report>(Report{"quarterly"});

    REQUIRE(JsonSerializer().serialize(ctx.get(), Pojo::object(folder)) == R"({"report":"foo"})");
    REQUIRE(ctx.reportSwaps() == 1);
    REQUIRE(XmlSerializer().serialize(ctx.get(), Pojo::object(folder)) == "<object><report>foo</report></object>");
    REQUIRE(ctx.reportSwaps() == 2);
}

TEST_CASE("Media-type dependent swap streams or passes through", "[StreamSwap]") {
    StreamContext ctx;
    auto memo = Pojo::object(std::make_shared<Memo>(Memo{"hello"}));

    REQUIRE(JsonSerializer().serialize(ctx.get(), memo) == R"("hello")");
    REQUIRE(XmlSerializer().serialize(ctx.get(), memo) == "<string>hello</string>");

    for (const auto& format : FORMATS) {
        INFO("format: " << format);
        auto value = readBack(format, ctx.get(), serialize(format, ctx.get(), memo));
        if (format == "json" || format == "xml") {
            REQUIRE(value == Pojo("hello"));
        } else {
            REQUIRE(value == mapOf("text", Pojo("hello")));
        }
    }
}

// =============================================================================
// Conditional swaps per format
// =============================================================================

TEST_CASE("Conditional swaps apply per format", "[StreamSwap]") {
    fixtures::TestContext ctx;
    auto widget = std::make_shared<fixtures::Widget>();
    widget->f = std::make_shared<fixtures::Gadget>(fixtures::Gadget{"g1"});
    auto structural = mapOf("f", mapOf("id", Pojo("g1")));

    for (const auto& format : FORMATS) {
        INFO("format: " << format);
        auto value = readBack(format, ctx.get(), serialize(format, ctx.get(), Pojo::object(widget)));
        if (format == "json") {
            REQUIRE(value == mapOf("f", Pojo("x-json")));
        } else if (format == "xml" || format == "rdf") {
            REQUIRE(value == mapOf("f", Pojo("x-xml")));
        } else {
            REQUIRE(value == structural);
        }
    }
}
