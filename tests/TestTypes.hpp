#pragma once

#include "core/BeanBuilder.hpp"
#include "core/MarshalContext.hpp"
#include "core/Session.hpp"
#include "core/SwapBuilder.hpp"
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// =============================================================================
// Fixture types shared by the test files
// =============================================================================

namespace fixtures {

struct Address {
    std::string street;
    std::string city;
};

struct Person {
    std::string name;
    int64_t age = 0;
    std::shared_ptr<Address> address;
    std::vector<std::string> tags;
};

/**
 * Self-referencing bean
 */
struct Node {
    std::string name;
    std::shared_ptr<Node> next;
};

/**
 * Stringifiable: toString + parse + string constructor
 */
struct Color {
    std::string hex;
    std::string createdBy;
};

/**
 * Stringifiable one-way: toString only
 */
struct Version {
    int major = 0;
    int minor = 0;
};

/**
 * Not registered anywhere: opaque
 */
struct Handle {
    int fd = 0;
};

/**
 * Bean with a getter-only property
 */
struct Summary {
    std::string text;
};

/**
 * Bean without a no-arg constructor
 */
struct Token {
    std::string value;
};

/**
 * Interface with no implementation
 */
struct Shape {
    virtual ~Shape() = default;
};

/**
 * Swapped per media type
 */
struct Gadget {
    std::string id;
};

struct Widget {
    std::shared_ptr<Gadget> f;
};

/**
 * Swapped two-way to a string
 */
struct Point {
    int64_t x = 0;
    int64_t y = 0;
};

/**
 * Swapped one-way
 */
struct Secret {
    std::string value;
};

struct Holder {
    std::map<std::string, std::string> values;
    Point origin;
};

inline void registerTypes(marshal::MarshalContext& context) {
    using namespace marshal;
    auto& types = context.types();
    auto& swaps = context.swaps();

    BeanBuilder<Address>("Address")
        .property("street", &Address::street)
        .property("city", &Address::city)
        .buildAndRegister(types);

    BeanBuilder<Person>("Person")
        .property("name", &Person::name)
        .property("age", &Person::age)
        .property("address", &Person::address)
        .property("tags", &Person::tags)
        .dictionaryName("person")
        .buildAndRegister(types);

    BeanBuilder<Node>("Node")
        .property("name", &Node::name)
        .property("next", &Node::next)
        .buildAndRegister(types);

    ClassMetaBuilder<Color>("Color")
        .toStringMethod([](const Color& c) { return c.hex; })
        .stringConstructor([](const std::string& s) { return Color{s, "constructor"}; })
        .staticMethod("parse", [](const std::string& s) {
            if (s.empty() || s[0] != '#') {
                throw std::invalid_argument("color must start with '#'");
            }
            return Color{s, "parse"};
        })
        .buildAndRegister(types);

    ClassMetaBuilder<Version>("Version")
        .toStringMethod([](const Version& v) {
            return std::to_string(v.major) + "." + std::to_string(v.minor);
        })
        .buildAndRegister(types);

    BeanBuilder<Summary>("Summary")
        .readOnly<std::string>("text", [](const Summary& s) { return s.text; })
        .buildAndRegister(types);

    BeanBuilder<Token>("Token")
        .property("value", &Token::value)
        .noDefaultConstructor()
        .buildAndRegister(types);

    BeanBuilder<Shape>("Shape")
        .interfaceOnly()
        .property<std::string>("kind")
        .property<double>("area")
        .buildAndRegister(types);

    BeanBuilder<Gadget>("Gadget")
        .property("id", &Gadget::id)
        .buildAndRegister(types);

    BeanBuilder<Widget>("Widget")
        .property("f", &Widget::f)
        .buildAndRegister(types);

    BeanBuilder<Holder>("Holder")
        .property("values", &Holder::values)
        .property("origin", &Holder::origin)
        .buildAndRegister(types);

    ClassMetaBuilder<Point>("Point").buildAndRegister(types);
    ClassMetaBuilder<Secret>("Secret").buildAndRegister(types);

    SwapBuilder<Gadget>("GadgetJsonSwap")
        .to<std::string>()
        .swap([](const Gadget&, const Session&) { return Pojo("x-json"); })
        .forMediaTypes({"application/json"})
        .buildAndRegister(swaps);

    SwapBuilder<Gadget>("GadgetXmlSwap")
        .to<std::string>()
        .swap([](const Gadget&, const Session&) { return Pojo("x-xml"); })
        .forMediaTypes({"text/xml"})
        .buildAndRegister(swaps);

    SwapBuilder<Point>("PointSwap")
        .to<std::string>()
        .swap([](const Point& p, const Session&) {
            return Pojo(std::to_string(p.x) + "," + std::to_string(p.y));
        })
        .unswap([](const Pojo& text, const Session&) {
            const std::string& s = text.getString();
            auto comma = s.find(',');
            auto p = std::make_shared<Point>();
            p->x = std::stoll(s.substr(0, comma));
            p->y = std::stoll(s.substr(comma + 1));
            return p;
        })
        .buildAndRegister(swaps);

    SwapBuilder<Secret>("SecretSwap")
        .to<std::string>()
        .swap([](const Secret&, const Session&) { return Pojo("***"); })
        .buildAndRegister(swaps);
}

inline std::shared_ptr<Person> makePerson() {
    auto person = std::make_shared<Person>();
    person->name = "John";
    person->age = 42;
    person->address = std::make_shared<Address>(Address{"1 Main St", "Springfield"});
    person->tags = {"a", "b"};
    return person;
}

/**
 * Context with the fixture types registered, frozen
 */
class TestContext {
public:
    TestContext() {
        registerTypes(m_context);
        m_context.freeze();
    }

    marshal::MarshalContext& get() { return m_context; }
    operator const marshal::MarshalContext&() const { return m_context; }

    marshal::ClassMetaPtr meta(std::type_index type) const { return m_context.types().lookup(type); }

    template <typename T>
    marshal::ClassMetaPtr meta() const { return meta(std::type_index(typeid(T))); }

private:
    marshal::MarshalContext m_context;
};

} // namespace fixtures
