#pragma once

#include "core/PojoTraits.hpp"
#include "core/SwapDefinition.hpp"
#include "core/SwapRegistry.hpp"
#include <functional>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <string>

namespace marshal {

/**
 * Fluent API for building swap definitions
 *
 * Example usage:
 *   SwapBuilder<Color>("ColorSwap")
 *       .to<std::string>()
 *       .swap([](const Color& c, const Session&) { return Pojo(c.hex()); })
 *       .unswap([](const Pojo& p, const Session&) {
 *           return std::make_shared<Color>(Color::fromHex(p.getString()));
 *       })
 *       .forMediaTypes({"application/json"})
 *       .buildAndRegister(swaps);
 */
template <typename T>
class SwapBuilder {
public:
    explicit SwapBuilder(const std::string& name)
        : m_name(name) {}

    // === Target type ===

    SwapBuilder& to(ClassMetaPtr targetType) {
        m_targetType = std::move(targetType);
        return *this;
    }

    template <typename S>
    SwapBuilder& to() {
        m_targetType = PojoTraits<S>::meta();
        return *this;
    }

    // === Transformations ===

    /**
     * Untyped forward function
     */
    SwapBuilder& forward(SwapFunction fn) {
        m_forward = std::move(fn);
        return *this;
    }

    /**
     * Untyped inverse function
     */
    SwapBuilder& inverse(UnswapFunction fn) {
        m_inverse = std::move(fn);
        return *this;
    }

    /**
     * Forward function on the typed source instance
     */
    SwapBuilder& swap(std::function<Pojo(const T&, const Session&)> fn) {
        std::string name = m_name;
        m_forward = [name, fn = std::move(fn)](const Pojo& value, const Session& session) {
            auto instance = value.as<T>();
            if (!instance) {
                throw std::invalid_argument("Swap '" + name + "' applied to " + value.kindName());
            }
            return fn(*instance, session);
        };
        return *this;
    }

    /**
     * Inverse function producing a typed instance
     */
    SwapBuilder& unswap(std::function<std::shared_ptr<T>(const Pojo&, const Session&)> fn) {
        m_inverse = [fn = std::move(fn)](const Pojo& intermediate, const ClassMetaPtr&,
                                         const Session& session) {
            return Pojo::object(fn(intermediate, session));
        };
        return *this;
    }

    // === Conditions ===

    /**
     * Apply only under media types matched by one of the ranges
     */
    SwapBuilder& forMediaTypes(std::initializer_list<std::string> ranges) {
        for (const auto& range : ranges) {
            m_mediaRanges.push_back(MediaType::parse(range));
        }
        return *this;
    }

    // === Build ===

    SwapDefinitionPtr build() {
        return std::make_shared<const SwapDefinition>(
            m_name, std::type_index(typeid(T)), m_targetType, m_forward, m_inverse, m_mediaRanges);
    }

    SwapDefinitionPtr buildAndRegister(SwapRegistry& registry) {
        auto def = build();
        registry.registerSwap(def);
        return def;
    }

private:
    std::string m_name;
    ClassMetaPtr m_targetType;
    SwapFunction m_forward;
    UnswapFunction m_inverse;
    std::vector<MediaRange> m_mediaRanges;
};

} // namespace marshal
