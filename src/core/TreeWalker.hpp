#pragma once

#include "core/ClassMeta.hpp"
#include "core/NodeEvent.hpp"
#include "core/Pojo.hpp"
#include "core/Session.hpp"
#include "core/SwapExecutor.hpp"
#include "core/TraversalContext.hpp"

namespace marshal {

/**
 * Format-agnostic traversal of value graphs
 *
 * walk() turns a value into NodeEvents for a format writer; reconstruct()
 * turns the generic value a format reader produced (scalars, PojoList,
 * PojoMap) back into values of a declared type.
 *
 * Usage:
 *   Session session(context, MediaType::parse("application/json"));
 *   TreeWalker walker(session);
 *   walker.walk(person, nullptr, [&](const NodeEvent& e) { writer.onEvent(e); });
 *   Pojo copy = walker.reconstruct(generic, personMeta);
 */
class TreeWalker {
public:
    explicit TreeWalker(const Session& session);

    /**
     * Emit the events of root. declaredType nullptr means Any.
     * Exceptions raised by emit abort the walk.
     */
    void walk(const Pojo& root, const ClassMetaPtr& declaredType, const EmitFunction& emit) const;

    /**
     * Build a value of targetType from a generic node. targetType nullptr
     * means Any: the node is returned as is, except for maps carrying a
     * known "_type" hint.
     */
    Pojo reconstruct(const Pojo& node, const ClassMetaPtr& targetType) const;

    /**
     * Name of the type-hint entry in maps
     */
    static const std::string TYPE_PROPERTY;

private:
    // === Serialization ===

    void walkNode(const Pojo& value, const ClassMetaPtr& declaredType, TraversalContext& context,
                  const EmitFunction& emit, int swapDepth) const;
    void walkList(const Pojo& value, const ClassMetaPtr& meta, TraversalContext& context,
                  const EmitFunction& emit) const;
    void walkMap(const Pojo& value, const ClassMetaPtr& meta, TraversalContext& context,
                 const EmitFunction& emit) const;
    void walkBean(const Pojo& value, const ClassMetaPtr& meta, TraversalContext& context,
                  const EmitFunction& emit) const;
    std::string readStream(const Pojo& value) const;

    // === Parsing ===

    Pojo reconstructNode(const Pojo& node, const ClassMetaPtr& targetType, size_t depth) const;
    Pojo reconstructGeneric(const Pojo& node, size_t depth) const;
    Pojo reconstructList(const Pojo& node, const ClassMetaPtr& meta, size_t depth) const;
    Pojo reconstructMap(const Pojo& node, const ClassMetaPtr& meta, size_t depth) const;
    Pojo reconstructBean(const Pojo& node, const ClassMetaPtr& meta, size_t depth) const;
    Pojo coerceScalar(const Pojo& node, const ClassMetaPtr& meta) const;
    ClassMetaPtr typeHint(const Pojo& node) const;

    const Session& m_session;
    SwapExecutor m_executor;
};

} // namespace marshal
