#include "core/TreeWalker.hpp"
#include "core/BuiltinTypes.hpp"
#include "core/Errors.hpp"
#include "core/StringConvertibility.hpp"
#include "core/SwapRegistry.hpp"
#include "core/TypeCategorizer.hpp"
#include "core/TypeRegistry.hpp"
#include "core/VirtualBean.hpp"
#include "util/Logger.hpp"
#include <cmath>

namespace marshal {

const std::string TreeWalker::TYPE_PROPERTY = "_type";

TreeWalker::TreeWalker(const Session& session)
    : m_session(session)
    , m_executor(session)
{}

// =============================================================================
// Serialization
// =============================================================================

void TreeWalker::walk(const Pojo& root, const ClassMetaPtr& declaredType, const EmitFunction& emit) const {
    const auto& options = m_session.getOptions();
    TraversalContext context(m_session.getMediaType(), options.detectRecursions,
                             static_cast<size_t>(options.maxDepth));
    walkNode(root, declaredType, context, emit, 0);
}

void TreeWalker::walkNode(const Pojo& value, const ClassMetaPtr& declaredType,
                          TraversalContext& context, const EmitFunction& emit, int swapDepth) const {
    if (value.isNull()) {
        emit(NodeEvent::null(context.depth()));
        return;
    }
    if (value.isScalar()) {
        emit(NodeEvent::scalar(value, context.depth()));
        return;
    }

    const auto& categorizer = m_session.categorizer();
    const auto& mediaType = m_session.getMediaType();
    ClassMetaPtr meta = categorizer.effectiveType(value, declaredType);
    Category category = meta ? categorizer.categorizeType(meta, mediaType) : Category::OPAQUE;

    if (isSwappedCategory(category)) {
        if (swapDepth >= m_session.getOptions().maxSwapDepth) {
            throw SwapLoopError("Swap chain starting at '" + meta->getName() + "' exceeded " +
                                std::to_string(m_session.getOptions().maxSwapDepth) + " swaps");
        }
        Pojo swapped = m_executor.forward(value);
        if (!swapped.isObject() || swapped.identity() != value.identity()) {
            auto def = m_executor.resolve(meta);
            walkNode(swapped, def ? def->getTargetType() : nullptr, context, emit, swapDepth + 1);
            return;
        }
        // Pass-through: the swap returned its own input
        category = categorizer.categorizeStructure(meta, mediaType);
    }

    switch (category) {
        case Category::COLLECTION_STANDARD:
        case Category::COLLECTION_NONSTANDARD:
            if (meta->isList()) {
                walkList(value, meta, context, emit);
            } else {
                walkMap(value, meta, context, emit);
            }
            return;

        case Category::BEAN_STANDARD:
        case Category::BEAN_NONSTANDARD:
        case Category::BEAN_VIRTUAL:
        case Category::BEAN_READONLY:
            walkBean(value, meta, context, emit);
            return;

        case Category::STREAM_LIKE:
            emit(NodeEvent::scalar(readStream(value), context.depth()));
            return;

        case Category::STRINGIFIABLE_TWOWAY:
        case Category::STRINGIFIABLE_ONEWAY:
            emit(NodeEvent::scalar(m_session.strings().toString(value), context.depth()));
            return;

        default:
            emit(NodeEvent::scalar(m_session.strings().defaultString(value), context.depth()));
            return;
    }
}

void TreeWalker::walkList(const Pojo& value, const ClassMetaPtr& meta, TraversalContext& context,
                          const EmitFunction& emit) const {
    size_t depth = context.depth();
    TraversalContext::Frame frame(context, value.identity());
    if (frame.isRecursion()) {
        emit(NodeEvent::recursion(value, meta->getName(), depth));
        return;
    }

    emit(NodeEvent::enterSequence(depth));
    for (const auto& item : value.asList()) {
        emit(NodeEvent::sequenceElement(depth));
        walkNode(item, meta->getElementType(), context, emit, 0);
    }
    emit(NodeEvent::exitSequence(depth));
}

void TreeWalker::walkMap(const Pojo& value, const ClassMetaPtr& meta, TraversalContext& context,
                         const EmitFunction& emit) const {
    size_t depth = context.depth();
    TraversalContext::Frame frame(context, value.identity());
    if (frame.isRecursion()) {
        emit(NodeEvent::recursion(value, meta->getName(), depth));
        return;
    }

    emit(NodeEvent::enterMap("", depth));
    for (const auto& [key, item] : value.asMap()) {
        if (key.isNull() || key.isString()) {
            emit(NodeEvent::mapEntry(key, depth));
        } else {
            emit(NodeEvent::mapEntry(Pojo(m_session.strings().toString(key)), depth));
        }
        walkNode(item, meta->getValueType(), context, emit, 0);
    }
    emit(NodeEvent::exitMap(depth));
}

void TreeWalker::walkBean(const Pojo& value, const ClassMetaPtr& meta, TraversalContext& context,
                          const EmitFunction& emit) const {
    size_t depth = context.depth();
    TraversalContext::Frame frame(context, value.identity());
    if (frame.isRecursion()) {
        emit(NodeEvent::recursion(value, meta->getName(), depth));
        return;
    }

    const auto& options = m_session.getOptions();
    emit(NodeEvent::enterMap(meta->getName(), depth));

    if (options.addTypeProperties && !meta->getDictionaryName().empty()) {
        emit(NodeEvent::mapEntry(Pojo(TYPE_PROPERTY), depth));
        emit(NodeEvent::scalar(Pojo(meta->getDictionaryName()), context.depth()));
    }

    for (const auto& prop : meta->getProperties()) {
        if (!prop.isReadable()) {
            continue;
        }
        Pojo propertyValue = prop.getter(value);
        if (propertyValue.isNull() && options.trimNullProperties) {
            continue;
        }
        emit(NodeEvent::mapEntry(Pojo(prop.name), depth));
        walkNode(propertyValue, prop.type, context, emit, 0);
    }
    emit(NodeEvent::exitMap(depth));
}

std::string TreeWalker::readStream(const Pojo& value) const {
    if (auto chars = value.as<CharStream>()) {
        return chars->readAll();
    }
    if (auto bytes = value.as<ByteStream>()) {
        return bytes->readAll();
    }
    throw SerializeError("Unsupported stream value: " + value.kindName());
}

// =============================================================================
// Parsing
// =============================================================================

Pojo TreeWalker::reconstruct(const Pojo& node, const ClassMetaPtr& targetType) const {
    return reconstructNode(node, targetType, 0);
}

Pojo TreeWalker::reconstructNode(const Pojo& node, const ClassMetaPtr& targetType, size_t depth) const {
    int maxDepth = m_session.getOptions().maxDepth;
    if (maxDepth > 0 && depth > static_cast<size_t>(maxDepth)) {
        throw ParseError("Maximum depth of " + std::to_string(maxDepth) + " exceeded");
    }

    ClassMetaPtr meta = m_session.types().resolve(targetType);
    if (!meta) {
        throw TypeResolutionError("Unregistered type '" + targetType->getName() + "'");
    }
    if (node.isNull()) {
        return Pojo();
    }

    if (meta->isAny()) {
        auto hinted = typeHint(node);
        if (!hinted) {
            return reconstructGeneric(node, depth);
        }
        meta = hinted;
    } else if (meta->isBean() && meta->isInterface()) {
        auto hinted = typeHint(node);
        if (hinted && hinted->isBean()) {
            meta = hinted;
        }
    }

    auto def = m_executor.resolve(meta);
    if (def) {
        // A swap onto its own type is a pass-through: parse the structure
        auto target = m_session.types().resolve(def->getTargetType());
        if (target && target->getType() == meta->getType()) {
            def = nullptr;
        }
    }
    if (def) {
        if (def->isOneWay()) {
            throw UnswapError("Type '" + meta->getName() + "' is serialized through one-way swap '" +
                              def->getName() + "' and can't be parsed");
        }
        Pojo intermediate = reconstructNode(node, def->getTargetType(), depth);
        return m_executor.backward(intermediate, meta);
    }

    Category category = m_session.categorizer().categorizeStructure(meta, m_session.getMediaType());
    switch (category) {
        case Category::PRIMITIVE:
            return coerceScalar(node, meta);

        case Category::COLLECTION_STANDARD:
            return meta->isList() ? reconstructList(node, meta, depth)
                                  : reconstructMap(node, meta, depth);

        case Category::BEAN_STANDARD:
        case Category::BEAN_VIRTUAL:
            return reconstructBean(node, meta, depth);

        case Category::STRINGIFIABLE_TWOWAY: {
            if (!node.isScalar()) {
                throw ParseError("Expected a string for '" + meta->getName() + "' but found " +
                                 node.kindName());
            }
            const auto& strings = m_session.strings();
            return strings.fromString(meta, node.isString() ? node.getString() : strings.toString(node));
        }

        case Category::STRINGIFIABLE_ONEWAY:
        case Category::OPAQUE:
            throw NotConvertibleError("Cannot parse into type '" + meta->getName() + "' (" +
                                      categoryToString(category) + ")");

        default:
            throw TypeResolutionError("Type '" + meta->getName() + "' is not parsable (" +
                                      categoryToString(category) + ")");
    }
}

Pojo TreeWalker::reconstructGeneric(const Pojo& node, size_t depth) const {
    if (node.isList()) {
        PojoList items;
        items.reserve(node.asList().size());
        for (const auto& item : node.asList()) {
            items.push_back(reconstructNode(item, nullptr, depth + 1));
        }
        return Pojo::list(std::move(items));
    }
    if (node.isMap()) {
        PojoMap entries;
        for (const auto& [key, value] : node.asMap()) {
            entries.put(key, reconstructNode(value, nullptr, depth + 1));
        }
        return Pojo::map(std::move(entries));
    }
    return node;
}

Pojo TreeWalker::reconstructList(const Pojo& node, const ClassMetaPtr& meta, size_t depth) const {
    if (!node.isList()) {
        throw ParseError("Expected a list for '" + meta->getName() + "' but found " + node.kindName());
    }
    PojoList items;
    items.reserve(node.asList().size());
    for (const auto& item : node.asList()) {
        items.push_back(reconstructNode(item, meta->getElementType(), depth + 1));
    }
    return Pojo::list(std::move(items));
}

Pojo TreeWalker::reconstructMap(const Pojo& node, const ClassMetaPtr& meta, size_t depth) const {
    if (!node.isMap()) {
        throw ParseError("Expected a map for '" + meta->getName() + "' but found " + node.kindName());
    }
    auto keyType = m_session.types().resolve(meta->getKeyType());
    bool plainKeys = !keyType || keyType->isAny() || keyType->getKind() == TypeKind::String;

    PojoMap entries;
    for (const auto& [key, value] : node.asMap()) {
        Pojo convertedKey = (key.isNull() || (plainKeys && key.isString()))
            ? key
            : reconstructNode(key, meta->getKeyType(), depth + 1);
        entries.put(convertedKey, reconstructNode(value, meta->getValueType(), depth + 1));
    }
    return Pojo::map(std::move(entries));
}

Pojo TreeWalker::reconstructBean(const Pojo& node, const ClassMetaPtr& meta, size_t depth) const {
    if (!node.isMap()) {
        throw ParseError("Expected an object for '" + meta->getName() + "' but found " + node.kindName());
    }
    const auto& options = m_session.getOptions();
    Pojo instance = meta->isInterface() ? VirtualBean::create(meta) : meta->newInstance();

    for (const auto& [key, value] : node.asMap()) {
        if (!key.isString()) {
            throw ParseError("Bean '" + meta->getName() + "' can't have a null key");
        }
        const std::string& name = key.getString();
        if (name == TYPE_PROPERTY) {
            continue;
        }

        const BeanProperty* prop = meta->findProperty(name);
        if (!prop || !prop->isWritable()) {
            if (options.ignoreUnknownProperties) {
                LOG_DEBUG("Ignoring unknown property '" + name + "' on bean '" + meta->getName() + "'");
                continue;
            }
            throw ParseError("Unknown property '" + name + "' on bean '" + meta->getName() + "'");
        }

        Pojo converted;
        try {
            converted = reconstructNode(value, prop->type, depth + 1);
        } catch (const NotConvertibleError& e) {
            if (!options.lenient) throw;
            LOG_WARN("Skipping property '" + name + "' of '" + meta->getName() + "': " + e.what());
            continue;
        } catch (const ConversionError& e) {
            if (!options.lenient) throw;
            LOG_WARN("Skipping property '" + name + "' of '" + meta->getName() + "': " + e.what());
            continue;
        }
        prop->setter(instance, converted);
    }
    return instance;
}

Pojo TreeWalker::coerceScalar(const Pojo& node, const ClassMetaPtr& meta) const {
    if (!node.isScalar()) {
        throw ParseError("Expected a " + meta->getName() + " value but found " + node.kindName());
    }
    const auto& strings = m_session.strings();

    switch (meta->getKind()) {
        case TypeKind::Boolean:
            if (node.isBool()) return node;
            if (node.isString()) return strings.fromString(meta, node.getString());
            break;

        case TypeKind::Integer:
            if (node.isInt()) return node;
            if (node.isDouble()) {
                double d = node.getDouble();
                if (std::isfinite(d) && d == std::floor(d)) {
                    // [-2^63, 2^63) is exactly the range a cast to int64_t accepts
                    if (d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
                        throw ParseError("Number " + strings.toString(node) + " is out of range for '" +
                                         meta->getName() + "'");
                    }
                    return Pojo(static_cast<int64_t>(d));
                }
            }
            if (node.isString()) return strings.fromString(meta, node.getString());
            break;

        case TypeKind::Double:
            if (node.isNumber()) return Pojo(node.getDouble());
            if (node.isString()) return strings.fromString(meta, node.getString());
            break;

        case TypeKind::String:
            if (node.isString()) return node;
            return Pojo(strings.toString(node));

        default:
            return node;
    }
    throw ParseError("Expected a " + meta->getName() + " value but found " + node.kindName());
}

ClassMetaPtr TreeWalker::typeHint(const Pojo& node) const {
    if (!node.isMap()) {
        return nullptr;
    }
    const Pojo* hint = node.asMap().find(Pojo(TYPE_PROPERTY));
    if (!hint || !hint->isString()) {
        return nullptr;
    }
    return m_session.types().lookupByDictionaryName(hint->getString());
}

} // namespace marshal
