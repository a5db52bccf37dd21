#pragma once

#include "core/Pojo.hpp"
#include <cstddef>
#include <functional>
#include <string>

namespace marshal {

/**
 * Kind of a traversal event
 */
enum class NodeEventType {
    EnterMap,           // Start of a map or bean
    MapEntry,           // Key of the next entry, its value events follow
    ExitMap,
    EnterSequence,      // Start of a list
    SequenceElement,    // Next element, its value events follow
    ExitSequence,
    Scalar,             // Leaf value (bool, integer, double or string)
    Null,
    RecursionDetected   // Reference to an object already open on the path
};

std::string nodeEventTypeToString(NodeEventType type);

/**
 * Event emitted by the TreeWalker to a format writer
 */
struct NodeEvent {
    NodeEventType type;
    Pojo value;              // Scalar value, MapEntry key, or the recursing reference
    std::string typeName;    // Bean type name (EnterMap) or recursing type (RecursionDetected)
    size_t depth = 0;        // Nesting depth of the container the event belongs to

    static NodeEvent enterMap(const std::string& typeName, size_t depth) {
        return NodeEvent{NodeEventType::EnterMap, Pojo(), typeName, depth};
    }
    static NodeEvent mapEntry(const Pojo& key, size_t depth) {
        return NodeEvent{NodeEventType::MapEntry, key, "", depth};
    }
    static NodeEvent exitMap(size_t depth) {
        return NodeEvent{NodeEventType::ExitMap, Pojo(), "", depth};
    }
    static NodeEvent enterSequence(size_t depth) {
        return NodeEvent{NodeEventType::EnterSequence, Pojo(), "", depth};
    }
    static NodeEvent sequenceElement(size_t depth) {
        return NodeEvent{NodeEventType::SequenceElement, Pojo(), "", depth};
    }
    static NodeEvent exitSequence(size_t depth) {
        return NodeEvent{NodeEventType::ExitSequence, Pojo(), "", depth};
    }
    static NodeEvent scalar(const Pojo& value, size_t depth) {
        return NodeEvent{NodeEventType::Scalar, value, "", depth};
    }
    static NodeEvent null(size_t depth) {
        return NodeEvent{NodeEventType::Null, Pojo(), "", depth};
    }
    static NodeEvent recursion(const Pojo& reference, const std::string& typeName, size_t depth) {
        return NodeEvent{NodeEventType::RecursionDetected, reference, typeName, depth};
    }
};

/**
 * Callback receiving the events of a walk, in order
 */
using EmitFunction = std::function<void(const NodeEvent&)>;

} // namespace marshal
