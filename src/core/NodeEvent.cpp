#include "core/NodeEvent.hpp"

namespace marshal {

std::string nodeEventTypeToString(NodeEventType type) {
    switch (type) {
        case NodeEventType::EnterMap:          return "EnterMap";
        case NodeEventType::MapEntry:          return "MapEntry";
        case NodeEventType::ExitMap:           return "ExitMap";
        case NodeEventType::EnterSequence:     return "EnterSequence";
        case NodeEventType::SequenceElement:   return "SequenceElement";
        case NodeEventType::ExitSequence:      return "ExitSequence";
        case NodeEventType::Scalar:            return "Scalar";
        case NodeEventType::Null:              return "Null";
        case NodeEventType::RecursionDetected: return "RecursionDetected";
    }
    return "Unknown";
}

} // namespace marshal
