#include "formats/DocumentBuilder.hpp"

namespace marshal::formats {

DocumentBuilder::DocumentBuilder(const Session& session, std::string& out)
    : EventWriter(session)
    , m_out(out)
{}

void DocumentBuilder::onEvent(const NodeEvent& event) {
    switch (event.type) {
        case NodeEventType::EnterMap: {
            Pojo map = Pojo::map();
            place(map);
            m_stack.push_back(map);
            break;
        }
        case NodeEventType::EnterSequence: {
            Pojo list = Pojo::list();
            place(list);
            m_stack.push_back(list);
            break;
        }
        case NodeEventType::ExitMap:
        case NodeEventType::ExitSequence:
            m_stack.pop_back();
            break;
        case NodeEventType::MapEntry:
            m_pendingKey = event.value;
            break;
        case NodeEventType::SequenceElement:
            break;
        case NodeEventType::Scalar:
            place(event.value);
            break;
        case NodeEventType::Null:
            place(Pojo());
            break;
        case NodeEventType::RecursionDetected:
            checkRecursion(event);
            place(Pojo());
            break;
    }
}

void DocumentBuilder::finish() {
    render(m_root, m_out);
}

void DocumentBuilder::place(const Pojo& value) {
    if (m_stack.empty()) {
        m_root = value;
        return;
    }
    // Containers are shared handles, so mutating the stack copy fills the tree
    Pojo& top = m_stack.back();
    if (top.isMap()) {
        top.asMap().put(m_pendingKey, value);
    } else {
        top.asList().push_back(value);
    }
}

} // namespace marshal::formats
