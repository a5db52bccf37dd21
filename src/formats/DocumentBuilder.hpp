#pragma once

#include "formats/Serializer.hpp"
#include <vector>

namespace marshal::formats {

/**
 * EventWriter that rebuilds the walked graph as a generic document
 * (scalars, PojoList, PojoMap) and hands it to render() at the end.
 *
 * Used by the markup formats, whose output for a container depends on
 * its content (empty maps, typed list items).
 */
class DocumentBuilder : public EventWriter {
public:
    DocumentBuilder(const Session& session, std::string& out);

    void onEvent(const NodeEvent& event) override;
    void finish() override;

    const Pojo& document() const { return m_root; }

protected:
    virtual void render(const Pojo& document, std::string& out) = 0;

    std::string& m_out;

private:
    void place(const Pojo& value);

    Pojo m_root;
    std::vector<Pojo> m_stack;
    Pojo m_pendingKey;
};

} // namespace marshal::formats
