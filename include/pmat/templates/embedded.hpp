#pragma once

#include <vector>

namespace pmat::templates {

// A template compiled into the binary: JSON metadata plus the body
struct EmbeddedTemplate {
    const char* metadata;
    const char* content;
};

const std::vector<EmbeddedTemplate>& embedded_templates();

} // namespace pmat::templates
