#include <diorama/section_layout.h>
#include <algorithm>

namespace diorama {

StackedSectionLayout::StackedSectionLayout(std::vector<SectionSpec> specs)
    : m_specs(std::move(specs)) {
    m_sections.resize(m_specs.size());
    for (size_t i = 0; i < m_specs.size(); ++i) {
        m_sections[i].sectionIndex = i;
        m_sections[i].modelKey = m_specs[i].modelKey;
    }
}

void StackedSectionLayout::relayout(float viewportHeight) {
    float top = 0.0f;
    for (size_t i = 0; i < m_specs.size(); ++i) {
        const SectionSpec& spec = m_specs[i];
        float height = spec.unit == SectionUnit::Viewport ? spec.height * viewportHeight : spec.height;

        m_sections[i].offsetTop = top;
        m_sections[i].height = std::max(height, 0.0f);
        top += m_sections[i].height;
    }
    m_pageHeight = top;
}

float StackedSectionLayout::maxScroll(float viewportHeight) const {
    return std::max(0.0f, m_pageHeight - viewportHeight);
}

} // namespace diorama
