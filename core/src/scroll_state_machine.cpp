#include <diorama/scroll_state_machine.h>

namespace diorama {

ScrollStateMachine::ScrollStateMachine(const SectionLayout& layout, SceneRegistry& registry,
                                       std::string primaryKey)
    : m_layout(layout), m_registry(registry), m_primaryKey(std::move(primaryKey)) {}

bool ScrollStateMachine::inRange(const ScrollSection& section, float scrollOffset, float viewportHeight) {
    float half = viewportHeight * 0.5f;
    return scrollOffset >= section.offsetTop - half &&
           scrollOffset < section.offsetTop + section.height - half;
}

const std::string* ScrollStateMachine::resolve(const std::vector<ScrollSection>& sections,
                                               float scrollOffset, float viewportHeight,
                                               const std::string& primaryKey) {
    // A page without a second section is all home zone
    if (sections.size() < 2) {
        return &primaryKey;
    }

    if (scrollOffset < sections[1].offsetTop - viewportHeight * 0.5f) {
        return &primaryKey;
    }

    for (size_t i = 1; i < sections.size(); ++i) {
        if (inRange(sections[i], scrollOffset, viewportHeight)) {
            return sections[i].modelKey.empty() ? nullptr : &sections[i].modelKey;
        }
    }
    return nullptr;
}

bool ScrollStateMachine::onScroll(float scrollOffset, float viewportHeight) {
    m_scrollOffset = scrollOffset;
    m_viewportHeight = viewportHeight;

    const std::string* key = resolve(m_layout.sections(), scrollOffset, viewportHeight, m_primaryKey);
    if (!key) return false;

    return m_registry.switchTo(*key) == SwitchResult::Switched;
}

bool ScrollStateMachine::onResize(float viewportHeight) {
    return onScroll(m_scrollOffset, viewportHeight);
}

} // namespace diorama
