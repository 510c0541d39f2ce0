#pragma once

/**
 * @file scroll_state_machine.h
 * @brief Chooses the visible model from the page scroll offset
 *
 * Section i is active while the scroll offset lies in
 *   [offsetTop - viewportHeight/2, offsetTop + height - viewportHeight/2)
 * i.e. a section takes over once its top edge passes the middle of the
 * viewport.
 *
 * The first section is the home zone: any offset above the second section's
 * lower bound shows the primary model, whatever the first section is bound
 * to. Past the home zone, sections are scanned in order and the first match
 * wins. Overlapping ranges are not detected.
 *
 * Nothing is cached between events; each call is a linear scan that does
 * not allocate.
 */

#include <diorama/section_layout.h>
#include <diorama/scene_registry.h>
#include <string>
#include <vector>

namespace diorama {

class ScrollStateMachine {
public:
    ScrollStateMachine(const SectionLayout& layout, SceneRegistry& registry, std::string primaryKey);

    /**
     * @brief Resolve which model key a scroll offset selects
     * @return Key to show, or nullptr when the offset is past every section
     *
     * The returned pointer refers into sections or primaryKey.
     */
    static const std::string* resolve(const std::vector<ScrollSection>& sections,
                                      float scrollOffset, float viewportHeight,
                                      const std::string& primaryKey);

    /// True if offset lies in the section's active range
    static bool inRange(const ScrollSection& section, float scrollOffset, float viewportHeight);

    /// Scroll event: resolve against the current layout and switch.
    /// @return True if the visible model changed
    bool onScroll(float scrollOffset, float viewportHeight);

    /// Resize event: viewport height moves every range boundary
    bool onResize(float viewportHeight);

    /// Current state: the visible model key, or none
    const std::optional<std::string>& state() const { return m_registry.currentKey(); }

    const std::string& primaryKey() const { return m_primaryKey; }
    float lastScrollOffset() const { return m_scrollOffset; }
    float lastViewportHeight() const { return m_viewportHeight; }

private:
    const SectionLayout& m_layout;
    SceneRegistry& m_registry;
    std::string m_primaryKey;

    float m_scrollOffset = 0.0f;
    float m_viewportHeight = 0.0f;
};

} // namespace diorama
