#pragma once

/**
 * @file section_layout.h
 * @brief Page sections and their vertical placement
 *
 * A page is a vertical stack of sections, each bound to a model key. The
 * scroll state machine reads the placement fresh on every event; whoever
 * owns the layout is responsible for recomputing it when the viewport
 * changes.
 */

#include <cstddef>
#include <string>
#include <vector>

namespace diorama {

/// Placed section, in page pixels
struct ScrollSection {
    size_t sectionIndex = 0;
    float offsetTop = 0.0f;
    float height = 0.0f;
    std::string modelKey;  ///< May name a model that never loads
};

class SectionLayout {
public:
    virtual ~SectionLayout() = default;

    /// Sections in page order
    virtual const std::vector<ScrollSection>& sections() const = 0;
};

enum class SectionUnit {
    Viewport,  ///< Height is a multiple of the viewport height
    Pixels     ///< Height is in page pixels
};

/// Section description from configuration
struct SectionSpec {
    std::string modelKey;
    float height = 1.0f;
    SectionUnit unit = SectionUnit::Viewport;
};

/// Stacks sections top to bottom with no gaps
class StackedSectionLayout : public SectionLayout {
public:
    explicit StackedSectionLayout(std::vector<SectionSpec> specs);

    /// Recompute offsets for a viewport height
    void relayout(float viewportHeight);

    const std::vector<ScrollSection>& sections() const override { return m_sections; }

    /// Total page height as of the last relayout()
    float pageHeight() const { return m_pageHeight; }

    /// Largest valid scroll offset for a viewport height
    float maxScroll(float viewportHeight) const;

    const std::vector<SectionSpec>& specs() const { return m_specs; }

private:
    std::vector<SectionSpec> m_specs;
    std::vector<ScrollSection> m_sections;
    float m_pageHeight = 0.0f;
};

} // namespace diorama
