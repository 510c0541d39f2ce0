#pragma once

/**
 * @file progress_display.h
 * @brief Sink for the loading indicator
 *
 * Only the primary model reports here. The host decides where the text
 * goes (console, window title, overlay).
 */

#include <string>

namespace diorama {

class ProgressDisplay {
public:
    virtual ~ProgressDisplay() = default;

    virtual void setText(const std::string& text) = 0;
    virtual void setVisible(bool visible) = 0;
};

/// Writes progress lines to stdout, suppressing repeats
class ConsoleProgressDisplay : public ProgressDisplay {
public:
    void setText(const std::string& text) override;
    void setVisible(bool visible) override { m_visible = visible; }

    bool visible() const { return m_visible; }
    const std::string& text() const { return m_text; }

private:
    std::string m_text;
    bool m_visible = true;
};

} // namespace diorama
