#include <diorama/progress_display.h>
#include <iostream>

namespace diorama {

void ConsoleProgressDisplay::setText(const std::string& text) {
    if (text == m_text) return;
    m_text = text;
    if (m_visible) {
        std::cout << "[Progress] " << m_text << std::endl;
    }
}

} // namespace diorama
