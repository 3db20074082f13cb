#include "news.h"

#include <sstream>

void News::addEvent(int week, const std::string& title, const std::string& description) {
    m_events.push_back(NewsEvent{week, title, description});
    if (m_events.size() > kMaxEvents) {
        m_events.erase(m_events.begin());
    }
}

void News::clearEvents() {
    m_events.clear();
}

std::string News::format() const {
    std::ostringstream out;
    for (const auto& event : m_events) {
        out << "W" << event.week << " " << event.title;
        if (!event.description.empty()) {
            out << ": " << event.description;
        }
        out << "\n";
    }
    return out.str();
}
