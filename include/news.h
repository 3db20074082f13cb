#pragma once

#include <string>
#include <vector>

struct NewsEvent {
    int week = 0;
    std::string title;
    std::string description;
};

// Bounded game-facing event feed; the oldest event is dropped past kMaxEvents.
class News {
public:
    static constexpr size_t kMaxEvents = 10;

    void addEvent(int week, const std::string& title, const std::string& description);
    void clearEvents();
    const std::vector<NewsEvent>& getEvents() const { return m_events; }
    // "W12 CSP-S2: 3 of 5 passed" per line, oldest first.
    std::string format() const;

private:
    std::vector<NewsEvent> m_events;
};
