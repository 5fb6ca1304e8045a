#include <fmt/core.h>
#include <string_view>
#include <vector>
#include "FibonacciHeapFormat.h"

// A tiny discrete-event loop: events are processed in time order, some of them
// scheduling follow-up events. Independently built queues are merged in O(1).
struct Event {
    int time;
    std::string_view name;
};

struct EventLess {
    bool operator()(const Event& lhs, const Event& rhs) const { return lhs.time < rhs.time; }
};

int main() {
    FibonacciHeap<int> fh;
    for (int x : { 7, 3, 11, 0, 5, 9, 2, 13, 1 }) {
        fh.insert(x);
    }
    fmt::print("After inserting {} values:\n{}", fh.size(), fh);
    fmt::print("extractMin() = {}\n", *fh.extractMin());
    fmt::print("After consolidation:\n{}\n", fh);

    FibonacciHeap<Event, EventLess> events, arrivals;
    events.insert({ 10, "shutdown" });
    events.insert({ 0, "boot" });
    arrivals.insert({ 4, "request A" });
    arrivals.insert({ 2, "request B" });
    events.merge(std::move(arrivals));

    std::vector<std::string_view> log;
    while (auto ev = events.extractMin()) {
        fmt::print("t={:>3} {}\n", ev->time, ev->name);
        log.push_back(ev->name);
        // Every request is followed by its response
        if (ev->name.starts_with("request")) {
            events.insert({ ev->time + 3, "response" });
        }
    }
    fmt::print("Processed {} events, queue empty: {}\n", log.size(), events.empty());
    return 0;
}
