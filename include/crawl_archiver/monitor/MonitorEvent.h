#pragma once

#include <string>

namespace crawl_archiver { namespace monitor {

// Signal raised by the progress monitor for the control loop
struct MonitorEvent {
    enum class Type {
        Progress,  // periodic status tick
        Stalled,   // no crawl progress for longer than the stall timeout
        Error      // an error counter reached its threshold, or monitoring failed
    };

    Type type = Type::Progress;
    std::string reason;

    static MonitorEvent progress() { return MonitorEvent{Type::Progress, ""}; }
    static MonitorEvent stalled(const std::string& reason) { return MonitorEvent{Type::Stalled, reason}; }
    static MonitorEvent error(const std::string& reason) { return MonitorEvent{Type::Error, reason}; }
};

inline std::string eventTypeName(MonitorEvent::Type type) {
    switch (type) {
        case MonitorEvent::Type::Progress: return "progress";
        case MonitorEvent::Type::Stalled: return "stalled";
        case MonitorEvent::Type::Error: return "error";
    }
    return "unknown";
}

// Reason reported when the container log stream cannot be followed
inline const std::string MONITOR_FAILED_REASON = "monitor_failed";

} } // namespace crawl_archiver::monitor
