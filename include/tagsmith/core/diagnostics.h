#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <vector>

namespace tagsmith::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::uint64_t correlation_id = 0;
};

const char* severity_name(Severity severity);

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Severity-filtered event log. Keeps at most capacity() events, dropping the
// oldest first; observers see every event that passes the filter.
class DiagnosticEmitter {
public:
    DiagnosticEmitter();

    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);

    void set_correlation_id(std::uint64_t id);
    std::uint64_t correlation_id() const;

    void set_min_severity(Severity min);
    Severity min_severity() const;

    void set_capacity(std::size_t capacity);
    std::size_t capacity() const;

    void add_observer(DiagnosticObserver observer);
    void clear_observers();

    const std::deque<DiagnosticEvent>& events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;

    void clear();
    std::size_t size() const;

private:
    // Bounded history: once it holds capacity_ events, emit() pops the front
    // before pushing, so memory stays flat however long the thread runs.
    std::deque<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::uint64_t correlation_id_ = 0;
    Severity min_severity_ = Severity::Warning;
    std::size_t capacity_;
};

// Emitter used by the library on the calling thread.
DiagnosticEmitter& diagnostics();

}  // namespace tagsmith::core
