#include <tagsmith/core/diagnostics.h>
#include <tagsmith/core/errors.h>
#include <tagsmith/html/tags.h>

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace tagsmith;
using core::DiagnosticEmitter;
using core::DiagnosticEvent;
using core::Severity;

namespace {

// Resets the thread's emitter around a test.
class ThreadDiagnostics : public ::testing::Test {
protected:
    void SetUp() override {
        core::diagnostics().clear();
        core::diagnostics().clear_observers();
        core::diagnostics().set_min_severity(Severity::Warning);
    }
    void TearDown() override { SetUp(); }
};

} // namespace

// ---------------------------------------------------------------------------
// 1. Emitter
// ---------------------------------------------------------------------------
TEST(Diagnostics, SeverityNames) {
    EXPECT_STREQ(core::severity_name(Severity::Info), "info");
    EXPECT_STREQ(core::severity_name(Severity::Warning), "warning");
    EXPECT_STREQ(core::severity_name(Severity::Error), "error");
}

TEST(Diagnostics, EventCarriesAllFields) {
    DiagnosticEmitter emitter;
    emitter.set_correlation_id(42);
    emitter.emit(Severity::Error, "compose", "add", "cannot attach");

    ASSERT_EQ(emitter.size(), 1u);
    const auto& event = emitter.events()[0];
    EXPECT_EQ(event.severity, Severity::Error);
    EXPECT_EQ(event.module, "compose");
    EXPECT_EQ(event.stage, "add");
    EXPECT_EQ(event.message, "cannot attach");
    EXPECT_EQ(event.correlation_id, 42u);
    EXPECT_NE(event.timestamp, std::chrono::steady_clock::time_point{});
}

TEST(Diagnostics, FormatIsReadable) {
    DiagnosticEvent event;
    event.severity = Severity::Warning;
    event.module = "scope";
    event.stage = "exit";
    event.message = "skipped";
    EXPECT_EQ(core::format_diagnostic(event), "[warning] scope/exit: skipped");

    event.correlation_id = 9;
    EXPECT_EQ(core::format_diagnostic(event), "[warning] scope/exit (cid:9): skipped");
}

TEST(Diagnostics, DefaultMinimumIsWarning) {
    DiagnosticEmitter emitter;
    EXPECT_EQ(emitter.min_severity(), Severity::Warning);
    emitter.emit(Severity::Info, "scope", "enter", "<div> element");
    EXPECT_EQ(emitter.size(), 0u);
    emitter.emit(Severity::Warning, "scope", "exit", "skipped");
    EXPECT_EQ(emitter.size(), 1u);
}

TEST(Diagnostics, CapacityDropsOldest) {
    DiagnosticEmitter emitter;
    emitter.set_capacity(2);
    emitter.emit(Severity::Error, "m", "s", "first");
    emitter.emit(Severity::Error, "m", "s", "second");
    emitter.emit(Severity::Error, "m", "s", "third");
    ASSERT_EQ(emitter.size(), 2u);
    EXPECT_EQ(emitter.events().front().message, "second");
    EXPECT_EQ(emitter.events().back().message, "third");
}

TEST(Diagnostics, ObserversSeeFilteredEvents) {
    DiagnosticEmitter emitter;
    std::vector<std::string> seen;
    emitter.add_observer([&seen](const DiagnosticEvent& e) { seen.push_back(e.message); });
    emitter.emit(Severity::Info, "m", "s", "hidden");
    emitter.emit(Severity::Error, "m", "s", "shown");
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "shown");
}

TEST(Diagnostics, FilterBySeverityAndModule) {
    DiagnosticEmitter emitter;
    emitter.set_min_severity(Severity::Info);
    emitter.emit(Severity::Info, "scope", "enter", "a");
    emitter.emit(Severity::Error, "compose", "add", "b");
    emitter.emit(Severity::Error, "compose", "set", "c");
    EXPECT_EQ(emitter.events_by_severity(Severity::Error).size(), 2u);
    EXPECT_EQ(emitter.events_by_module("scope").size(), 1u);
    emitter.clear();
    EXPECT_EQ(emitter.size(), 0u);
}

// ---------------------------------------------------------------------------
// 2. Library events
// ---------------------------------------------------------------------------
TEST_F(ThreadDiagnostics, CompositionFailureIsRecorded) {
    auto br = html::Br();
    EXPECT_THROW(br->add("text"), core::IllegalCompositionError);

    auto errors = core::diagnostics().events_by_severity(Severity::Error);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].module, "compose");
    EXPECT_EQ(errors[0].stage, "add");
    EXPECT_NE(errors[0].message.find("<br> element"), std::string::npos);
}

TEST_F(ThreadDiagnostics, ReparentIsLoggedAtInfo) {
    core::diagnostics().set_min_severity(Severity::Info);
    auto first = html::Div();
    auto second = html::Div();
    auto p = html::P();
    first->add(p);
    second->add(p);

    auto compose = core::diagnostics().events_by_module("compose");
    ASSERT_EQ(compose.size(), 1u);
    EXPECT_EQ(compose[0].severity, Severity::Info);
    EXPECT_EQ(compose[0].stage, "reparent");
}
