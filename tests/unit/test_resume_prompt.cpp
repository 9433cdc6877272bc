#include <catch2/catch_test_macros.hpp>
#include "lifeline/recovery/resume_prompt.hpp"
#include "fixtures.hpp"

using namespace lifeline::recovery;
using namespace lifeline::testing;
using namespace std::chrono_literals;

TEST_CASE("Durations are formatted in minutes and hours", "[prompt]") {
    REQUIRE(format_duration(40s) == "0 minutes");
    REQUIRE(format_duration(1min) == "1 minute");
    REQUIRE(format_duration(45min) == "45 minutes");
    REQUIRE(format_duration(1h) == "1 hour, 0 minutes");
    REQUIRE(format_duration(2h + 1min) == "2 hours, 1 minute");
    REQUIRE(format_duration(Duration{-5000}) == "0 minutes");
}

TEST_CASE("Prompt sections come from the checkpoint", "[prompt]") {
    auto cp = sample_checkpoint("sess_a", 4);
    cp.task.blockers = {"CI is red"};

    auto prompt = ResumePrompt::build(cp, InterruptionReason::Crash, 90min);

    REQUIRE(prompt.situation ==
            "Session interrupted due to crash or context window overflow (1 hour, 30 minutes ago)");
    REQUIRE(prompt.progress == "Operation: Migrate queries [implementation] (40% complete)");
    REQUIRE(prompt.context.rfind(cp.conversation.summary, 0) == 0);
    REQUIRE(prompt.next_steps == "Port list queries, Run tests");
    REQUIRE(prompt.files == "src/storage/sqlite_store.cpp");
    REQUIRE(prompt.tools.find("pending file_write: Write sqlite_store.cpp") != std::string::npos);
    REQUIRE(prompt.blockers == "CI is red");
    REQUIRE(prompt.checkpoint_number == 4);
    REQUIRE(prompt.time_since == "1 hour, 30 minutes");

    auto text = prompt.render();
    REQUIRE(text.find("Resuming from checkpoint #4") != std::string::npos);
    REQUIRE(text.find("Blockers: CI is red") != std::string::npos);

    Json j = prompt.to_json();
    REQUIRE(j["sections"]["next"] == "Port list queries, Run tests");
    REQUIRE(j["metadata"]["interruption_reason"] == "crash");
}

TEST_CASE("Empty sections get placeholders", "[prompt]") {
    Checkpoint cp;
    cp.id = "cp_empty";
    cp.checkpoint_number = 1;

    auto prompt = ResumePrompt::build(cp, InterruptionReason::Timeout, 45min);

    REQUIRE(prompt.situation == "Session timed out due to inactivity (45 minutes ago)");
    REQUIRE(prompt.progress == "No operation recorded (0% complete)");
    REQUIRE(prompt.context == "No summary recorded");
    REQUIRE(prompt.next_steps == "No next steps defined");
    REQUIRE(prompt.files == "No active files");
    REQUIRE(prompt.tools == "No recent tool calls");
    REQUIRE(prompt.blockers == "No blockers");
}
