#include "gtest/gtest.h"
#include "common/io_utils.hpp"
#include "outcome.hpp"

using namespace std;
using namespace grader;

class OutcomeTest : public ::testing::Test {
protected:
    execution_result exited(int exitcode, const string &output = "", const string &error = "") {
        execution_result result;
        result.job = "T1-s1-public";
        result.exitcode = exitcode;
        result.output = output;
        result.error = error;
        return result;
    }
};

TEST_F(OutcomeTest, ExitZeroPasses) {
    auto o = classify(exited(0));
    EXPECT_TRUE(holds_alternative<passed>(o));
    EXPECT_EQ(outcome_name(o), "passed");
    EXPECT_TRUE(student_visible(o));
}

TEST_F(OutcomeTest, OutputNeverUpgradesNonzeroExit) {
    auto o = classify(exited(1, "ALL TESTS PASSED\nOK\n"));
    ASSERT_TRUE(holds_alternative<failed>(o));
    EXPECT_EQ(get<failed>(o).reason, "exit code 1: OK");
}

TEST_F(OutcomeTest, OutputNeverDowngradesZeroExit) {
    auto o = classify(exited(0, "", "FAILED: 3 assertions\n"));
    EXPECT_TRUE(holds_alternative<passed>(o));
}

TEST_F(OutcomeTest, ReasonUsesLastLineOfStderr) {
    auto o = classify(exited(2, "some output\n", "Traceback\n  line 3\nAssertionError: expected 4\n\n"));
    ASSERT_TRUE(holds_alternative<failed>(o));
    EXPECT_EQ(outcome_detail(o), "exit code 2: AssertionError: expected 4");
}

TEST_F(OutcomeTest, ReasonIgnoresTruncationMarker) {
    auto o = classify(exited(1, string("line one\nline two") + TRUNCATED_MARKER));
    EXPECT_EQ(outcome_detail(o), "exit code 1: line two");
}

TEST_F(OutcomeTest, KilledBySignal) {
    EXPECT_EQ(outcome_detail(classify(exited(137))), "exit code 137 (killed, possibly out of memory)");
    EXPECT_EQ(outcome_detail(classify(exited(139))), "exit code 139 (signal 11)");
}

TEST_F(OutcomeTest, LongReasonIsShortened) {
    auto o = classify(exited(1, string(1000, 'x')));
    EXPECT_LT(outcome_detail(o).size(), 300u);
}

TEST_F(OutcomeTest, TimeoutWinsOverExitCode) {
    auto result = exited(0);
    result.timed_out = true;
    auto o = classify(result);
    EXPECT_TRUE(holds_alternative<timed_out>(o));
    EXPECT_TRUE(student_visible(o));
}

TEST_F(OutcomeTest, LaunchErrorIsInfraError) {
    auto result = exited(0);
    result.timed_out = true;
    result.launch_error = "docker: Cannot connect to the Docker daemon";
    auto o = classify(result);
    ASSERT_TRUE(holds_alternative<infra_error>(o));
    EXPECT_EQ(get<infra_error>(o).cause, "docker: Cannot connect to the Docker daemon");
    EXPECT_EQ(outcome_name(o), "infra_error");
    EXPECT_FALSE(student_visible(o));
}
