#include <nlohmann/json.hpp>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "ojudge/evaluation/evaluator.hpp"
#include "ojudge/evaluation/registry.hpp"
#include "test/mock_executor.hpp"
#include "test/temp_directory.hpp"

using namespace std;
using namespace ojudge;
using namespace ojudge::test;
using nlohmann::json;
using ::testing::_;
using ::testing::AnyNumber;
using ::testing::Return;

TEST(EvaluationRegistryTest, CreatesOnFirstUseAndForgetsOnRelease) {
    evaluation_registry registry;
    EXPECT_FALSE(registry.contains("ctx"));
    EXPECT_THROW(registry.record("ctx", "p", "Accepted"), invalid_argument);

    EXPECT_TRUE(registry.acquire("ctx"));
    EXPECT_FALSE(registry.acquire("ctx"));
    EXPECT_EQ(registry.size(), 1u);

    registry.record("ctx", "p1", "Accepted");
    registry.record("ctx", "p2", "Wrong Answer");
    auto snapshot = registry.snapshot("ctx");
    ASSERT_TRUE(snapshot);
    EXPECT_EQ(snapshot->total(), 2u);
    EXPECT_FALSE(registry.snapshot("other"));

    auto report = registry.release("ctx");
    EXPECT_FALSE(registry.contains("ctx"));
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(report.accepted(), 1u);
    EXPECT_DOUBLE_EQ(report.pass_rate(), 0.5);
    EXPECT_GE(report.time, 0);
    EXPECT_THROW(registry.release("ctx"), invalid_argument);

    // 释放后再次使用同一个编号会得到新的报告
    EXPECT_TRUE(registry.acquire("ctx"));
    EXPECT_EQ(registry.release("ctx").total(), 0u);
}

TEST(EvaluationRegistryTest, EmptyReportHasZeroPassRate) {
    evaluation_report report;
    EXPECT_DOUBLE_EQ(report.pass_rate(), 0.0);

    json j = report.to_json();
    EXPECT_DOUBLE_EQ(j.at("pass_1").get<double>(), 0.0);
    EXPECT_EQ(j.at("total").get<size_t>(), 0u);
    EXPECT_TRUE(j.at("tasks").is_object());
    EXPECT_TRUE(j.at("tasks").empty());
}

TEST(EvaluationRegistryTest, ReportJson) {
    evaluation_report report;
    report.tasks = {{"a", "Accepted"}, {"b", "Error"}, {"c", "Accepted"}, {"d", "Time Limit Exceeded"}};
    report.time = 1.5;

    json j = report.to_json();
    EXPECT_DOUBLE_EQ(j.at("pass_1").get<double>(), 0.5);
    EXPECT_DOUBLE_EQ(j.at("time").get<double>(), 1.5);
    EXPECT_EQ(j.at("accepted").get<size_t>(), 2u);
    EXPECT_EQ(j.at("total").get<size_t>(), 4u);
    EXPECT_EQ(j.at("tasks").at("b").get<string>(), "Error");
}

class EvaluatorTest : public ::testing::Test {
protected:
    temp_directory problems;
    temp_directory solutions;
    mock_executor executor;
    evaluation_registry registry;

    void make_problem(const string &id, const string &input, const string &output) {
        json config = {{"problem_id", id}, {"num_tests", 1}, {"runtime_limit", 1}, {"memory_limit", 64}};
        problems.write(id + "/config.json", config.dump());
        problems.write(id + "/1.in", input);
        problems.write(id + "/1.out", output);
    }

    void SetUp() override {
        make_problem("accepted", "a", "A\n");
        make_problem("wrong", "b", "B\n");
        make_problem("no_solution", "c", "C\n");
        problems.write("broken/config.json", "{}");

        solutions.write("accepted.py", "print('A')\n");
        solutions.write("wrong.sh", "echo X\n");
        solutions.write("broken.py", "print()\n");

        ON_CALL(executor, run(_, "a", _)).WillByDefault(Return(executed("A\n")));
        ON_CALL(executor, run(_, "b", _)).WillByDefault(Return(executed("X\n")));
    }
};

TEST_F(EvaluatorTest, FindSolutionByExtension) {
    auto python = find_solution(solutions.path(), "accepted");
    ASSERT_TRUE(python);
    EXPECT_EQ(python->string(), (solutions.path() / "accepted.py").string());
    auto shell = find_solution(solutions.path(), "wrong");
    ASSERT_TRUE(shell);
    EXPECT_EQ(shell->string(), (solutions.path() / "wrong.sh").string());
    EXPECT_FALSE(find_solution(solutions.path(), "no_solution"));
}

TEST_F(EvaluatorTest, EvaluatesEveryProblem) {
    EXPECT_CALL(executor, run(_, "a", _)).Times(1);
    EXPECT_CALL(executor, run(_, "b", _)).Times(1);
    EXPECT_CALL(executor, run(_, "c", _)).Times(0);

    problem_repository repo(problems.path());
    evaluator eval(repo, executor, registry);

    evaluation_options options;
    options.solutions_dir = solutions.path();
    options.jobs = 2;
    auto report = eval.evaluate("ctx", options);

    EXPECT_EQ(report.tasks, (map<string, string>{
                                {"accepted", "Accepted"},
                                {"broken", "Error"},
                                {"no_solution", "Error"},
                                {"wrong", "Wrong Answer"}}));
    EXPECT_EQ(report.accepted(), 1u);
    EXPECT_EQ(report.total(), 4u);
    EXPECT_DOUBLE_EQ(report.pass_rate(), 0.25);
    EXPECT_FALSE(registry.contains("ctx"));
}

TEST_F(EvaluatorTest, FilterSelectsProblems) {
    EXPECT_CALL(executor, run(_, _, _)).Times(AnyNumber());

    problem_repository repo(problems.path());
    evaluator eval(repo, executor, registry);

    EXPECT_EQ(eval.select_problems({"wrong", "accepted", "unknown"}), (vector<string>{"accepted", "wrong"}));

    evaluation_options options;
    options.solutions_dir = solutions.path();
    options.problem_ids = {"accepted"};
    auto report = eval.evaluate("filtered", options);
    EXPECT_EQ(report.total(), 1u);
    EXPECT_DOUBLE_EQ(report.pass_rate(), 1.0);
}

TEST_F(EvaluatorTest, EmptySelectionReportsZero) {
    problem_repository repo(problems.path());
    evaluator eval(repo, executor, registry);

    evaluation_options options;
    options.solutions_dir = solutions.path();
    options.problem_ids = {"unknown"};
    auto report = eval.evaluate("empty", options);
    EXPECT_EQ(report.total(), 0u);
    EXPECT_DOUBLE_EQ(report.pass_rate(), 0.0);
}
