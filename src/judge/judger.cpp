#include "ojudge/judge/judger.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <stdexcept>
#include "ojudge/common/utils.hpp"

namespace ojudge {
using namespace std;

string judge_result::describe() const {
    return visit(overloaded{
                     [](const monostate &) { return string(); },
                     [](const output_mismatch &diff) { return diff.describe(); },
                     [](const execution_result &exec) {
                         string text = exec.message;
                         if (!exec.error.empty()) {
                             if (!text.empty()) text += "\n";
                             text += exec.error;
                         }
                         return text;
                     }},
                 detail);
}

judge_session::judge_session(const judger &owner, const problem_definition &prob, const program &prog)
    : owner(owner), prob(prob), prog(prog) {}

session_state judge_session::state() const {
    return current_state;
}

size_t judge_session::current_test() const {
    return next;
}

bool judge_session::done() const {
    return current_state == session_state::DONE;
}

void judge_session::finish(status verdict, size_t failed, variant<monostate, output_mismatch, execution_result> detail) {
    current_state = session_state::DONE;
    final_result.verdict = verdict;
    if (verdict != status::ACCEPTED) final_result.failed_test = failed;
    final_result.detail = move(detail);
}

void judge_session::step() {
    if (current_state == session_state::DONE) return;

    if (current_state == session_state::NOT_STARTED) {
        current_state = session_state::RUNNING;
        next = 1;
    }

    if (next > prob.tests.size()) {
        finish(status::ACCEPTED, 0, monostate());
        return;
    }

    const test_case &test = prob.tests[next - 1];
    resource_limits limits{prob.time_limit, prob.memory_limit};

    test_report report{test.index, owner.exec.run(prog, test.input, limits), nullopt, status::ACCEPTED};
    ++final_result.tests_run;

    if (report.execution.status != execution_status::EXECUTED) {
        report.verdict = to_status(report.execution.status);
    } else {
        report.comparison = compare_outputs(report.execution.output, test.expected_output);
        report.verdict = report.comparison->verdict;
    }

    LOG(INFO) << fmt::format("[{}] Running Test Case #{}... Verdict: {}", prob.problem_id, test.index, get_display_message(report.verdict));
    owner.fire_test_finished(report);

    if (report.verdict == status::WRONG_ANSWER) {
        finish(status::WRONG_ANSWER, test.index, *report.comparison->diff);
    } else if (report.verdict != status::ACCEPTED) {
        finish(report.verdict, test.index, move(report.execution));
    } else if (next == prob.tests.size()) {
        finish(status::ACCEPTED, 0, monostate());
    } else {
        ++next;
    }
}

const judge_result &judge_session::run() {
    while (!done()) step();
    return final_result;
}

const judge_result &judge_session::result() const {
    if (!done())
        throw logic_error("judge session is not finished yet");
    return final_result;
}

judger::judger(executor &exec) : exec(exec) {}

judge_session judger::start(const problem_definition &prob, const program &prog) const {
    return judge_session(*this, prob, prog);
}

judge_result judger::judge(const problem_definition &prob, const program &prog) const {
    judge_session session(*this, prob, prog);
    judge_result result = session.run();
    LOG(INFO) << fmt::format("[{}] Final verdict: {} ({} of {} test cases run)",
                             prob.problem_id, get_display_message(result.verdict), result.tests_run, prob.tests.size());
    return result;
}

void judger::on_test_finished(function<void(const test_report &)> callback) {
    test_finished.push_back(callback);
}

void judger::fire_test_finished(const test_report &report) const {
    for (auto &f : test_finished) f(report);
}

}  // namespace ojudge
