#include "ojudge/evaluation/evaluator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <algorithm>
#include <set>
#include <thread>
#include "ojudge/common/concurrent_queue.hpp"
#include "ojudge/common/exceptions.hpp"
#include "ojudge/common/io_utils.hpp"
#include "ojudge/sandbox/program.hpp"

namespace ojudge {
using namespace std;
namespace fs = std::filesystem;

optional<fs::path> find_solution(const fs::path &solutions_dir, const string &problem_id) {
    for (auto &name : supported_languages()) {
        fs::path candidate = solutions_dir / (problem_id + get_language(name).extension);
        if (fs::is_regular_file(candidate)) return candidate;
    }
    return nullopt;
}

evaluator::evaluator(const problem_repository &repo, executor &exec, evaluation_registry &registry)
    : repo(repo), judge(exec), registry(registry) {}

vector<string> evaluator::select_problems(const vector<string> &filter) const {
    vector<string> available = repo.list();
    if (filter.empty()) return available;

    set<string> wanted(filter.begin(), filter.end());
    vector<string> selected;
    for (auto &problem_id : available)
        if (wanted.erase(problem_id)) selected.push_back(problem_id);
    for (auto &problem_id : wanted)
        LOG(WARNING) << "Problem " << problem_id << " is not in " << repo.get_root() << ", skipped";
    return selected;
}

string evaluator::evaluate_problem(const string &problem_id, const fs::path &solutions_dir) const {
    LOG(INFO) << "Running task " << problem_id << "...";
    try {
        problem_definition prob = repo.load(problem_id);

        auto solution = find_solution(solutions_dir, problem_id);
        if (!solution) {
            LOG(ERROR) << "Task " << problem_id << " failed: no solution found in " << solutions_dir;
            return EVALUATION_ERROR;
        }

        const language *lang = find_language_by_extension(solution->extension().string());
        source_program prog(*lang, read_file_content(*solution));
        judge_result result = judge.judge(prob, prog);

        string verdict = get_display_message(result.verdict);
        if (result.verdict != status::ACCEPTED)
            LOG(INFO) << fmt::format("Task {} failed at test case #{}: {}\n{}", problem_id, result.failed_test.value_or(0), verdict, result.describe());
        return verdict;
    } catch (problem_error &ex) {
        LOG(ERROR) << "Task " << problem_id << " failed: " << ex;
        return EVALUATION_ERROR;
    } catch (std::exception &ex) {
        LOG(ERROR) << "Task " << problem_id << " failed: " << boost::diagnostic_information(ex);
        return EVALUATION_ERROR;
    }
}

evaluation_report evaluator::evaluate(const string &context_id, const evaluation_options &options) {
    registry.acquire(context_id);

    vector<string> problem_ids = select_problems(options.problem_ids);
    LOG(INFO) << "Running " << problem_ids.size() << " tasks with " << max<size_t>(options.jobs, 1) << " workers";

    concurrent_queue<string> queue;
    for (auto &problem_id : problem_ids) queue.push(problem_id);
    queue.close();

    vector<thread> workers;
    for (size_t i = 0; i < max<size_t>(options.jobs, 1); ++i) {
        workers.emplace_back([&] {
            while (auto problem_id = queue.pop())
                registry.record(context_id, *problem_id, evaluate_problem(*problem_id, options.solutions_dir));
        });
    }
    for (auto &worker : workers) worker.join();

    return registry.release(context_id);
}

}  // namespace ojudge
