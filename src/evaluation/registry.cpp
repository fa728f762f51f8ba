#include "ojudge/evaluation/registry.hpp"
#include <glog/logging.h>
#include <stdexcept>
#include "ojudge/common/status.hpp"

namespace ojudge {
using namespace std;
using namespace nlohmann;

const char *const EVALUATION_ERROR = "Error";

size_t evaluation_report::accepted() const {
    string accepted_text = get_display_message(status::ACCEPTED);
    size_t count = 0;
    for (auto &[problem_id, verdict] : tasks)
        if (verdict == accepted_text) ++count;
    return count;
}

size_t evaluation_report::total() const {
    return tasks.size();
}

double evaluation_report::pass_rate() const {
    if (tasks.empty()) return 0.0;
    return (double)accepted() / total();
}

json evaluation_report::to_json() const {
    json j;
    j["pass_1"] = pass_rate();
    j["time"] = time;
    j["accepted"] = accepted();
    j["total"] = total();
    j["tasks"] = json::object();
    for (auto &[problem_id, verdict] : tasks)
        j["tasks"][problem_id] = verdict;
    return j;
}

bool evaluation_registry::acquire(const string &context_id) {
    scoped_lock guard(mut);
    auto [it, created] = contexts.try_emplace(context_id);
    if (created) LOG(INFO) << "Started evaluation " << context_id;
    return created;
}

void evaluation_registry::record(const string &context_id, const string &problem_id, const string &verdict) {
    scoped_lock guard(mut);
    auto it = contexts.find(context_id);
    if (it == contexts.end())
        throw invalid_argument("Unknown evaluation " + context_id);
    it->second.report.tasks[problem_id] = verdict;
}

optional<evaluation_report> evaluation_registry::snapshot(const string &context_id) const {
    scoped_lock guard(mut);
    auto it = contexts.find(context_id);
    if (it == contexts.end()) return nullopt;
    evaluation_report report = it->second.report;
    report.time = it->second.started.seconds();
    return report;
}

evaluation_report evaluation_registry::release(const string &context_id) {
    scoped_lock guard(mut);
    auto it = contexts.find(context_id);
    if (it == contexts.end())
        throw invalid_argument("Unknown evaluation " + context_id);
    evaluation_report report = move(it->second.report);
    report.time = it->second.started.seconds();
    contexts.erase(it);
    LOG(INFO) << "Finished evaluation " << context_id << ", " << report.accepted() << "/" << report.total() << " accepted";
    return report;
}

bool evaluation_registry::contains(const string &context_id) const {
    scoped_lock guard(mut);
    return contexts.count(context_id) > 0;
}

size_t evaluation_registry::size() const {
    scoped_lock guard(mut);
    return contexts.size();
}

}  // namespace ojudge
