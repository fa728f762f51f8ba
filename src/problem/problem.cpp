#include "ojudge/problem/problem.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <new>
#include "ojudge/common/exceptions.hpp"
#include "ojudge/common/io_utils.hpp"
#include "ojudge/common/json_utils.hpp"

namespace ojudge {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

size_t problem_definition::num_tests() const {
    return tests.size();
}

string canonical_input_name(size_t index) {
    return fmt::format("{}.in", index);
}

string canonical_output_name(size_t index) {
    return fmt::format("{}.out", index);
}

string legacy_input_name(size_t index) {
    return fmt::format("I.{}", index);
}

string legacy_output_name(size_t index) {
    return fmt::format("O.{}", index);
}

static string optional_text(const json &config, const string &key) {
    json value = access_optional(config, key);
    if (value.is_null()) return "";
    if (value.is_string()) return value.get<string>();
    if (value.is_number_integer()) return std::to_string(value.get<int64_t>());
    throw malformed_config(fmt::format("Field '{}' must be a string", key));
}

problem_definition parse_problem_config(const json &config, const string &default_id) {
    if (!config.is_object())
        throw malformed_config("Problem config must be a JSON object");

    problem_definition prob;
    try {
        json problem_id = access_optional(config, "problem_id");
        if (problem_id.is_null())
            prob.problem_id = default_id;
        else if (problem_id.is_string())
            prob.problem_id = problem_id.get<string>();
        else
            throw malformed_config(fmt::format("Field 'problem_id' of problem {} must be a string", default_id));

        const json &num_tests = access(config, "num_tests");
        if (!num_tests.is_number_integer() || num_tests.get<int64_t>() <= 0)
            throw malformed_config(fmt::format("Field 'num_tests' of problem {} must be a positive integer", prob.problem_id));

        const json &runtime_limit = access(config, "runtime_limit");
        if (!runtime_limit.is_number())
            throw malformed_config(fmt::format("Field 'runtime_limit' of problem {} must be a number", prob.problem_id));
        prob.time_limit = runtime_limit.get<double>();

        const json &memory_limit = access(config, "memory_limit");
        if (!memory_limit.is_number())
            throw malformed_config(fmt::format("Field 'memory_limit' of problem {} must be a number", prob.problem_id));
        prob.memory_limit = (int64_t)memory_limit.get<double>();

        prob.name = optional_text(config, "name");
        prob.description = optional_text(config, "description");
        prob.level = optional_text(config, "problem_level");

        prob.declared_tests = num_tests.get<size_t>();
    } catch (invalid_argument &ex) {
        throw malformed_config(fmt::format("Malformed config of problem {}: {}", default_id, ex.what()));
    }

    if (prob.problem_id.empty())
        throw malformed_config("Problem has no problem_id");
    return prob;
}

static fs::path resolve_test_file(const fs::path &dir, size_t index, missing_test_data::artifact kind, size_t &renamed) {
    bool input = kind == missing_test_data::artifact::INPUT;
    fs::path canonical = dir / (input ? canonical_input_name(index) : canonical_output_name(index));
    if (fs::is_regular_file(canonical))
        return canonical;

    fs::path legacy = dir / (input ? legacy_input_name(index) : legacy_output_name(index));
    if (!fs::is_regular_file(legacy))
        throw missing_test_data(index, kind, legacy.string());

    fs::rename(legacy, canonical);
    LOG(INFO) << "Renamed " << legacy << " to " << canonical;
    ++renamed;
    return canonical;
}

size_t normalize_test_files(const fs::path &dir, size_t num_tests) {
    size_t renamed = 0;
    for (size_t i = 1; i <= num_tests; ++i) {
        resolve_test_file(dir, i, missing_test_data::artifact::INPUT, renamed);
        resolve_test_file(dir, i, missing_test_data::artifact::OUTPUT, renamed);
    }
    return renamed;
}

problem_definition load_problem(const fs::path &dir) {
    if (!fs::is_directory(dir))
        throw problem_error(fmt::format("Problem directory {} does not exist", dir.string()));

    fs::path config_file = dir / "config.json";
    json config;
    try {
        config = json::parse(read_file_content(config_file));
    } catch (system_error &ex) {
        throw malformed_config(fmt::format("Unable to read {}: {}", config_file.string(), ex.what()));
    } catch (json::parse_error &ex) {
        throw malformed_config(fmt::format("Unable to parse {}: {}", config_file.string(), ex.what()));
    }

    problem_definition prob = parse_problem_config(config, dir.filename().string());

    try {
        // 多个评测同时加载同一道题目时，只有一个会执行重命名
        scoped_file_lock lock;
        try {
            lock = lock_directory(dir, false);
        } catch (system_error &ex) {
            // 只读的题库无法创建锁文件，已经是标准命名时也不需要加锁
            LOG(WARNING) << "Unable to lock problem directory " << dir << ": " << ex.what();
        }
        size_t renamed = normalize_test_files(dir, prob.declared_tests);
        if (renamed > 0)
            LOG(INFO) << "Normalized " << renamed << " legacy test data files of problem " << prob.problem_id;
    } catch (fs::filesystem_error &ex) {
        throw problem_error(fmt::format("Unable to normalize test data of problem {}: {}", prob.problem_id, ex.what()));
    }

    try {
        for (size_t i = 1; i <= prob.declared_tests; ++i) {
            prob.tests.push_back({i,
                                  read_file_content(dir / canonical_input_name(i)),
                                  read_file_content(dir / canonical_output_name(i))});
        }
    } catch (system_error &ex) {
        throw problem_error(fmt::format("Unable to read test data of problem {}: {}", prob.problem_id, ex.what()));
    } catch (bad_alloc &) {
        throw malformed_config(fmt::format("Test data of problem {} is too large to load", prob.problem_id));
    }
    return prob;
}

static const json &lookup_test_data(const json &record, const string &field, size_t index,
                                   missing_test_data::artifact kind, const string &legacy_key) {
    string key = std::to_string(index);
    const json *data = record.count(field) ? &record.at(field) : nullptr;
    const json *value = nullptr;
    if (data && data->is_object()) {
        if (data->count(key))
            value = &data->at(key);
        else if (data->count(legacy_key))
            value = &data->at(legacy_key);
    }
    if (!value)
        throw missing_test_data(index, kind, fmt::format("{}[\"{}\"]", field, key));
    if (!value->is_string())
        throw malformed_config(fmt::format("Test data {}[\"{}\"] must be a string", field, key));
    return *value;
}

problem_definition parse_problem(const json &record, const string &default_id) {
    problem_definition prob = parse_problem_config(record, default_id);
    // 先确认所有测试点都存在再读取内容
    for (size_t i = 1; i <= prob.declared_tests; ++i) {
        lookup_test_data(record, "input", i, missing_test_data::artifact::INPUT, legacy_input_name(i));
        lookup_test_data(record, "output", i, missing_test_data::artifact::OUTPUT, legacy_output_name(i));
    }
    try {
        for (size_t i = 1; i <= prob.declared_tests; ++i) {
            prob.tests.push_back({i,
                                  lookup_test_data(record, "input", i, missing_test_data::artifact::INPUT, legacy_input_name(i)).get<string>(),
                                  lookup_test_data(record, "output", i, missing_test_data::artifact::OUTPUT, legacy_output_name(i)).get<string>()});
        }
    } catch (bad_alloc &) {
        throw malformed_config(fmt::format("Test data of problem {} is too large to load", prob.problem_id));
    }
    return prob;
}

map<string, problem_definition> parse_problem_collection(const json &collection) {
    if (!collection.is_object())
        throw malformed_config("Problem collection must be a JSON object keyed by problem id");

    map<string, problem_definition> problems;
    for (auto &[id, record] : collection.items())
        problems.emplace(id, parse_problem(record, id));
    return problems;
}

}  // namespace ojudge
