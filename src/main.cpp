#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <memory>
#include "ojudge/common/exceptions.hpp"
#include "ojudge/common/io_utils.hpp"
#include "ojudge/config.hpp"
#include "ojudge/judge/judger.hpp"
#include "ojudge/problem/problem.hpp"
#include "ojudge/sandbox/executor.hpp"
#include "ojudge/sandbox/program.hpp"
using namespace std;

/**
 * @brief 根据 --language 或者扩展名构造选手程序
 * 扩展名未知时把选手程序当作可执行文件直接运行
 */
static unique_ptr<ojudge::program> make_program(const filesystem::path &solution, const string &language) {
    if (!language.empty())
        return make_unique<ojudge::source_program>(ojudge::get_language(language), ojudge::read_file_content(solution));

    if (auto lang = ojudge::find_language_by_extension(solution.extension().string()))
        return make_unique<ojudge::source_program>(*lang, ojudge::read_file_content(solution));

    return make_unique<ojudge::executable_program>(filesystem::absolute(solution));
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("ojudge options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("problem", po::value<string>()->required(), "problem directory containing config.json and test data")
        ("solution", po::value<string>()->required(), "candidate solution file, source code or executable")
        ("language", po::value<string>(), "language of the solution, inferred from the extension if omitted")
        ("help", "display this help text");
    // clang-format on
    ojudge::add_common_options(desc);
    positional.add("problem", 1).add("solution", 1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        if (vm.count("help")) {
            cout << "ojudge: judge a candidate solution against the test cases of one problem" << endl
                 << "Usage: " << argv[0] << " <problem-dir> <solution-file> [options]" << endl;
            cout << desc << endl;
            return EXIT_SUCCESS;
        }
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    ojudge::load_common_options(vm);

    filesystem::path problem_dir(vm.at("problem").as<string>());
    filesystem::path solution(vm.at("solution").as<string>());
    string language = vm.count("language") ? vm.at("language").as<string>() : "";

    ojudge::problem_definition prob;
    try {
        prob = ojudge::load_problem(problem_dir);
    } catch (ojudge::problem_error& ex) {
        LOG(ERROR) << "Unable to load problem " << problem_dir << ": " << ex;
        return EXIT_FAILURE;
    } catch (std::exception& ex) {
        LOG(ERROR) << "Unable to load problem " << problem_dir << ": " << boost::diagnostic_information(ex);
        return EXIT_FAILURE;
    }
    LOG(INFO) << "Loaded problem " << prob.problem_id << " with " << prob.num_tests() << " test cases, time limit "
              << prob.time_limit << "s, memory limit " << prob.memory_limit << "MB";

    unique_ptr<ojudge::program> prog;
    try {
        prog = make_program(solution, language);
    } catch (std::exception& ex) {
        LOG(ERROR) << "Unable to prepare solution " << solution << ": " << boost::diagnostic_information(ex);
        return EXIT_FAILURE;
    }

    ojudge::sandbox_executor executor;
    ojudge::judger judger(executor);
    ojudge::judge_result result = judger.judge(prob, *prog);

    cout << ojudge::get_display_message(result.verdict) << endl;
    string detail = result.describe();
    if (!detail.empty()) {
        if (result.failed_test) cerr << "Test case #" << *result.failed_test << ":" << endl;
        cerr << detail << endl;
    }
    return EXIT_SUCCESS;
}
