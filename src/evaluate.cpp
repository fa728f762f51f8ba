#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/program_options.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/lexical_cast.hpp>
#include <iostream>
#include "ojudge/common/io_utils.hpp"
#include "ojudge/config.hpp"
#include "ojudge/evaluation/evaluator.hpp"
#include "ojudge/evaluation/registry.hpp"
#include "ojudge/problem/repository.hpp"
#include "ojudge/sandbox/executor.hpp"
using namespace std;

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("ojudge-evaluate options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("problems", po::value<string>()->required(), "problem repository, each subdirectory is a problem")
        ("solutions", po::value<string>()->required(), "directory with candidate solutions named <problem_id>.py or <problem_id>.sh")
        ("problem-ids", po::value<string>(), "comma separated problem ids to evaluate, default to all problems in the repository")
        ("jobs", po::value<size_t>()->default_value(1), "number of problems judged concurrently")
        ("report", po::value<string>(), "write the JSON report to this file instead of stdout")
        ("help", "display this help text");
    // clang-format on
    ojudge::add_common_options(desc);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        if (vm.count("help")) {
            cout << "ojudge-evaluate: judge a directory of solutions against a problem repository" << endl
                 << "Usage: " << argv[0] << " --problems <root> --solutions <dir> [options]" << endl;
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

    ojudge::problem_repository repo(vm.at("problems").as<string>());
    CHECK(filesystem::is_directory(repo.get_root()))
        << "Problem repository " << repo.get_root() << " does not exist";

    ojudge::evaluation_options options;
    options.solutions_dir = vm.at("solutions").as<string>();
    options.jobs = vm.at("jobs").as<size_t>();
    CHECK(options.jobs > 0) << "--jobs should be positive";
    CHECK(filesystem::is_directory(options.solutions_dir))
        << "Solutions directory " << options.solutions_dir << " does not exist";

    if (vm.count("problem-ids")) {
        vector<string> ids;
        boost::split(ids, vm.at("problem-ids").as<string>(), boost::is_any_of(","));
        for (auto& id : ids) {
            boost::trim(id);
            if (!id.empty()) options.problem_ids.push_back(id);
        }
    }

    ojudge::sandbox_executor executor;
    ojudge::evaluation_registry registry;
    ojudge::evaluator evaluator(repo, executor, registry);

    string context_id = boost::lexical_cast<string>(boost::uuids::random_generator()());
    ojudge::evaluation_report report = evaluator.evaluate(context_id, options);

    string text = report.to_json().dump(4);
    if (vm.count("report")) {
        ojudge::write_file_content(vm.at("report").as<string>(), text + "\n");
        LOG(INFO) << "Report written to " << vm.at("report").as<string>();
    } else {
        cout << text << endl;
    }
    return EXIT_SUCCESS;
}
