#include "ojudge/config.hpp"
#include <glog/logging.h>
#include <cstdlib>

namespace ojudge {
using namespace std;
namespace po = boost::program_options;

filesystem::path RUN_DIR = "/tmp/ojudge";
string PYTHON_INTERPRETER = "python3";
string SHELL_INTERPRETER = "/bin/sh";
bool DEBUG = false;

void add_common_options(po::options_description &desc) {
    // clang-format off
    desc.add_options()
        ("run-dir", po::value<string>(), "set the directory to store candidate programs while they run. You can either pass it from environ RUNDIR")
        ("interpreter", po::value<string>(), "set the python interpreter used to run .py solutions, default to python3. You can either pass it from environ PYTHON")
        ("debug", "turn on the debug mode to keep run directories for checking the files used by the judge");
    // clang-format on
}

void load_common_options(const po::variables_map &vm) {
    if (vm.count("debug")) {
        DEBUG = true;
    } else if (getenv("DEBUG")) {
        DEBUG = true;
    }

    if (vm.count("run-dir")) {
        RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
    } else if (getenv("RUNDIR")) {
        RUN_DIR = filesystem::path(getenv("RUNDIR"));
    }

    if (vm.count("interpreter")) {
        PYTHON_INTERPRETER = vm.at("interpreter").as<string>();
    } else if (getenv("PYTHON")) {
        PYTHON_INTERPRETER = getenv("PYTHON");
    }

    error_code ec;
    filesystem::create_directories(RUN_DIR, ec);
    CHECK(filesystem::is_directory(RUN_DIR))
        << "Run directory " << RUN_DIR << " does not exist: " << ec.message();

    LOG(INFO) << "Run directory: " << RUN_DIR << ", python interpreter: " << PYTHON_INTERPRETER << (DEBUG ? ", debug mode" : "");
}

}  // namespace ojudge
