#include "ojudge/sandbox/program.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <map>
#include <mutex>
#include "ojudge/common/exceptions.hpp"
#include "ojudge/common/io_utils.hpp"
#include "ojudge/common/utils.hpp"
#include "ojudge/config.hpp"

namespace ojudge {
using namespace std;
namespace fs = std::filesystem;

// 解释器在调用时才读取，以便命令行参数可以覆盖默认值
static const map<string, language> languages = {
    {"python", {"python", ".py", [](const fs::path &source) { return make_command(PYTHON_INTERPRETER, source); }}},
    {"sh", {"sh", ".sh", [](const fs::path &source) { return make_command(SHELL_INTERPRETER, source); }}}};

const language &get_language(const string &name) {
    auto it = languages.find(name);
    if (it == languages.end())
        throw invalid_argument("Unsupported language " + name);
    return it->second;
}

const language *find_language_by_extension(const string &extension) {
    for (auto &[name, lang] : languages)
        if (lang.extension == extension) return &lang;
    return nullptr;
}

vector<string> supported_languages() {
    vector<string> names;
    for (auto &[name, lang] : languages) names.push_back(name);
    return names;
}

static string random_uuid() {
    // random_generator 不是线程安全的
    static mutex generator_mutex;
    static boost::uuids::random_generator generator;
    scoped_lock guard(generator_mutex);
    return boost::lexical_cast<string>(generator());
}

source_program::source_program(const language &lang, const string &source)
    : lang(lang), workdir(RUN_DIR / random_uuid()), source_path(workdir / ("main" + lang.extension)) {
    try {
        fs::create_directories(workdir);
        write_file_content(source_path, source);
    } catch (std::exception &ex) {
        error_code ec;
        fs::remove_all(workdir, ec);
        throw internal_error(string("Unable to prepare run directory: ") + ex.what());
    }
}

source_program::~source_program() {
    if (DEBUG) {
        LOG(INFO) << "Keeping run directory " << workdir;
        return;
    }

    error_code ec;
    fs::remove_all(workdir, ec);
    if (ec) LOG(WARNING) << "Unable to remove run directory " << workdir << ": " << ec.message();
}

vector<string> source_program::get_run_command() const {
    return lang.run_command(source_path);
}

fs::path source_program::get_run_path() const {
    return source_path;
}

const fs::path &source_program::get_work_dir() const {
    return workdir;
}

executable_program::executable_program(const fs::path &path, const vector<string> &args)
    : path(path), args(args) {}

vector<string> executable_program::get_run_command() const {
    return make_command(path, args);
}

fs::path executable_program::get_run_path() const {
    return path;
}

}  // namespace ojudge
