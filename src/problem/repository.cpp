#include "ojudge/problem/repository.hpp"
#include "ojudge/common/io_utils.hpp"

namespace ojudge {
using namespace std;
namespace fs = std::filesystem;

problem_repository::problem_repository(const fs::path &root)
    : root(root) {}

vector<string> problem_repository::list() const {
    return list_directories(root);
}

fs::path problem_repository::problem_dir(const string &problem_id) const {
    return root / assert_safe_path(problem_id);
}

problem_definition problem_repository::load(const string &problem_id) const {
    return load_problem(problem_dir(problem_id));
}

const fs::path &problem_repository::get_root() const {
    return root;
}

}  // namespace ojudge
