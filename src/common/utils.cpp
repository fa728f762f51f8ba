#include "ojudge/common/utils.hpp"

namespace ojudge {
using namespace std;

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::seconds() const {
    return duration<chrono::duration<double>>().count();
}

}  // namespace ojudge
