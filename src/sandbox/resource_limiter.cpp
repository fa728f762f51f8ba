#include "ojudge/sandbox/resource_limiter.hpp"
#include <errno.h>
#include <math.h>
#include <sys/resource.h>
#include <algorithm>

namespace ojudge {
using namespace std;

static int set_rlimit(int resource, rlim_t cur, rlim_t max) noexcept {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    if (setrlimit(resource, &lim) != 0)
        return errno;
    return 0;
}

string posix_resource_limiter::name() const {
    return "posix";
}

bool posix_resource_limiter::enforces_cpu_limit() const {
    return true;
}

int posix_resource_limiter::apply(const resource_limits &limits) const noexcept {
    int err;
    if (limits.time_limit > 0) {
        rlim_t cputime_limit = (rlim_t)ceil(min(limits.time_limit, MAX_TIME_LIMIT));
        if ((err = set_rlimit(RLIMIT_CPU, cputime_limit, cputime_limit + 1)) != 0)
            return err;
    }

    if (limits.memory_limit > 0 && limits.memory_limit < MAX_MEMORY_LIMIT) {
        rlim_t memory_bytes = (rlim_t)limits.memory_limit * 1024 * 1024;
        if ((err = set_rlimit(RLIMIT_AS, memory_bytes, memory_bytes)) != 0)
            return err;
    }

    return set_rlimit(RLIMIT_CORE, 0, 0);
}

string timeout_only_limiter::name() const {
    return "timeout-only";
}

bool timeout_only_limiter::enforces_cpu_limit() const {
    return false;
}

int timeout_only_limiter::apply(const resource_limits &) const noexcept {
    return 0;
}

unique_ptr<resource_limiter> make_resource_limiter() {
#if defined(RLIMIT_CPU) && defined(RLIMIT_AS)
    return make_unique<posix_resource_limiter>();
#else
    return make_unique<timeout_only_limiter>();
#endif
}

}  // namespace ojudge
