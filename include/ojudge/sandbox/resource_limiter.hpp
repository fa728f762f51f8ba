#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace ojudge {

/**
 * @brief 时间限制的上限，单位为秒
 * 更大的时间限制按该值处理，避免换算为 rlim_t、纳秒或 poll 的毫秒超时时溢出
 */
const double MAX_TIME_LIMIT = 1e8;

/**
 * @brief 内存限制的上限，单位为 MB，超过该值视为不限制
 */
const int64_t MAX_MEMORY_LIMIT = INT64_C(1) << 40;

/**
 * @brief 选手程序的资源限制
 * 任何一项小于等于 0 表示不限制
 */
struct resource_limits {
    /**
     * @brief CPU 时间限制，单位为秒
     * 同时也是时钟时间限制
     */
    double time_limit = 0;

    /**
     * @brief 地址空间限制，单位为 MB
     */
    int64_t memory_limit = 0;
};

/**
 * @brief 在子进程 exec 之前为其设置资源限制
 * 不同平台支持的限制手段不同，sandbox_executor 只依赖这个接口，
 * 不关心具体平台。
 */
struct resource_limiter {
    virtual ~resource_limiter() = default;

    virtual std::string name() const = 0;

    /**
     * @brief 是否会由内核强制 CPU 时间限制
     * 为假时只有时钟时间超时可以终止选手程序
     */
    virtual bool enforces_cpu_limit() const = 0;

    /**
     * @brief 对当前进程设置资源限制
     * @note 该函数在 fork 之后、exec 之前的子进程中调用，只能调用异步信号安全的函数，
     *       不能分配内存，也不能抛出异常
     * @return 0 表示成功，否则为 errno
     */
    virtual int apply(const resource_limits &limits) const noexcept = 0;
};

/**
 * @brief 通过 setrlimit 设置 RLIMIT_CPU 和 RLIMIT_AS，并禁止产生 core dump
 * CPU 时间的软限制为 ceil(time_limit)，硬限制多一秒：到达软限制时内核发送 SIGXCPU，
 * 该信号默认终止进程，因此我们可以可靠地判断 CPU 时间超限。
 */
struct posix_resource_limiter : public resource_limiter {
    std::string name() const override;

    bool enforces_cpu_limit() const override;

    int apply(const resource_limits &limits) const noexcept override;
};

/**
 * @brief 不设置任何限制，只依靠时钟时间超时终止选手程序
 */
struct timeout_only_limiter : public resource_limiter {
    std::string name() const override;

    bool enforces_cpu_limit() const override;

    int apply(const resource_limits &limits) const noexcept override;
};

/**
 * @brief 根据当前平台选择资源限制器
 * 支持 POSIX rlimit 的平台返回 posix_resource_limiter，否则返回 timeout_only_limiter
 */
std::unique_ptr<resource_limiter> make_resource_limiter();

}  // namespace ojudge
