#pragma once

#include <future>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "engine/dispatcher.hpp"

/**
 * 执行池
 * 执行池由固定数量的 worker 线程和一个有界的先进先出队列组成。
 * 每个 worker 同一时刻只处理一个请求，worker 之间除了队列之外不共享可变状态。
 * 
 * 请求通过 submit 进入队列，队列已满时立刻拒绝；通过 enqueue 进入队列时
 * 会阻塞等待队列出现空位，供批处理模式做背压使用。
 * 
 * 调用 stop 之后执行池不再接收新请求，正在执行的请求会被取消（像超时一样终止子进程），
 * 尚未开始执行的请求以 admission_rejected 异常结束。
 */
namespace quest {

struct execution_pool {
    /**
     * @param dispatcher 执行请求的 dispatcher，必须比执行池活得更久
     * @param workers worker 线程数，即最大并发执行数
     * @param max_queued 队列中最多等待的请求数
     */
    execution_pool(const engine::dispatcher &dispatcher, unsigned workers, std::size_t max_queued);
    ~execution_pool();

    execution_pool(const execution_pool &) = delete;
    execution_pool &operator=(const execution_pool &) = delete;

    /**
     * @brief 提交一个请求
     * @return 执行结果，dispatcher 抛出的异常（如 unsupported_configuration）通过 future 传递
     * @throw admission_rejected 队列已满或者执行池已经停止
     */
    std::future<engine::execution_result> submit(engine::execution_request request);

    /**
     * @brief 提交一个请求，队列已满时阻塞等待
     * @throw admission_rejected 执行池已经停止
     */
    std::future<engine::execution_result> enqueue(engine::execution_request request);

    /**
     * @brief 停止执行池
     * 调用该函数后，执行池不再接收新请求，取消正在执行的请求，并等待所有 worker 退出。
     * 可以重复调用，也可以在多个线程中同时调用。
     */
    void stop();

    std::size_t queued() const;

private:
    struct job {
        engine::execution_request request;
        std::promise<engine::execution_result> promise;
        engine::cancellation_token cancel;
    };

    void worker_loop(std::size_t worker_id);

    const engine::dispatcher &dispatcher;
    concurrent_queue<std::shared_ptr<job>> jobs;
    std::vector<std::thread> workers;

    std::mutex stop_mutex;

    std::mutex active_mutex;
    std::set<std::shared_ptr<job>> active;
    bool stopped = false;
};

}  // namespace quest
