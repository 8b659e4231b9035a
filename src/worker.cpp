#include "worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/defer.hpp"
#include "common/exceptions.hpp"

namespace quest {
using namespace std;
using namespace quest::engine;

execution_pool::execution_pool(const engine::dispatcher &dispatcher, unsigned worker_count, size_t max_queued)
    : dispatcher(dispatcher), jobs(max_queued) {
    for (size_t i = 0; i < max(1u, worker_count); ++i)
        workers.emplace_back([this, i] { worker_loop(i); });
}

execution_pool::~execution_pool() {
    stop();
}

future<execution_result> execution_pool::submit(execution_request request) {
    auto task = make_shared<job>();
    task->request = move(request);
    auto result = task->promise.get_future();
    if (!jobs.try_push(task)) {
        scoped_lock guard(active_mutex);
        throw admission_rejected(stopped ? "execution pool is stopped" : "execution queue is full");
    }
    return result;
}

future<execution_result> execution_pool::enqueue(execution_request request) {
    auto task = make_shared<job>();
    task->request = move(request);
    auto result = task->promise.get_future();
    if (!jobs.push(task))
        throw admission_rejected("execution pool is stopped");
    return result;
}

size_t execution_pool::queued() const {
    return jobs.size();
}

void execution_pool::stop() {
    // 批处理模式下主线程与输出线程都可能收到中断后调用 stop
    scoped_lock stopping(stop_mutex);
    {
        scoped_lock guard(active_mutex);
        if (!stopped) LOG(INFO) << "stopping execution pool, cancelling " << active.size() << " running executions";
        stopped = true;
        for (auto &task : active) task->cancel.cancel();
    }
    jobs.close();

    for (auto &th : workers)
        if (th.joinable()) th.join();

    // 队列关闭后 worker 不再取出新的请求，剩下的请求都没有被执行
    shared_ptr<job> task;
    while (jobs.try_pop(task))
        task->promise.set_exception(make_exception_ptr(admission_rejected("execution pool is stopped")));
}

void execution_pool::worker_loop(size_t worker_id) {
    LOG(INFO) << "Worker " << worker_id << " started";

    while (true) {
        {
            scoped_lock guard(active_mutex);
            if (stopped) break;
        }

        auto next = jobs.pop();
        if (!next) break;
        shared_ptr<job> task = *next;

        {
            scoped_lock guard(active_mutex);
            if (stopped) {
                task->promise.set_exception(make_exception_ptr(admission_rejected("execution pool is stopped")));
                break;
            }
            active.insert(task);
        }
        defer {
            scoped_lock guard(active_mutex);
            active.erase(task);
        };

        try {
            task->promise.set_value(dispatcher.execute(task->request, &task->cancel));
        } catch (std::exception &ex) {
            LOG(WARNING) << "Worker " << worker_id << " rejected request " << task->request.id << ": " << ex.what();
            task->promise.set_exception(current_exception());
        }
    }

    LOG(INFO) << "Worker " << worker_id << " stopped";
}

}  // namespace quest
