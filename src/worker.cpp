#include "codejudge/worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <algorithm>
#include "codejudge/common/exceptions.hpp"

namespace codejudge {
using namespace std;

worker_pool::worker_pool(size_t workers) {
    for (size_t i = 0; i < max(workers, (size_t)1); ++i)
        threads.emplace_back([this, i] { worker_loop(i); });
}

worker_pool::~worker_pool() {
    stop();
}

void worker_pool::submit(function<void()> task) {
    if (!task) return;
    task_queue.push(move(task));
}

void worker_pool::stop() {
    if (stopped) return;
    stopped = true;
    // 每个 worker 取到一个空任务后退出，空任务排在已有任务之后
    for (size_t i = 0; i < threads.size(); ++i)
        task_queue.push({});
    for (auto &thd : threads)
        if (thd.joinable()) thd.join();
}

size_t worker_pool::size() const {
    return threads.size();
}

void worker_pool::worker_loop(size_t worker_id) {
    DLOG(INFO) << "Worker " << worker_id << " started";
    while (true) {
        function<void()> task = task_queue.pop();
        if (!task) break;

        try {
            task();
        } catch (judge_exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed, " << ex.what() << endl
                       << ex;
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed, " << ex.what() << endl
                       << boost::diagnostic_information(ex);
        }
    }
    DLOG(INFO) << "Worker " << worker_id << " stopped";
}

}  // namespace codejudge
