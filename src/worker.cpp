#include "worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <chrono>

namespace grader {
using namespace std;

/**
 * @brief worker 线程函数
 * 队列为空时最多阻塞 100ms，然后检查停止标记
 */
static void worker_loop(int worker_id, concurrent_queue<string> &task_queue, const grading_handler &handler,
                        monitor &mon, const atomic<bool> &stop) {
    mon.worker_state_changed(worker_id, worker_state::START, "");

    while (true) {
        string submission_id;
        if (!task_queue.pop_for(submission_id, chrono::milliseconds(100))) {
            // 如果需要停止 worker，在评分队列为空时自然退出 worker。
            if (stop) break;
            continue;
        }

        mon.worker_state_changed(worker_id, worker_state::GRADING, submission_id);
        try {
            handler(worker_id, submission_id);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed when grading " << submission_id << ", " << ex.what() << endl
                       << boost::diagnostic_information(ex);
            mon.worker_state_changed(worker_id, worker_state::CRASHED, ex.what());
        }
        mon.worker_state_changed(worker_id, worker_state::IDLE, "");
    }

    mon.worker_state_changed(worker_id, worker_state::STOPPED, "");
}

thread start_worker(int worker_id, concurrent_queue<string> &task_queue, grading_handler handler,
                    monitor &mon, const atomic<bool> &stop) {
    return thread([worker_id, &task_queue, handler = move(handler), &mon, &stop] {
        worker_loop(worker_id, task_queue, handler, mon, stop);
    });
}

}  // namespace grader
