#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "monitor/monitor.hpp"

/**
 * 评分 worker
 * 每个 worker 是一个线程，不断从评分队列中取出提交 id 并评分。
 * 评分服务根据配置启动固定数量的 worker，因此同时评分的提交数不会超过 worker 数。
 *
 * 评分请求的发起者放弃等待不会中断评分：提交 id 进入队列后一定会被某个 worker 处理完。
 */
namespace grader {

/**
 * @brief 处理一个提交的回调
 * @param worker_id 执行评分的 worker 编号
 * @param submission_id 提交 id
 */
typedef std::function<void(int worker_id, const std::string &submission_id)> grading_handler;

/**
 * @brief 启动评分 worker 线程
 * 在 stop 被置为真之后，worker 会处理完队列中剩余的提交再退出
 *
 * @param worker_id worker 编号，用于日志和监控
 * @param task_queue 待评分的提交 id 队列
 * @param handler 评分回调，抛出的异常会被记录并上报，不会让 worker 退出
 * @param mon 监控器
 * @param stop 停止标记
 * @return 产生的线程
 */
std::thread start_worker(int worker_id, concurrent_queue<std::string> &task_queue, grading_handler handler,
                         monitor &mon, const std::atomic<bool> &stop);

}  // namespace grader
