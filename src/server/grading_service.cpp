#include "server/grading_service.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "worker.hpp"

namespace grader::server {
using namespace std;

grading_service::grading_service(store::challenge_store &challenges,
                                 store::submission_store &submissions,
                                 grading_orchestrator &orchestrator,
                                 client::execution_client &executor,
                                 monitor &mon,
                                 const grading_config &config)
    : challenges(challenges), submissions(submissions), orchestrator(orchestrator), executor(executor),
      mon(mon), config(config), positions(config.workers) {}

grading_service::~grading_service() {
    stop();
}

submission_receipt grading_service::create_submission(const submission_request &request) {
    const string &code = request.payload.code;
    if (code.empty())
        throw validation_error("code must not be empty");
    if (code.size() > config.max_code_size)
        throw validation_error("code is longer than " + std::to_string(config.max_code_size) + " bytes");
    if (!utf8_check_is_valid(code))
        throw validation_error("code is not valid UTF-8");

    set<string> environments = executor.environments();
    if (!environments.count(request.payload.environment))
        throw validation_error("environment " + request.payload.environment + " is not supported");

    uint32_t version;
    if (request.challenge_version) {
        version = *request.challenge_version;
    } else {
        optional<uint32_t> latest = challenges.latest_version(request.challenge_id);
        if (!latest) throw not_found_error("challenge " + request.challenge_id + " does not exist");
        version = *latest;
    }
    // 题目版本必须存在并且已经发布
    orchestrator.load_challenge(request.challenge_id, version);

    submission submit;
    submit.id = new_uuid();
    submit.creator = request.creator;
    submit.challenge_id = request.challenge_id;
    submit.challenge_version = version;
    submit.payload = request.payload;
    submit.creation_timestamp = now_millis();
    submit.state = submission_state::PENDING;

    submissions.create_submission(submit);
    LOG(INFO) << "Created " << submit << " by " << submit.creator;

    submission_receipt receipt;
    receipt.queue_position = enqueue(submit.id);
    receipt.submit = move(submit);
    return receipt;
}

result_status grading_service::get_result(const string &submission_id) {
    submission submit = submissions.get_submission(submission_id);

    result_status status;
    status.state = submit.state;
    if (submit.state == submission_state::COMPLETED)
        status.result = submissions.get_result(submission_id);
    else if (submit.state != submission_state::FAILED)
        status.queue_position = positions.position(submission_id);
    return status;
}

vector<submission> grading_service::list_submissions(const string &challenge_id, const string &creator) {
    return submissions.list_submissions(challenge_id, creator);
}

queue_status grading_service::status() {
    queue_status s;
    s.workers = positions.workers();
    s.active = positions.active();
    s.waiting = positions.waiting();
    return s;
}

void grading_service::start(bool poll) {
    stopping = false;
    for (size_t i = 0; i < config.workers; ++i) {
        threads.push_back(start_worker(
            (int)i, task_queue,
            [this](int worker_id, const string &submission_id) { process(worker_id, submission_id); },
            mon, stopping));
    }
    threads.emplace_back([this] { retry_loop(); });
    if (poll && config.poll_interval.count() > 0)
        threads.emplace_back([this] { poll_loop(); });
    LOG(INFO) << "Grading service started with " << config.workers << " workers";
}

void grading_service::stop() {
    if (threads.empty()) return;
    {
        scoped_lock guard(retry_mutex);
        stopping = true;
    }
    retry_cond.notify_all();
    task_queue.close();
    for (auto &th : threads)
        if (th.joinable()) th.join();
    threads.clear();
    LOG(INFO) << "Grading service stopped";
}

size_t grading_service::resume(bool include_running) {
    size_t count = 0;
    for (const submission &submit : submissions.list_unfinished()) {
        if (submit.state == submission_state::RUNNING && !include_running) continue;
        scoped_lock guard(queue_mutex);
        if (queued.count(submit.id)) continue;
        queued.insert(submit.id);
        positions.push(submit.id);
        task_queue.push(submit.id);
        ++count;
    }
    if (count > 0) LOG(INFO) << "Resumed " << count << " unfinished submissions";
    return count;
}

size_t grading_service::enqueue(const string &submission_id) {
    // 排队位置和评分队列必须以相同的顺序入队
    scoped_lock guard(queue_mutex);
    if (queued.count(submission_id)) {
        optional<size_t> position = positions.position(submission_id);
        return position ? *position : 0;
    }
    queued.insert(submission_id);
    size_t position = positions.push(submission_id);
    task_queue.push(submission_id);
    return position;
}

void grading_service::process(int worker_id, const string &submission_id) {
    bool retrying = false;
    defer {
        {
            scoped_lock guard(queue_mutex);
            positions.pop(submission_id);
            // 等待重试的提交仍然占着 queued，轮询不会重复入队
            if (!retrying) queued.erase(submission_id);
        }
        // 出队之后才能重新入队，否则排队位置会错乱
        if (retrying) schedule_retry(submission_id);
    };

    DLOG(INFO) << "Worker " << worker_id << " picks submission " << submission_id;
    try {
        orchestrator.grade(submission_id);
    } catch (infrastructure_error &ex) {
        retrying = handle_interruption(submission_id, ex.what());
    } catch (not_found_error &ex) {
        LOG(ERROR) << "Unable to grade submission " << submission_id << ": " << ex.what();
    } catch (validation_error &ex) {
        LOG(WARNING) << "Submission " << submission_id << " is rejected: " << ex.what();
    } catch (invariant_violation &ex) {
        LOG(ERROR) << "Grading of submission " << submission_id << " broke an invariant: " << ex.what() << endl
                   << boost::diagnostic_information(ex);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Grading of submission " << submission_id << " failed unexpectedly: " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        retrying = handle_interruption(submission_id, ex.what());
    }
}

bool grading_service::handle_interruption(const string &submission_id, const string &reason) {
    submission submit;
    try {
        submit = submissions.get_submission(submission_id);
    } catch (infrastructure_error &ex) {
        // 存储不可用时无法得知尝试次数，稍后再试
        LOG(WARNING) << "Unable to load submission " << submission_id << ": " << ex.what();
        return true;
    }

    if (submit.state != submission_state::PENDING && submit.state != submission_state::RUNNING)
        return false;

    if (submit.attempts >= config.max_attempts) {
        string message = "giving up after " + std::to_string(submit.attempts) + " attempts: " + reason;
        try {
            submissions.mark_failed(submission_id, message);
        } catch (infrastructure_error &ex) {
            LOG(ERROR) << "Unable to mark " << submit << " as failed: " << ex.what();
            return true;
        }
        mon.submission_interrupted(submit, submit.attempts, true, reason);
        mon.report_error(fmt::format("submission {} failed permanently: {}", submission_id, reason));
        return false;
    }

    LOG(WARNING) << submit << " will be retried in " << config.retry_delay.count() << "ms: " << reason;
    return true;
}

void grading_service::schedule_retry(const string &submission_id) {
    {
        scoped_lock guard(retry_mutex);
        retries.emplace(chrono::steady_clock::now() + config.retry_delay, submission_id);
    }
    retry_cond.notify_all();
}

void grading_service::retry_loop() {
    unique_lock lock(retry_mutex);
    while (!stopping) {
        if (retries.empty()) {
            retry_cond.wait(lock);
            continue;
        }
        auto due = retries.begin()->first;
        if (chrono::steady_clock::now() < due) {
            retry_cond.wait_until(lock, due);
            continue;
        }
        string submission_id = retries.begin()->second;
        retries.erase(retries.begin());
        lock.unlock();
        {
            scoped_lock guard(queue_mutex);
            positions.push(submission_id);
            task_queue.push(submission_id);
        }
        DLOG(INFO) << "Submission " << submission_id << " is queued for retry";
        lock.lock();
    }
}

void grading_service::poll_loop() {
    while (!stopping) {
        try {
            resume(false);
        } catch (infrastructure_error &ex) {
            LOG(WARNING) << "Unable to poll pending submissions: " << ex.what();
        }

        unique_lock lock(retry_mutex);
        retry_cond.wait_for(lock, config.poll_interval, [this] { return stopping.load(); });
    }
}

}  // namespace grader::server
