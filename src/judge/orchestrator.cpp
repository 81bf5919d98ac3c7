#include "judge/orchestrator.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "judge/classify.hpp"
#include "judge/evaluator.hpp"
#include "judge/fingerprint.hpp"
#include "judge/scoring.hpp"

namespace grader {
using namespace std;

grading_orchestrator::grading_orchestrator(store::challenge_store &challenges,
                                           store::submission_store &submissions,
                                           cache::result_cache &cache,
                                           client::execution_client &executor,
                                           monitor &mon,
                                           const grading_config &config)
    : challenges(challenges), submissions(submissions), cache(cache), executor(executor), mon(mon), config(config) {}

challenge grading_orchestrator::load_challenge(const string &challenge_id, uint32_t version) {
    challenge c = challenges.get_challenge(challenge_id, version);
    if (!c.published)
        throw not_found_error("challenge " + challenge_id + "@" + std::to_string(version) + " is not published");
    return c;
}

graded_result grading_orchestrator::grade(const string &submission_id) {
    submission submit = submissions.get_submission(submission_id);

    if (submit.state == submission_state::COMPLETED) {
        optional<graded_result> stored = submissions.get_result(submission_id);
        if (!stored) throw database_error("submission " + submission_id + " is completed without a result");
        DLOG(INFO) << submit << " has already been graded";
        return *stored;
    }
    if (submit.state == submission_state::FAILED)
        throw infrastructure_error("submission " + submission_id + " has failed permanently");

    challenge c = load_challenge(submit.challenge_id, submit.challenge_version);
    string fingerprint = compute_fingerprint(c, submit.payload);

    for (unsigned round = 0;; ++round) {
        if (optional<graded_result> hit = cache.get(fingerprint)) {
            DLOG(INFO) << submit << " hits cached result " << fingerprint;
            graded_result stored = commit(submit, *hit);
            mon.end_submission(submit, stored);
            return stored;
        }

        cache::claim cl = cache.try_claim(fingerprint);
        if (cl.owner)
            return grade_as_owner(submit, c, cl);

        DLOG(INFO) << submit << " waits for the running grading of " << fingerprint;
        if (optional<graded_result> published = cl.wait()) {
            published->cached = true;
            graded_result stored = commit(submit, *published);
            mon.end_submission(submit, stored);
            return stored;
        }

        if (round >= config.claim_retries) {
            string reason = "grading of fingerprint " + fingerprint + " keeps failing";
            interrupt(submit, reason);
            throw infrastructure_error(reason);
        }
        LOG(WARNING) << "Grading of " << fingerprint << " failed in another submission, " << submit << " retries the claim";
    }
}

graded_result grading_orchestrator::grade_as_owner(const submission &submit, const challenge &c, const cache::claim &cl) {
    bool released = false;
    // 任何异常都必须释放占用，否则等待同一指纹的提交永远不会被唤醒
    defer {
        if (!released) cache.release(cl, nullopt);
    };

    // 在我们占用指纹之前，上一个 owner 可能刚刚写完缓存
    if (optional<graded_result> hit = cache.get(cl.fingerprint)) {
        graded_result stored = commit(submit, *hit);
        cache.release(cl, stored);
        released = true;
        mon.end_submission(submit, stored);
        return stored;
    }

    try {
        submissions.mark_running(submit.id, cl.fingerprint);
    } catch (not_found_error &) {
        throw;
    } catch (std::exception &ex) {
        interrupt(submit, ex.what());
        throw;
    }
    mon.start_submission(submit);

    elapsed_time timer;
    graded_result graded;
    try {
        graded = aggregate(c, run_test_cases(c, submit.payload), cl.fingerprint);
    } catch (validation_error &ex) {
        LOG(WARNING) << submit << " cannot be graded: " << ex.what();
        try {
            submissions.mark_failed(submit.id, ex.what());
        } catch (infrastructure_error &store_ex) {
            LOG(ERROR) << "Unable to mark " << submit << " as failed: " << store_ex.what();
        }
        mon.submission_interrupted(submit, submit.attempts, true, ex.what());
        throw;
    } catch (infrastructure_error &ex) {
        interrupt(submit, ex.what());
        throw;
    } catch (std::exception &ex) {
        // 其他错误同样中断评分，否则提交会一直停留在 running
        LOG(ERROR) << "Unexpected error while grading " << submit << ": " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        interrupt(submit, ex.what());
        throw;
    }

    DLOG(INFO) << submit << " ran " << graded.results.size() << " test cases in "
               << timer.duration<chrono::milliseconds>().count() << "ms";

    graded_result stored = commit(submit, graded);

    // 评分结果已经持久化，之后才允许写入缓存
    try {
        cache.put(cl.fingerprint, stored);
    } catch (invariant_violation &ex) {
        LOG(ERROR) << "Invariant violated while grading " << submit << ": " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        mon.report_error(string("invariant violation: ") + ex.what());
        throw;
    }

    cache.release(cl, stored);
    released = true;
    mon.end_submission(submit, stored);
    return stored;
}

vector<execution_result> grading_orchestrator::run_test_cases(const challenge &c, const submission_payload &payload) {
    vector<execution_result> results(c.test_cases.size());

    optional<evaluator> eval;
    string code = payload.code;
    if (c.evaluator) {
        eval.emplace(executor, *c.evaluator);
        prepare_result prepared = eval->prepare(payload);
        if (prepared.verdict != verdict::OK) {
            DLOG(INFO) << "Evaluator of " << c << " rejects the submission: " << prepared.reason.value_or("");
            for (size_t i = 0; i < c.test_cases.size(); ++i)
                results[i] = rejected(c.test_cases[i], prepared.verdict, prepared.reason);
            return results;
        }
        code = move(prepared.code);
    }

    output_checker checker = [&eval](const test_case &tc, const string &output) {
        if (tc.checker == checker_rule::EVALUATOR) return eval->check(tc, output);
        return compare_output(tc.checker, tc.expected_output, output);
    };

    atomic<size_t> next{0};
    atomic<bool> aborted{false};
    mutex error_mutex;
    exception_ptr error;

    auto run = [&] {
        while (!aborted) {
            size_t i = next++;
            if (i >= c.test_cases.size()) break;
            const test_case &tc = c.test_cases[i];
            try {
                client::execution_limits limits{tc.time_limit, tc.memory_limit};
                results[i] = classify(tc, executor.execute(code, tc.input, payload.environment, limits), checker);
            } catch (std::exception &) {
                // 一个测试点失败就没有必要继续运行其他测试点
                scoped_lock guard(error_mutex);
                if (!error) error = current_exception();
                aborted = true;
            }
        }
    };

    size_t parallelism = min(config.max_parallel_tests, c.test_cases.size());
    vector<thread> threads;
    for (size_t i = 1; i < parallelism; ++i)
        threads.emplace_back(run);
    run();
    for (auto &th : threads) th.join();

    if (error) rethrow_exception(error);
    return results;
}

graded_result grading_orchestrator::commit(const submission &submit, const graded_result &result) {
    try {
        return submissions.commit_result(submit.id, result);
    } catch (not_found_error &) {
        throw;
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to commit the result of " << submit << ": " << ex.what();
        interrupt(submit, ex.what());
        throw;
    }
}

void grading_orchestrator::interrupt(const submission &submit, const string &reason) {
    try {
        unsigned attempts = submissions.mark_pending(submit.id);
        mon.submission_interrupted(submit, attempts, false, reason);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to return " << submit << " to pending: " << ex.what();
    }
}

}  // namespace grader
