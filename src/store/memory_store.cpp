#include "store/memory_store.hpp"
#include <glog/logging.h>
#include <algorithm>
#include "common/exceptions.hpp"

namespace grader::store {
using namespace std;

challenge_store::~challenge_store() {}

submission_store::~submission_store() {}

challenge memory_store::get_challenge(const string &id, uint32_t version) {
    scoped_lock guard(mut);
    auto it = challenges.find({id, version});
    if (it == challenges.end())
        throw not_found_error("challenge " + id + "@" + std::to_string(version) + " not found");
    return it->second;
}

optional<uint32_t> memory_store::latest_version(const string &id) {
    scoped_lock guard(mut);
    optional<uint32_t> latest;
    for (auto &[key, c] : challenges)
        if (key.first == id) latest = key.second;
    return latest;
}

void memory_store::put_challenge(const challenge &c) {
    validate_challenge(c);
    scoped_lock guard(mut);
    if (challenges.count({c.id, c.version}))
        throw validation_error("challenge " + c.id + "@" + std::to_string(c.version) + " already exists");
    challenges.emplace(make_pair(c.id, c.version), c);
}

submission &memory_store::find_submission(const string &id) {
    auto it = submissions.find(id);
    if (it == submissions.end())
        throw not_found_error("submission " + id + " not found");
    return it->second;
}

void memory_store::create_submission(const submission &submit) {
    scoped_lock guard(mut);
    if (submissions.count(submit.id))
        throw validation_error("submission " + submit.id + " already exists");
    submission stored = submit;
    stored.state = submission_state::PENDING;
    stored.attempts = 0;
    submissions.emplace(submit.id, move(stored));
}

submission memory_store::get_submission(const string &id) {
    scoped_lock guard(mut);
    return find_submission(id);
}

void memory_store::mark_running(const string &id, const string &fingerprint) {
    scoped_lock guard(mut);
    submission &submit = find_submission(id);
    if (submit.state == submission_state::COMPLETED) return;
    submit.state = submission_state::RUNNING;
    submit.fingerprint = fingerprint;
}

unsigned memory_store::mark_pending(const string &id) {
    scoped_lock guard(mut);
    submission &submit = find_submission(id);
    if (submit.state == submission_state::COMPLETED) return submit.attempts;
    submit.state = submission_state::PENDING;
    return ++submit.attempts;
}

void memory_store::mark_failed(const string &id, const string &reason) {
    scoped_lock guard(mut);
    submission &submit = find_submission(id);
    if (submit.state == submission_state::COMPLETED) return;
    LOG(WARNING) << "Submission " << id << " failed: " << reason;
    submit.state = submission_state::FAILED;
}

graded_result memory_store::commit_result(const string &id, const graded_result &result) {
    scoped_lock guard(mut);
    submission &submit = find_submission(id);
    if (submit.state == submission_state::COMPLETED)
        return results.at(id);
    submit.state = submission_state::COMPLETED;
    submit.fingerprint = result.fingerprint;
    results[id] = result;
    return result;
}

optional<graded_result> memory_store::get_result(const string &id) {
    scoped_lock guard(mut);
    find_submission(id);
    auto it = results.find(id);
    if (it == results.end()) return nullopt;
    return it->second;
}

vector<submission> memory_store::list_unfinished() {
    scoped_lock guard(mut);
    vector<submission> unfinished;
    for (auto &[id, submit] : submissions)
        if (submit.state == submission_state::PENDING || submit.state == submission_state::RUNNING)
            unfinished.push_back(submit);
    stable_sort(unfinished.begin(), unfinished.end(), [](const submission &a, const submission &b) {
        return a.creation_timestamp < b.creation_timestamp;
    });
    return unfinished;
}

vector<submission> memory_store::list_submissions(const string &challenge_id, const string &creator) {
    scoped_lock guard(mut);
    vector<submission> history;
    for (auto &[id, submit] : submissions)
        if (submit.challenge_id == challenge_id && submit.creator == creator)
            history.push_back(submit);
    stable_sort(history.begin(), history.end(), [](const submission &a, const submission &b) {
        return a.creation_timestamp > b.creation_timestamp;
    });
    return history;
}

size_t memory_store::result_count() {
    scoped_lock guard(mut);
    return results.size();
}

}  // namespace grader::store
