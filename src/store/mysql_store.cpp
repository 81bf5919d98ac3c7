#include "store/mysql_store.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include "common/exceptions.hpp"

namespace grader::store {
using namespace std;

static const char *SUBMISSION_COLUMNS =
    "id, creator, challenge_id, challenge_version, environment, code, creation_timestamp, state, attempts, fingerprint";

static string text(const mysql_row &row, size_t i) {
    return row.at(i) ? *row.at(i) : string();
}

template <typename T>
static T number(const mysql_row &row, size_t i) {
    if (!row.at(i)) throw database_error("unexpected NULL in column " + std::to_string(i));
    return boost::lexical_cast<T>(*row.at(i));
}

static submission parse_submission(const mysql_row &row) {
    submission submit;
    submit.id = text(row, 0);
    submit.creator = text(row, 1);
    submit.challenge_id = text(row, 2);
    submit.challenge_version = number<uint32_t>(row, 3);
    submit.payload.environment = text(row, 4);
    submit.payload.code = text(row, 5);
    submit.creation_timestamp = number<int64_t>(row, 6);
    submit.state = parse_submission_state(text(row, 7));
    submit.attempts = number<unsigned>(row, 8);
    submit.fingerprint = text(row, 9);
    return submit;
}

mysql_store::mysql_store(const database_config &config) : conn(config) {}

challenge mysql_store::get_challenge(const string &id, uint32_t version) {
    scoped_lock guard(mut);
    auto rows = conn.query(fmt::format(
        "SELECT published, scoring, evaluator_environment, evaluator_code, evaluator_time_limit, evaluator_memory_limit "
        "FROM challenges WHERE id={} AND version={}",
        conn.quote(id), version));
    if (rows.empty())
        throw not_found_error(fmt::format("challenge {}@{} not found", id, version));

    challenge c;
    c.id = id;
    c.version = version;
    c.published = number<int>(rows[0], 0) != 0;
    c.policy = parse_scoring_policy(text(rows[0], 1));
    if (rows[0].at(3)) {
        evaluator_program e;
        e.environment = text(rows[0], 2);
        e.code = text(rows[0], 3);
        e.time_limit = number<uint64_t>(rows[0], 4);
        e.memory_limit = number<uint64_t>(rows[0], 5);
        c.evaluator = move(e);
    }

    auto cases = conn.query(fmt::format(
        "SELECT id, input, expected_output, checker, time_limit, memory_limit, weight FROM test_cases "
        "WHERE challenge_id={} AND challenge_version={} ORDER BY position",
        conn.quote(id), version));
    for (auto &row : cases) {
        test_case tc;
        tc.id = text(row, 0);
        tc.input = text(row, 1);
        tc.expected_output = text(row, 2);
        tc.checker = parse_checker_rule(text(row, 3));
        tc.time_limit = number<uint64_t>(row, 4);
        tc.memory_limit = number<uint64_t>(row, 5);
        tc.weight = number<unsigned>(row, 6);
        c.test_cases.push_back(move(tc));
    }
    return c;
}

optional<uint32_t> mysql_store::latest_version(const string &id) {
    scoped_lock guard(mut);
    auto rows = conn.query(fmt::format("SELECT MAX(version) FROM challenges WHERE id={}", conn.quote(id)));
    if (rows.empty() || !rows[0].at(0)) return nullopt;
    return number<uint32_t>(rows[0], 0);
}

void mysql_store::put_challenge(const challenge &c) {
    validate_challenge(c);
    scoped_lock guard(mut);
    mysql_transaction transaction(conn);
    auto existing = conn.query(fmt::format("SELECT 1 FROM challenges WHERE id={} AND version={} FOR UPDATE",
                                           conn.quote(c.id), c.version));
    if (!existing.empty())
        throw validation_error(fmt::format("challenge {}@{} already exists", c.id, c.version));

    if (c.evaluator) {
        conn.execute(fmt::format(
            "INSERT INTO challenges (id, version, published, scoring, evaluator_environment, evaluator_code, evaluator_time_limit, evaluator_memory_limit) "
            "VALUES ({}, {}, {}, {}, {}, {}, {}, {})",
            conn.quote(c.id), c.version, c.published ? 1 : 0, conn.quote(to_string(c.policy)),
            conn.quote(c.evaluator->environment), conn.quote(c.evaluator->code), c.evaluator->time_limit, c.evaluator->memory_limit));
    } else {
        conn.execute(fmt::format("INSERT INTO challenges (id, version, published, scoring) VALUES ({}, {}, {}, {})",
                                 conn.quote(c.id), c.version, c.published ? 1 : 0, conn.quote(to_string(c.policy))));
    }
    for (size_t i = 0; i < c.test_cases.size(); ++i) {
        const test_case &tc = c.test_cases[i];
        conn.execute(fmt::format(
            "INSERT INTO test_cases (challenge_id, challenge_version, position, id, input, expected_output, checker, time_limit, memory_limit, weight) "
            "VALUES ({}, {}, {}, {}, {}, {}, {}, {}, {}, {})",
            conn.quote(c.id), c.version, i, conn.quote(tc.id), conn.quote(tc.input), conn.quote(tc.expected_output),
            conn.quote(to_string(tc.checker)), tc.time_limit, tc.memory_limit, tc.weight));
    }
    transaction.commit();
}

void mysql_store::create_submission(const submission &submit) {
    scoped_lock guard(mut);
    auto existing = conn.query(fmt::format("SELECT 1 FROM submissions WHERE id={}", conn.quote(submit.id)));
    if (!existing.empty())
        throw validation_error("submission " + submit.id + " already exists");
    conn.execute(fmt::format(
        "INSERT INTO submissions (id, creator, challenge_id, challenge_version, environment, code, creation_timestamp, state, attempts) "
        "VALUES ({}, {}, {}, {}, {}, {}, {}, 'pending', 0)",
        conn.quote(submit.id), conn.quote(submit.creator), conn.quote(submit.challenge_id), submit.challenge_version,
        conn.quote(submit.payload.environment), conn.quote(submit.payload.code), submit.creation_timestamp));
}

submission mysql_store::get_submission_nolock(const string &id) {
    auto rows = conn.query(fmt::format("SELECT {} FROM submissions WHERE id={}", SUBMISSION_COLUMNS, conn.quote(id)));
    if (rows.empty())
        throw not_found_error("submission " + id + " not found");
    return parse_submission(rows[0]);
}

submission mysql_store::get_submission(const string &id) {
    scoped_lock guard(mut);
    return get_submission_nolock(id);
}

void mysql_store::mark_running(const string &id, const string &fingerprint) {
    scoped_lock guard(mut);
    uint64_t affected = conn.execute(fmt::format(
        "UPDATE submissions SET state='running', fingerprint={} WHERE id={} AND state<>'completed'",
        conn.quote(fingerprint), conn.quote(id)));
    if (affected == 0) get_submission_nolock(id);  // 提交不存在时抛出 not_found_error
}

unsigned mysql_store::mark_pending(const string &id) {
    scoped_lock guard(mut);
    conn.execute(fmt::format(
        "UPDATE submissions SET state='pending', attempts=attempts+1 WHERE id={} AND state<>'completed'",
        conn.quote(id)));
    return get_submission_nolock(id).attempts;
}

void mysql_store::mark_failed(const string &id, const string &reason) {
    scoped_lock guard(mut);
    uint64_t affected = conn.execute(fmt::format(
        "UPDATE submissions SET state='failed', failure_reason={} WHERE id={} AND state<>'completed'",
        conn.quote(reason), conn.quote(id)));
    if (affected == 0) get_submission_nolock(id);
}

graded_result mysql_store::commit_result(const string &id, const graded_result &result) {
    scoped_lock guard(mut);
    mysql_transaction transaction(conn);

    auto rows = conn.query(fmt::format("SELECT state FROM submissions WHERE id={} FOR UPDATE", conn.quote(id)));
    if (rows.empty())
        throw not_found_error("submission " + id + " not found");
    if (parse_submission_state(text(rows[0], 0)) == submission_state::COMPLETED) {
        auto stored = get_result_nolock(id);
        if (!stored) throw database_error("submission " + id + " is completed without a result");
        transaction.commit();
        return *stored;
    }

    conn.execute(fmt::format(
        "INSERT INTO results (submission_id, fingerprint, verdict, score_num, score_den, passed, total, cached) "
        "VALUES ({}, {}, {}, {}, {}, {}, {}, {})",
        conn.quote(id), conn.quote(result.fingerprint), conn.quote(to_string(result.verdict)),
        result.score.numerator(), result.score.denominator(), result.passed, result.total, result.cached ? 1 : 0));
    for (size_t i = 0; i < result.results.size(); ++i) {
        const execution_result &r = result.results[i];
        conn.execute(fmt::format(
            "INSERT INTO execution_results (submission_id, position, test_case_id, verdict, exit_code, stdout, stderr, time_used, memory_used, reason) "
            "VALUES ({}, {}, {}, {}, {}, {}, {}, {}, {}, {})",
            conn.quote(id), i, conn.quote(r.test_case_id), conn.quote(to_string(r.verdict)), r.exit_code,
            conn.quote(r.stdout_output), conn.quote(r.stderr_output), r.time_used, r.memory_used,
            r.reason ? conn.quote(*r.reason) : string("NULL")));
    }
    conn.execute(fmt::format(
        "UPDATE submissions SET state='completed', fingerprint={} WHERE id={}",
        conn.quote(result.fingerprint), conn.quote(id)));
    transaction.commit();
    return result;
}

optional<graded_result> mysql_store::get_result_nolock(const string &id) {
    auto rows = conn.query(fmt::format(
        "SELECT fingerprint, verdict, score_num, score_den, passed, total, cached FROM results WHERE submission_id={}",
        conn.quote(id)));
    if (rows.empty()) return nullopt;

    graded_result result;
    result.fingerprint = text(rows[0], 0);
    result.verdict = parse_verdict(text(rows[0], 1));
    result.score = boost::rational<int>(number<int>(rows[0], 2), number<int>(rows[0], 3));
    result.passed = number<size_t>(rows[0], 4);
    result.total = number<size_t>(rows[0], 5);
    result.cached = number<int>(rows[0], 6) != 0;

    auto executions = conn.query(fmt::format(
        "SELECT test_case_id, verdict, exit_code, stdout, stderr, time_used, memory_used, reason "
        "FROM execution_results WHERE submission_id={} ORDER BY position",
        conn.quote(id)));
    for (auto &row : executions) {
        execution_result r;
        r.test_case_id = text(row, 0);
        r.verdict = parse_verdict(text(row, 1));
        r.exit_code = number<int>(row, 2);
        r.stdout_output = text(row, 3);
        r.stderr_output = text(row, 4);
        r.time_used = number<uint64_t>(row, 5);
        r.memory_used = number<uint64_t>(row, 6);
        r.reason = row.at(7);
        result.results.push_back(move(r));
    }
    return result;
}

optional<graded_result> mysql_store::get_result(const string &id) {
    scoped_lock guard(mut);
    get_submission_nolock(id);
    return get_result_nolock(id);
}

vector<submission> mysql_store::list_unfinished() {
    scoped_lock guard(mut);
    auto rows = conn.query(fmt::format(
        "SELECT {} FROM submissions WHERE state IN ('pending', 'running') ORDER BY creation_timestamp", SUBMISSION_COLUMNS));
    vector<submission> unfinished;
    for (auto &row : rows) unfinished.push_back(parse_submission(row));
    return unfinished;
}

vector<submission> mysql_store::list_submissions(const string &challenge_id, const string &creator) {
    scoped_lock guard(mut);
    auto rows = conn.query(fmt::format(
        "SELECT {} FROM submissions WHERE challenge_id={} AND creator={} ORDER BY creation_timestamp DESC",
        SUBMISSION_COLUMNS, conn.quote(challenge_id), conn.quote(creator)));
    vector<submission> history;
    for (auto &row : rows) history.push_back(parse_submission(row));
    return history;
}

}  // namespace grader::store
