#include "cache/claim_table.hpp"
#include <glog/logging.h>

namespace grader::cache {
using namespace std;

optional<graded_result> claim::wait() const {
    CHECK(handle) << "waiting on an empty claim";
    unique_lock<mutex> lock(handle->mut);
    handle->cond.wait(lock, [this] { return handle->done; });
    return handle->result;
}

optional<graded_result> claim::wait_for(chrono::milliseconds timeout) const {
    CHECK(handle) << "waiting on an empty claim";
    unique_lock<mutex> lock(handle->mut);
    if (!handle->cond.wait_for(lock, timeout, [this] { return handle->done; }))
        return nullopt;
    return handle->result;
}

claim claim_table::try_claim(const string &fingerprint) {
    scoped_lock guard(mut);
    claim c;
    c.fingerprint = fingerprint;
    auto it = flights.find(fingerprint);
    if (it != flights.end()) {
        c.owner = false;
        c.handle = it->second;
    } else {
        c.owner = true;
        c.handle = make_shared<flight>();
        flights.emplace(fingerprint, c.handle);
    }
    return c;
}

void claim_table::release(const claim &c, const optional<graded_result> &result) {
    if (!c.owner || !c.handle) return;
    {
        scoped_lock guard(mut);
        auto it = flights.find(c.fingerprint);
        // 只移除自己的 flight
        if (it != flights.end() && it->second == c.handle)
            flights.erase(it);
    }
    {
        scoped_lock lock(c.handle->mut);
        if (c.handle->done) return;
        c.handle->done = true;
        c.handle->result = result;
    }
    c.handle->cond.notify_all();
}

size_t claim_table::size() {
    scoped_lock guard(mut);
    return flights.size();
}

}  // namespace grader::cache
