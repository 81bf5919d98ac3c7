#include "cache/result_cache.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"

namespace grader::cache {
using namespace std;
using namespace nlohmann;

result_cache::result_cache(shared_ptr<cache_backend> backend, chrono::milliseconds ttl)
    : backend(move(backend)), ttl(ttl) {}

optional<graded_result> result_cache::get(const string &fingerprint) {
    optional<string> value;
    try {
        value = backend->get(fingerprint);
    } catch (std::exception &ex) {
        LOG(WARNING) << "Unable to read cached result of " << fingerprint << ", treating as a miss: " << ex.what();
        return nullopt;
    }
    if (!value) return nullopt;

    try {
        graded_result result = json::parse(*value).get<graded_result>();
        if (result.fingerprint != fingerprint) {
            LOG(WARNING) << "Cached result under " << fingerprint << " belongs to " << result.fingerprint << ", ignoring";
            return nullopt;
        }
        result.cached = true;
        return result;
    } catch (std::exception &ex) {
        LOG(WARNING) << "Malformed cached result of " << fingerprint << ", treating as a miss: " << ex.what();
        return nullopt;
    }
}

void result_cache::put(const string &fingerprint, const graded_result &result) {
    optional<graded_result> existing = get(fingerprint);
    if (existing && !same_outcome(*existing, result)) {
        throw invariant_violation("divergent graded results for fingerprint " + fingerprint);
    }

    graded_result stored = result;
    stored.cached = false;
    try {
        backend->put(fingerprint, json(stored).dump(), ttl);
    } catch (std::exception &ex) {
        LOG(WARNING) << "Unable to cache result of " << fingerprint << ": " << ex.what();
    }
}

claim result_cache::try_claim(const string &fingerprint) {
    return claims.try_claim(fingerprint);
}

void result_cache::release(const claim &c, const optional<graded_result> &result) {
    claims.release(c, result);
}

size_t result_cache::claimed() {
    return claims.size();
}

}  // namespace grader::cache
