#include "judge/fingerprint.hpp"
#include <boost/lexical_cast.hpp>
#include <boost/uuid/name_generator_sha1.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace grader {
using namespace std;

// 所有指纹共用的命名空间，修改后所有缓存都会失效
static const boost::uuids::uuid fingerprint_namespace =
    boost::uuids::string_generator()("3f0c5b52-7d2e-4d7a-9a8e-6f1b2c4d9e01");

static void append_field(string &canonical, const string &field) {
    canonical += std::to_string(field.size());
    canonical += ':';
    canonical += field;
    canonical += ';';
}

string compute_fingerprint(const string &challenge_id, uint32_t challenge_version, const submission_payload &payload) {
    string canonical;
    canonical.reserve(payload.code.size() + challenge_id.size() + payload.environment.size() + 64);
    append_field(canonical, "challenge");
    append_field(canonical, challenge_id);
    append_field(canonical, std::to_string(challenge_version));
    append_field(canonical, payload.environment);
    append_field(canonical, payload.code);

    boost::uuids::name_generator_sha1 generator(fingerprint_namespace);
    return boost::lexical_cast<string>(generator(canonical));
}

string compute_fingerprint(const challenge &c, const submission_payload &payload) {
    return compute_fingerprint(c.id, c.version, payload);
}

}  // namespace grader
