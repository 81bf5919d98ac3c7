#include "judge/submission.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const submission &submit) {
    // 不返回代码内容
    j = {{"id", submit.id},
         {"creator", submit.creator},
         {"challenge_id", submit.challenge_id},
         {"challenge_version", submit.challenge_version},
         {"environment", submit.payload.environment},
         {"creation_timestamp", submit.creation_timestamp},
         {"state", to_string(submit.state)},
         {"attempts", submit.attempts}};
}

}  // namespace grader
