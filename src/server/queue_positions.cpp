#include "server/queue_positions.hpp"
#include <algorithm>

namespace grader::server {
using namespace std;

queue_positions::queue_positions(size_t workers) : worker_count(workers) {}

size_t queue_positions::workers() const {
    return worker_count;
}

size_t queue_positions::active() {
    scoped_lock guard(mut);
    return min(worker_count, counter - done);
}

size_t queue_positions::waiting() {
    scoped_lock guard(mut);
    return id_position(counter);
}

size_t queue_positions::push(const string &key) {
    scoped_lock guard(mut);
    auto it = ids.find(key);
    if (it == ids.end())
        it = ids.emplace(key, ++counter).first;
    return id_position(it->second);
}

bool queue_positions::pop(const string &key) {
    scoped_lock guard(mut);
    auto it = ids.find(key);
    if (it == ids.end() || id_position(it->second) != 0)
        return false;
    ids.erase(it);
    ++done;
    return true;
}

optional<size_t> queue_positions::position(const string &key) {
    scoped_lock guard(mut);
    auto it = ids.find(key);
    if (it == ids.end()) return nullopt;
    return id_position(it->second);
}

size_t queue_positions::id_position(size_t id) const {
    size_t head = worker_count + done;
    return id > head ? id - head : 0;
}

}  // namespace grader::server
