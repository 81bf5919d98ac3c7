#include "cache/memory_cache.hpp"
#include <stdexcept>

namespace grader::cache {
using namespace std;

cache_backend::~cache_backend() {}

memory_cache::memory_cache(size_t capacity) : capacity(capacity) {
    if (capacity == 0) throw invalid_argument("cache capacity must be positive");
}

optional<string> memory_cache::get(const string &key) {
    scoped_lock guard(mut);
    auto it = index.find(key);
    if (it == index.end()) return nullopt;
    if (it->second->expires_at <= chrono::steady_clock::now()) {
        entries.erase(it->second);
        index.erase(it);
        return nullopt;
    }
    entries.splice(entries.begin(), entries, it->second);
    return it->second->value;
}

void memory_cache::put(const string &key, const string &value, chrono::milliseconds ttl) {
    scoped_lock guard(mut);
    auto expires_at = chrono::steady_clock::now() + ttl;
    auto it = index.find(key);
    if (it != index.end()) {
        it->second->value = value;
        it->second->expires_at = expires_at;
        entries.splice(entries.begin(), entries, it->second);
        return;
    }

    entries.push_front(entry{key, value, expires_at});
    index[key] = entries.begin();
    while (entries.size() > capacity) {
        index.erase(entries.back().key);
        entries.pop_back();
    }
}

void memory_cache::erase(const string &key) {
    scoped_lock guard(mut);
    auto it = index.find(key);
    if (it == index.end()) return;
    entries.erase(it->second);
    index.erase(it);
}

size_t memory_cache::size() {
    scoped_lock guard(mut);
    return entries.size();
}

}  // namespace grader::cache
