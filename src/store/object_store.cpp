#include "store/object_store.hpp"
#include <glog/logging.h>
#include <boost/throw_exception.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "store/digest.hpp"

namespace grader::store {
using namespace std;

object_store::object_store(unique_ptr<backend> durable, unique_ptr<backend> cache)
    : durable(move(durable)), cache(move(cache)) {}

string object_store::put(const string &content) {
    string digest = compute_digest(content);
    if (durable->put(digest, content))
        DLOG(INFO) << "Stored object " << digest << " (" << content.size() << " bytes)";
    if (cache) cache->put(digest, content);
    return digest;
}

string object_store::fetch(const string &digest) {
    if (cache && cache->contains(digest)) {
        string content = cache->get(digest);
        string actual = compute_digest(content);
        if (actual == digest) return content;

        // 缓存损坏时丢弃缓存中的副本，持久化后端的副本仍然需要校验
        LOG(WARNING) << "Cached copy of object " << digest << " is corrupted, falling through";
        cache->remove(digest);
    }

    string content = durable->get(digest);
    string actual = compute_digest(content);
    if (actual != digest)
        BOOST_THROW_EXCEPTION(corrupted_object_error(digest, actual));
    if (cache) cache->put(digest, content);
    return content;
}

string object_store::get(const string &digest) {
    if (!is_valid_digest(digest))
        BOOST_THROW_EXCEPTION(store_error("invalid digest " + digest));
    return fetch(digest);
}

void object_store::get_to_file(const string &digest, const filesystem::path &path) {
    write_file_content(path, get(digest));
}

bool object_store::contains(const string &digest) {
    if (!is_valid_digest(digest)) return false;
    return (cache && cache->contains(digest)) || durable->contains(digest);
}

size_t object_store::size() {
    return durable->list().size();
}

bool object_store::remove(const string &digest) {
    if (cache) cache->remove(digest);
    return durable->remove(digest);
}

bool object_store::remove_from_cache(const string &digest) {
    return cache && cache->remove(digest);
}

void object_store::precache(const string &digest) {
    if (cache && cache->contains(digest)) return;
    get(digest);
}

backend &object_store::durable_backend() {
    return *durable;
}

}  // namespace grader::store
