#include "store/memory_backend.hpp"
#include <boost/throw_exception.hpp>
#include "common/exceptions.hpp"

namespace grader::store {
using namespace std;

bool memory_backend::put(const string &digest, const string &content) {
    lock_guard<mutex> guard(mut);
    return objects.emplace(digest, make_pair(content, time(nullptr))).second;
}

string memory_backend::get(const string &digest) {
    lock_guard<mutex> guard(mut);
    auto it = objects.find(digest);
    if (it == objects.end())
        BOOST_THROW_EXCEPTION(store_error("object " + digest + " does not exist"));
    return it->second.first;
}

bool memory_backend::contains(const string &digest) {
    lock_guard<mutex> guard(mut);
    return objects.count(digest);
}

bool memory_backend::remove(const string &digest) {
    lock_guard<mutex> guard(mut);
    return objects.erase(digest);
}

vector<object_info> memory_backend::list() {
    lock_guard<mutex> guard(mut);
    vector<object_info> result;
    for (auto &[digest, object] : objects)
        result.push_back({digest, object.first.size(), object.second});
    return result;
}

void memory_backend::overwrite(const string &digest, const string &content) {
    lock_guard<mutex> guard(mut);
    objects[digest].first = content;
}

}  // namespace grader::store
