#include "store/filesystem_backend.hpp"
#include <glog/logging.h>
#include <boost/throw_exception.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "store/digest.hpp"

namespace grader::store {
using namespace std;
namespace fs = std::filesystem;

backend::~backend() = default;

filesystem_backend::filesystem_backend(const fs::path &root) : root(root) {
    fs::create_directories(root);
}

fs::path filesystem_backend::path_of(const string &digest) const {
    if (!is_valid_digest(digest))
        BOOST_THROW_EXCEPTION(store_error("invalid digest " + digest));
    return root / digest;
}

bool filesystem_backend::put(const string &digest, const string &content) {
    fs::path target = path_of(digest);
    if (fs::exists(target)) return false;

    fs::path temp = root / (".tmp-" + random_id());
    try {
        write_file_content(temp, content);
        fs::rename(temp, target);
    } catch (system_error &e) {
        error_code ec;
        fs::remove(temp, ec);
        BOOST_THROW_EXCEPTION(store_error("unable to store object " + digest + ": " + e.what()));
    }
    return true;
}

string filesystem_backend::get(const string &digest) {
    fs::path target = path_of(digest);
    if (!fs::exists(target))
        BOOST_THROW_EXCEPTION(store_error("object " + digest + " does not exist"));
    try {
        return read_file_content(target);
    } catch (system_error &e) {
        BOOST_THROW_EXCEPTION(store_error("unable to read object " + digest + ": " + e.what()));
    }
}

bool filesystem_backend::contains(const string &digest) {
    return fs::exists(path_of(digest));
}

bool filesystem_backend::remove(const string &digest) {
    return fs::remove(path_of(digest));
}

vector<object_info> filesystem_backend::list() {
    vector<object_info> objects;
    for (auto &entry : fs::directory_iterator(root)) {
        string name = entry.path().filename().string();
        // 跳过临时文件和其他无关的文件
        if (!entry.is_regular_file() || !is_valid_digest(name)) continue;
        try {
            objects.push_back({name, (size_t)entry.file_size(), grader::last_write_time(entry.path())});
        } catch (fs::filesystem_error &e) {
            // 对象在遍历过程中被删除
            LOG(WARNING) << "Object " << name << " vanished while listing: " << e.what();
        } catch (system_error &e) {
            LOG(WARNING) << "Object " << name << " vanished while listing: " << e.what();
        }
    }
    return objects;
}

}  // namespace grader::store
