#include "store/maintenance.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "store/digest.hpp"

namespace grader::store {
using namespace std;

reference_source::~reference_source() = default;

gc_report collect_garbage(backend &objects, const vector<reference_source *> &sources, const gc_options &options) {
    gc_report report;

    time_t snapshot_time = time(nullptr);
    vector<object_info> snapshot = objects.list();
    report.scanned = snapshot.size();

    set<string> referenced;
    for (reference_source *source : sources) {
        size_t before = referenced.size();
        source->enumerate(referenced);
        LOG(INFO) << "Garbage collection: " << source->name() << " references " << referenced.size() - before << " new objects";
    }

    for (auto &object : snapshot) {
        if (referenced.count(object.digest)) continue;
        if (snapshot_time - object.stored_at < options.min_age.count()) continue;

        ++report.orphans;
        report.bytes += object.size;
        if (options.dry_run) continue;

        if (objects.remove(object.digest)) {
            ++report.deleted;
            DLOG(INFO) << "Garbage collection: removed object " << object.digest;
        }
    }

    LOG(INFO) << "Garbage collection: scanned " << report.scanned << " objects, "
              << report.orphans << " orphans (" << report.bytes << " bytes), deleted " << report.deleted;
    return report;
}

vector<string> verify_objects(backend &objects, bool remove) {
    vector<string> mismatches;
    for (auto &object : objects.list()) {
        string actual;
        try {
            actual = compute_digest(objects.get(object.digest));
        } catch (store_error &e) {
            LOG(WARNING) << "Unable to verify object " << object.digest << ": " << e.what();
            continue;
        }
        if (actual == object.digest) continue;

        LOG(ERROR) << "Object " << object.digest << " is corrupted, content digest is " << actual;
        mismatches.push_back(object.digest);
        if (remove) objects.remove(object.digest);
    }
    return mismatches;
}

}  // namespace grader::store
