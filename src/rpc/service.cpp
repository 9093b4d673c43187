#include "rpc/service.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>

namespace grader::rpc {
using namespace std;

service::service(const string &name) : service_name(name) {}

void service::bind(const string &method_name, method handler) {
    methods[method_name] = move(handler);
}

const string &service::name() const {
    return service_name;
}

response service::handle(const request &req) {
    auto it = methods.find(req.method);
    if (it == methods.end()) {
        LOG(WARNING) << service_name << ": unknown method " << req.method << " in request " << req.id;
        return response::fail("unknown method " + req.method);
    }

    try {
        return response::ok(it->second(req.arguments));
    } catch (std::exception &ex) {
        LOG(WARNING) << service_name << "." << req.method << " failed for request " << req.id << ": " << ex.what() << endl
                     << boost::diagnostic_information(ex);
        return response::fail(ex.what());
    }
}

}  // namespace grader::rpc
