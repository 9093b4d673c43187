#include <glog/logging.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/environment.hpp"

class GraderEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        grader::setup_test_environment();
    }
};

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;
    ::testing::AddGlobalTestEnvironment(new GraderEnvironment);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
