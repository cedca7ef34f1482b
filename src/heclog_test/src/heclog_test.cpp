#include "heclog_test_common.h"

class HecLogEnvironment : public ::testing::Environment {
public:
    ~HecLogEnvironment() override {}

    void SetUp() override { (void)heclog::HecLogReport::loadReportLevelEnv(); }

    void TearDown() override { heclog::HecLogReport::setReportHandler(nullptr); }
};

int main(int argc, char* argv[]) {
    testing::InitGoogleTest(&argc, argv);
    testing::AddGlobalTestEnvironment(new HecLogEnvironment());
    return RUN_ALL_TESTS();
}
