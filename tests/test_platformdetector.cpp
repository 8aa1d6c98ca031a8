#include <gtest/gtest.h>
#include "platformdetector.h"

TEST(PlatformDetectorTest, CapabilitiesAreDetected)
{
    const PlatformCapabilities& capabilities = PlatformDetector::getInstance().getCapabilities();

    EXPECT_GE(capabilities.logicalCores, 1);
    EXPECT_TRUE(capabilities.backgroundThreads);
#ifdef __linux__
    EXPECT_EQ(capabilities.operatingSystem, OperatingSystem::Linux);
#endif
}

TEST(PlatformDetectorTest, GpuRequiresImageSupport)
{
    const PlatformCapabilities& capabilities = PlatformDetector::getInstance().getCapabilities();
    GPUAccelerationType best = PlatformDetector::getInstance().getBestGPUAcceleration();

    if (!capabilities.openCLImages) {
        EXPECT_EQ(best, GPUAccelerationType::None);
    } else {
        EXPECT_EQ(best, GPUAccelerationType::OpenCL);
    }
}

TEST(PlatformDetectorTest, SummaryNamesTheSystem)
{
    std::string summary = PlatformDetector::getInstance().getCapabilitiesSummary();

    EXPECT_NE(summary.find("OS: "), std::string::npos);
    EXPECT_NE(summary.find("GPU: "), std::string::npos);
    EXPECT_EQ(PlatformDetector::toString(GPUAccelerationType::None), "None");
    EXPECT_EQ(PlatformDetector::toString(OperatingSystem::Linux), "Linux");
}
