#include <gtest/gtest.h>

#include <provision/install/environment_probe.h>

#include "../../common/install_test_doubles.h"

using namespace provision;
using namespace provision::install;
using provision::test::envFrom;

TEST(EnvironmentProbeTest, CleanEnvironment) {
    EnvironmentProbe probe(envFrom({}));
    EXPECT_FALSE(probe.isAutoInstallDisabled());
    EXPECT_FALSE(probe.isCiEnvironment());
}

TEST(EnvironmentProbeTest, DisableSwitchHonoursTruthiness) {
    EXPECT_TRUE(EnvironmentProbe(envFrom({{"PROVISION_NO_AUTO_INSTALL", "1"}})).isAutoInstallDisabled());
    EXPECT_TRUE(EnvironmentProbe(envFrom({{"PROVISION_NO_AUTO_INSTALL", "yes"}})).isAutoInstallDisabled());
    EXPECT_FALSE(EnvironmentProbe(envFrom({{"PROVISION_NO_AUTO_INSTALL", "0"}})).isAutoInstallDisabled());
    EXPECT_FALSE(EnvironmentProbe(envFrom({{"PROVISION_NO_AUTO_INSTALL", ""}})).isAutoInstallDisabled());
}

TEST(EnvironmentProbeTest, EachCiIndicatorIsRecognized) {
    for (auto name : kCiIndicatorEnv) {
        EnvironmentProbe probe(envFrom({{std::string(name), "true"}}));
        EXPECT_TRUE(probe.isCiEnvironment()) << name;
    }
}

TEST(EnvironmentProbeTest, EmptyCiIndicatorIsIgnored) {
    EnvironmentProbe probe(envFrom({{"CI", ""}, {"GITHUB_ACTIONS", ""}}));
    EXPECT_FALSE(probe.isCiEnvironment());
}

TEST(EnvironmentProbeTest, UnrelatedVariablesAreIgnored) {
    EnvironmentProbe probe(envFrom({{"HOME", "/root"}, {"PATH", "/usr/bin"}}));
    EXPECT_FALSE(probe.isCiEnvironment());
    EXPECT_FALSE(probe.isAutoInstallDisabled());
}

TEST(EnvironmentProbeTest, CiDoesNotDisableAutoInstall) {
    EnvironmentProbe probe(envFrom({{"CI", "1"}}));
    EXPECT_TRUE(probe.isCiEnvironment());
    EXPECT_FALSE(probe.isAutoInstallDisabled());
}
