// ---------------------------------------------------------------------------
// test_feature_flags.cpp
//
// FeatureFlags::from_env 테스트. 테스트마다 관련 환경변수를 지우고 시작한다.
// ---------------------------------------------------------------------------

#include "config/feature_flags.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

class FeatureFlagsEnv : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* name : {"SECURITY_MODE", "INPUT_INSPECTION_ENABLED",
                                 "OUTPUT_INSPECTION_ENABLED", "AUDIT_LOGGING_ENABLED"}) {
            ::unsetenv(name);
        }
    }
};

TEST_F(FeatureFlagsEnv, DefaultsToSecureWithEverythingOn) {
    const auto f = FeatureFlags::from_env();
    EXPECT_EQ(f.mode, SecurityMode::kSecure);
    EXPECT_TRUE(f.input_inspection_enabled);
    EXPECT_TRUE(f.output_inspection_enabled);
    EXPECT_TRUE(f.audit_logging_enabled);
    EXPECT_EQ(f.active_names().size(), 3u);
}

TEST_F(FeatureFlagsEnv, VulnerableModeTurnsDefaultsOff) {
    ::setenv("SECURITY_MODE", "Vulnerable", 1);
    const auto f = FeatureFlags::from_env();
    EXPECT_EQ(f.mode, SecurityMode::kVulnerable);
    EXPECT_FALSE(f.input_inspection_enabled);
    EXPECT_FALSE(f.output_inspection_enabled);
    EXPECT_TRUE(f.active_names().empty());
}

TEST_F(FeatureFlagsEnv, IndividualFlagsOverrideMode) {
    ::setenv("SECURITY_MODE", "vulnerable", 1);
    ::setenv("OUTPUT_INSPECTION_ENABLED", "1", 1);
    ::setenv("AUDIT_LOGGING_ENABLED", "true", 1);
    const auto f = FeatureFlags::from_env();
    EXPECT_FALSE(f.input_inspection_enabled);
    EXPECT_TRUE(f.output_inspection_enabled);
    EXPECT_TRUE(f.audit_logging_enabled);

    const auto names = f.active_names();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "OUTPUT_INSPECTION_ENABLED");
}

TEST_F(FeatureFlagsEnv, UnknownValuesFallBack) {
    ::setenv("SECURITY_MODE", "paranoid", 1);
    ::setenv("INPUT_INSPECTION_ENABLED", "maybe", 1);
    const auto f = FeatureFlags::from_env();
    EXPECT_EQ(f.mode, SecurityMode::kSecure);
    EXPECT_TRUE(f.input_inspection_enabled);
    EXPECT_EQ(to_string(f.mode), "secure");
}
