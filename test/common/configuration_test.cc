#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/common/configuration.h"

#include <cstdlib>

using namespace SlotRace;
using ::testing::HasSubstr;
using ::testing::Contains;

namespace {

const char* kTwoStreams = R"(
slotrace:
  max_slots: 100
  stop_at_max: true
  commitment: Confirmed
  warmup_slots: 5
  summary_interval_sec: 15
  streams:
    - name: alpha
      endpoint: https://alpha.example:10000
      access_token: secret
    - name: beta
      endpoint: http://127.0.0.1:10001
)";

} // namespace

class ConfigurationTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("SLOTRACE_MAX_SLOTS");
        unsetenv("SLOTRACE_STOP_AT_MAX");
    }

    Configuration config_;
};

TEST_F(ConfigurationTest, DefaultsMatchRaceDefaults) {
    EXPECT_EQ(config_.getMaxSlots(), 360u);
    EXPECT_FALSE(config_.getStopAtMax());
    EXPECT_EQ(config_.getCommitment(), Commitment::kProcessed);
    EXPECT_EQ(config_.getWarmupSlots(), 10u);
    EXPECT_EQ(config_.config().report.summary_interval_sec.get(), 30);
}

TEST_F(ConfigurationTest, LoadsStreamsAndRaceParameters) {
    ASSERT_TRUE(config_.loadFromString(kTwoStreams));

    EXPECT_EQ(config_.getMaxSlots(), 100u);
    EXPECT_TRUE(config_.getStopAtMax());
    EXPECT_EQ(config_.getCommitment(), Commitment::kConfirmed);
    EXPECT_EQ(config_.getWarmupSlots(), 5u);
    EXPECT_EQ(config_.config().report.summary_interval_sec.get(), 15);

    const auto& streams = config_.getStreams();
    ASSERT_EQ(streams.size(), 2u);
    EXPECT_EQ(streams[0].name, "alpha");
    EXPECT_EQ(streams[0].endpoint, "https://alpha.example:10000");
    ASSERT_TRUE(streams[0].access_token.has_value());
    EXPECT_EQ(*streams[0].access_token, "secret");
    EXPECT_EQ(streams[1].name, "beta");
    EXPECT_FALSE(streams[1].access_token.has_value());
}

TEST_F(ConfigurationTest, EmptyStreamListIsRejected) {
    EXPECT_FALSE(config_.loadFromString("slotrace:\n  max_slots: 10\n"));
    EXPECT_THAT(config_.getValidationErrors(), Contains(HasSubstr("No streams")));
}

TEST_F(ConfigurationTest, InvalidCommitmentIsRejected) {
    EXPECT_FALSE(config_.loadFromString(R"(
slotrace:
  commitment: rooted
  streams:
    - name: alpha
      endpoint: https://alpha.example
)"));
    EXPECT_THAT(config_.getValidationErrors(), Contains(HasSubstr("rooted")));
}

TEST_F(ConfigurationTest, StreamWithoutSchemeOrNameIsRejected) {
    EXPECT_FALSE(config_.loadFromString(R"(
streams:
  - name: alpha
    endpoint: alpha.example:443
  - endpoint: https://beta.example
)"));
    auto errors = config_.getValidationErrors();
    EXPECT_THAT(errors, Contains(HasSubstr("http://")));
    EXPECT_THAT(errors, Contains(HasSubstr("no name")));
}

TEST_F(ConfigurationTest, DuplicateStreamNamesAreRejected) {
    EXPECT_FALSE(config_.loadFromString(R"(
streams:
  - name: alpha
    endpoint: https://a.example
  - name: alpha
    endpoint: https://b.example
)"));
    EXPECT_THAT(config_.getValidationErrors(), Contains(HasSubstr("reuses the name")));
}

TEST_F(ConfigurationTest, ZeroMaxSlotsIsRejected) {
    EXPECT_FALSE(config_.loadFromString(R"(
max_slots: 0
streams:
  - name: alpha
    endpoint: https://a.example
)"));
    EXPECT_THAT(config_.getValidationErrors(), Contains(HasSubstr("max_slots")));
}

TEST_F(ConfigurationTest, MalformedYamlFailsToLoad) {
    EXPECT_FALSE(config_.loadFromString("slotrace: [unterminated"));
    EXPECT_FALSE(config_.getValidationErrors().empty());
}

TEST_F(ConfigurationTest, MissingFileFailsToLoad) {
    EXPECT_FALSE(config_.loadFromFile("/nonexistent/slotrace.yaml"));
}

TEST_F(ConfigurationTest, EnvironmentOverridesFileValues) {
    ASSERT_TRUE(config_.loadFromString(kTwoStreams));
    setenv("SLOTRACE_MAX_SLOTS", "42", 1);
    setenv("SLOTRACE_STOP_AT_MAX", "off", 1);
    EXPECT_EQ(config_.getMaxSlots(), 42u);
    EXPECT_FALSE(config_.getStopAtMax());
}

TEST_F(ConfigurationTest, NegativeEnvironmentCountIsIgnored) {
    ASSERT_TRUE(config_.loadFromString(kTwoStreams));
    setenv("SLOTRACE_MAX_SLOTS", "-5", 1);
    EXPECT_EQ(config_.getMaxSlots(), 100u);
    EXPECT_TRUE(config_.validate());

    setenv("SLOTRACE_MAX_SLOTS", "  -1", 1);
    EXPECT_EQ(config_.getMaxSlots(), 100u);
}

TEST(CommitmentTest, ParsesCaseInsensitively) {
    EXPECT_EQ(ParseCommitment("processed"), Commitment::kProcessed);
    EXPECT_EQ(ParseCommitment("CONFIRMED"), Commitment::kConfirmed);
    EXPECT_EQ(ParseCommitment("Finalized"), Commitment::kFinalized);
    EXPECT_FALSE(ParseCommitment("").has_value());
    EXPECT_FALSE(ParseCommitment("final").has_value());
    EXPECT_STREQ(CommitmentName(Commitment::kConfirmed), "confirmed");
}
