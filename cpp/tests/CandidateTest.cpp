#include "proxykeeper/proxy/Candidate.hpp"

#include <gtest/gtest.h>

#include <unordered_set>

using namespace proxykeeper::proxy;

TEST(CandidateTest, ParsesHostAndPort) {
    auto candidate = parseCandidate("10.0.0.1:8080");
    ASSERT_TRUE(candidate.has_value());
    EXPECT_EQ(candidate->host, "10.0.0.1");
    EXPECT_EQ(candidate->port, 8080);
    EXPECT_FALSE(candidate->hasCredentials());
    EXPECT_EQ(candidate->toString(), "10.0.0.1:8080");
}

TEST(CandidateTest, ParsesCredentials) {
    auto candidate = parseCandidate(" 10.0.0.2:3128:alice:secret \n");
    ASSERT_TRUE(candidate.has_value());
    EXPECT_EQ(candidate->username, "alice");
    EXPECT_EQ(candidate->password, "secret");
    EXPECT_EQ(candidate->toString(), "10.0.0.2:3128:alice:secret");
}

TEST(CandidateTest, RejectsMalformedText) {
    EXPECT_FALSE(parseCandidate("").has_value());
    EXPECT_FALSE(parseCandidate("10.0.0.1").has_value());
    EXPECT_FALSE(parseCandidate(":8080").has_value());
    EXPECT_FALSE(parseCandidate("10.0.0.1:0").has_value());
    EXPECT_FALSE(parseCandidate("10.0.0.1:70000").has_value());
    EXPECT_FALSE(parseCandidate("10.0.0.1:80x").has_value());
}

TEST(CandidateTest, ParsesProviderRecordWithStringPort) {
    auto candidate = parseProviderRecord(R"({"ip":"1.2.3.4","port":"8080"})");
    ASSERT_TRUE(candidate.has_value());
    EXPECT_EQ(candidate->host, "1.2.3.4");
    EXPECT_EQ(candidate->port, 8080);
    EXPECT_FALSE(candidate->hasCredentials());
}

TEST(CandidateTest, ParsesProviderRecordWithNumericPortAndCredentials) {
    auto candidate = parseProviderRecord(R"({"ip":"1.2.3.4","port":3128,"username":"u","password":"p"})");
    ASSERT_TRUE(candidate.has_value());
    EXPECT_EQ(candidate->port, 3128);
    EXPECT_EQ(candidate->username, "u");
    EXPECT_EQ(candidate->password, "p");
}

TEST(CandidateTest, IgnoresHalfCredentials) {
    auto candidate = parseProviderRecord(R"({"ip":"1.2.3.4","port":"80","username":"u"})");
    ASSERT_TRUE(candidate.has_value());
    EXPECT_FALSE(candidate->hasCredentials());
}

TEST(CandidateTest, RejectsBrokenProviderRecords) {
    EXPECT_FALSE(parseProviderRecord("not json").has_value());
    EXPECT_FALSE(parseProviderRecord(R"({"port":"80"})").has_value());
    EXPECT_FALSE(parseProviderRecord(R"({"ip":"1.2.3.4"})").has_value());
    EXPECT_FALSE(parseProviderRecord(R"(["1.2.3.4", 80])").has_value());
    EXPECT_FALSE(parseProviderRecord("   ").has_value());
}

TEST(CandidateTest, IdentityComparesAllFields) {
    ProxyIdentity plain{"1.1.1.1", 80, "", ""};
    ProxyIdentity withUser{"1.1.1.1", 80, "u", "p"};
    EXPECT_NE(plain, withUser);
    EXPECT_TRUE(withUser.matchesAddress("1.1.1.1", 80));
    EXPECT_FALSE(withUser.matchesAddress("1.1.1.1", 81));

    std::unordered_set<ProxyIdentity, ProxyIdentityHash> set{plain, withUser, plain};
    EXPECT_EQ(set.size(), 2u);
}

TEST(CandidateTest, RoundTripsThroughIdentity) {
    Candidate candidate{"9.9.9.9", 1080, "x", "y"};
    auto copy = candidateFrom(candidate.identity());
    EXPECT_EQ(copy.identity(), candidate.identity());
}
