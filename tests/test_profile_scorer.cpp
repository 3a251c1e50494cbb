#include <gtest/gtest.h>
#include "TestSupport.hpp"
#include "core/rotation/ProfileScorer.hpp"

using namespace keyrotor::core::rotation;
using namespace keyrotor::models;
using keyrotor::testing::FakeClock;

namespace {

OAuthProfile oauth(const std::string& id, double session, double weekly) {
    OAuthProfile profile;
    profile.id = id;
    profile.name = id;
    profile.isAuthenticated = true;
    profile.usage = UsageSnapshot{session, weekly};
    return profile;
}

APIProfile api(const std::string& id, bool authenticated = true) {
    APIProfile profile;
    profile.id = id;
    profile.name = id;
    profile.apiKey = authenticated ? "sk-test" : "";
    profile.baseUrl = "https://api.example.com";
    return profile;
}

std::vector<std::string> ids(const std::vector<Account>& accounts) {
    std::vector<std::string> result;
    for (const auto& account : accounts) {
        result.push_back(accountId(account));
    }
    return result;
}

} // namespace

class ProfileScorerTest : public ::testing::Test {
protected:
    FakeClock clock;
    ProfileScorer scorer{clock};
    AutoSwitchSettings settings;

    void SetUp() override {
        settings.enabled = true;
    }

    OAuthProfile rateLimited(const std::string& id, RateLimitType type, std::chrono::hours resetIn) {
        OAuthProfile profile = oauth(id, 0, 0);
        profile.usage.reset();
        profile.rateLimit.limited = true;
        profile.rateLimit.type = type;
        profile.rateLimit.resetAt = clock.now() + resetIn;
        return profile;
    }
};

TEST_F(ProfileScorerTest, SkipsAccountOverSessionThreshold) {
    std::vector<Account> pool{oauth("A", 96, 10), oauth("B", 10, 10)};

    auto best = scorer.selectBestAccount(pool, settings, std::nullopt, {"oauth-A", "oauth-B"});
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(accountId(*best), "B");
}

TEST_F(ProfileScorerTest, FallsBackToHighestScoreWhenNothingAvailable) {
    std::vector<Account> pool{oauth("A", 96, 10), oauth("B", 99, 50)};

    EXPECT_NEAR(scorer.score(pool[0], settings), 86.4, 1e-9);
    EXPECT_NEAR(scorer.score(pool[1], settings), 71.1, 1e-9);

    auto best = scorer.selectBestAccount(pool, settings);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(accountId(*best), "A");
}

TEST_F(ProfileScorerTest, WeeklyThresholdMakesAccountUnavailable) {
    std::vector<Account> pool{oauth("A", 10, 99), oauth("B", 50, 50)};

    EXPECT_FALSE(scorer.isAvailable(pool[0], settings));
    auto best = scorer.selectBestAccount(pool, settings, std::nullopt, {"A", "B"});
    EXPECT_EQ(accountId(*best), "B");
}

TEST_F(ProfileScorerTest, NothingUsable) {
    OAuthProfile loggedOut = oauth("A", 0, 0);
    loggedOut.isAuthenticated = false;
    std::vector<Account> pool{loggedOut, api("K", false)};

    EXPECT_FALSE(scorer.selectBestAccount(pool, settings).has_value());
    EXPECT_FALSE(scorer.selectBestAccount({}, settings).has_value());
}

TEST_F(ProfileScorerTest, ApiAccountsHaveNoUsageCeiling) {
    EXPECT_DOUBLE_EQ(scorer.score(api("K"), settings), 100.0);
    EXPECT_DOUBLE_EQ(scorer.score(api("K", false), settings), -900.0);
    EXPECT_TRUE(scorer.isAvailable(api("K"), settings));

    APIProfile blankUrl = api("K");
    blankUrl.baseUrl = "  ";
    EXPECT_FALSE(scorer.isAvailable(blankUrl, settings));
}

TEST_F(ProfileScorerTest, PriorityOrderBeatsScore) {
    std::vector<Account> pool{oauth("low", 5, 5), oauth("high", 80, 80), api("K")};

    auto best = scorer.selectBestAccount(pool, settings, std::nullopt, {"oauth-high", "api-K"});
    EXPECT_EQ(accountId(*best), "high");

    auto sorted = scorer.sortedByAvailability(pool, settings, {"oauth-high", "api-K"});
    EXPECT_EQ(ids(sorted), (std::vector<std::string>{"high", "K", "low"}));
}

TEST_F(ProfileScorerTest, ScoreOrdersWithoutPriority) {
    std::vector<Account> pool{oauth("busy", 60, 60), oauth("idle", 0, 0), oauth("mid", 30, 30)};

    auto sorted = scorer.sortedByAvailability(pool, settings);
    EXPECT_EQ(ids(sorted), (std::vector<std::string>{"idle", "mid", "busy"}));
}

TEST_F(ProfileScorerTest, ExcludesCurrentAccountByEitherId) {
    std::vector<Account> pool{oauth("A", 0, 0), oauth("B", 50, 50)};

    EXPECT_EQ(accountId(*scorer.selectBestAccount(pool, settings, std::string("oauth-A"))), "B");
    EXPECT_EQ(accountId(*scorer.selectBestAccount(pool, settings, std::string("A"))), "B");
    EXPECT_FALSE(scorer.selectBestAccount({oauth("A", 0, 0)}, settings, std::string("A")).has_value());
}

TEST_F(ProfileScorerTest, RateLimitPenalties) {
    EXPECT_DOUBLE_EQ(scorer.score(rateLimited("S", RateLimitType::Session, std::chrono::hours(1)), settings), -51.0);
    EXPECT_DOUBLE_EQ(scorer.score(rateLimited("W", RateLimitType::Weekly, std::chrono::hours(100)), settings), -400.0);

    auto limited = rateLimited("S", RateLimitType::Session, std::chrono::hours(1));
    EXPECT_TRUE(scorer.isRateLimited(limited));
    EXPECT_FALSE(scorer.isAvailable(limited, settings));
}

TEST_F(ProfileScorerTest, ExpiredRateLimitNoLongerCounts) {
    auto profile = rateLimited("S", RateLimitType::Session, std::chrono::hours(1));
    clock.advance(std::chrono::hours(2));

    EXPECT_FALSE(scorer.isRateLimited(profile));
    EXPECT_TRUE(scorer.isAvailable(profile, settings));
    EXPECT_DOUBLE_EQ(scorer.score(profile, settings), 100.0);
}

TEST_F(ProfileScorerTest, EqualCandidatesKeepPoolOrder) {
    std::vector<Account> pool{oauth("first", 20, 20), oauth("second", 20, 20), oauth("third", 20, 20)};

    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(accountId(*scorer.selectBestAccount(pool, settings)), "first");
    }
    EXPECT_EQ(ids(scorer.sortedByAvailability(pool, settings)),
              (std::vector<std::string>{"first", "second", "third"}));
}

TEST_F(ProfileScorerTest, ThresholdsAreInclusive) {
    auto check = ProfileScorer::checkThresholds(oauth("A", 95, 99), settings);
    EXPECT_TRUE(check.sessionExceeded);
    EXPECT_TRUE(check.weeklyExceeded);

    check = ProfileScorer::checkThresholds(oauth("A", 94.9, 98.9), settings);
    EXPECT_FALSE(check.anyExceeded());

    OAuthProfile noUsage = oauth("A", 0, 0);
    noUsage.usage.reset();
    EXPECT_FALSE(ProfileScorer::checkThresholds(noUsage, settings).anyExceeded());
}

TEST_F(ProfileScorerTest, ProactiveSwitchSuggestion) {
    std::vector<Account> pool{oauth("A", 97, 10), oauth("B", 5, 5)};

    auto decision = scorer.shouldProactivelySwitch(pool[0], pool, settings);
    EXPECT_TRUE(decision.shouldSwitch);
    EXPECT_EQ(decision.reason, "Session usage at 97% (threshold: 95%)");
    ASSERT_TRUE(decision.suggestedAccount.has_value());
    EXPECT_EQ(accountId(*decision.suggestedAccount), "B");

    Account weekly = oauth("A", 97, 99.5);
    EXPECT_EQ(scorer.shouldProactivelySwitch(weekly, pool, settings).reason,
              "Weekly usage at 99.5% (threshold: 99%)");

    Account limited = rateLimited("A", RateLimitType::Weekly, std::chrono::hours(3));
    EXPECT_EQ(scorer.shouldProactivelySwitch(limited, pool, settings).reason, "Rate limited (weekly)");
}

TEST_F(ProfileScorerTest, NoProactiveSwitchWhenNotNeeded) {
    std::vector<Account> pool{oauth("A", 50, 10), oauth("B", 5, 5)};

    EXPECT_FALSE(scorer.shouldProactivelySwitch(pool[0], pool, settings).shouldSwitch);

    Account hot = oauth("A", 97, 10);
    EXPECT_FALSE(scorer.shouldProactivelySwitch(hot, {hot}, settings).shouldSwitch);
    EXPECT_FALSE(scorer.shouldProactivelySwitch(api("K"), pool, settings).shouldSwitch);

    settings.enabled = false;
    EXPECT_FALSE(scorer.shouldProactivelySwitch(hot, pool, settings).shouldSwitch);
}

TEST_F(ProfileScorerTest, UnifiedView) {
    std::vector<Account> pool{oauth("A", 96, 10),
                              rateLimited("R", RateLimitType::Session, std::chrono::hours(1)),
                              api("K")};

    auto unified = scorer.buildUnifiedAccounts(pool, settings);
    ASSERT_EQ(unified.size(), 3u);

    EXPECT_EQ(unified[0].id, "oauth-A");
    EXPECT_EQ(unified[0].accountId, "A");
    EXPECT_EQ(unified[0].type, AccountType::OAuth);
    EXPECT_FALSE(unified[0].isAvailable);
    EXPECT_FALSE(unified[0].isRateLimited);
    EXPECT_EQ(unified[0].sessionPercent.value_or(0.0), 96.0);

    EXPECT_TRUE(unified[1].isRateLimited);
    EXPECT_EQ(unified[1].rateLimitType, RateLimitType::Session);
    EXPECT_FALSE(unified[1].sessionPercent.has_value());

    EXPECT_EQ(unified[2].id, "api-K");
    EXPECT_EQ(unified[2].type, AccountType::API);
    EXPECT_TRUE(unified[2].isAvailable);
    EXPECT_DOUBLE_EQ(unified[2].score, 100.0);
}

TEST_F(ProfileScorerTest, UnavailableAccountsSortLast) {
    std::vector<Account> pool{oauth("full", 99, 10),
                              rateLimited("limited", RateLimitType::Session, std::chrono::hours(1)),
                              oauth("fresh", 40, 40)};

    auto sorted = scorer.sortedByAvailability(pool, settings, {"oauth-full", "oauth-limited"});
    EXPECT_EQ(ids(sorted), (std::vector<std::string>{"fresh", "full", "limited"}));
}
