/**
 * @file test_id.cpp
 * @brief Unit tests for the Id value type
 */

#include <gtest/gtest.h>
#include <hrid/id.h>

#include <algorithm>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

using namespace hrid;

class IdTest : public ::testing::Test {
protected:
    const std::vector<std::string> validSamples_ = {
        "my-service", "日本語", "a", "Z", "v1.2.3", "user_42", "café", "100%", "🚀"
    };
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(IdTest, Of_ValidText) {
    auto id = Id::of("my-service");
    EXPECT_EQ(id.getValue(), "my-service");
    EXPECT_EQ(id.toString(), "my-service");
    EXPECT_EQ(id.length(), 10u);
}

TEST_F(IdTest, Of_NonAscii) {
    auto id = Id::of("日本語");
    EXPECT_EQ(id.getValue(), "日本語");
    EXPECT_EQ(id.length(), 9u);
}

TEST_F(IdTest, Of_InvalidThrowsValidationError) {
    EXPECT_THROW(Id::of("a..b"), ValidationError);
    EXPECT_THROW(Id::of("has space"), ValidationError);
    EXPECT_THROW(Id::of("name#1"), ValidationError);
    EXPECT_THROW(Id::of(""), ValidationError);
}

TEST_F(IdTest, ValidationError_CarriesRuleAndInput) {
    try {
        (void)Id::of("a..b");
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.getRule(), Rule::PATH_TRAVERSAL);
        EXPECT_EQ(e.getInput(), "a..b");
        EXPECT_EQ(e.getOffset(), 1u);
        EXPECT_EQ(e.getCode(), "INVALID_ID");
        EXPECT_NE(std::string(e.what()).find("a..b"), std::string::npos);
    }
}

TEST_F(IdTest, ValidationError_IsHridException) {
    EXPECT_THROW(Id::of("x/y"), HridException);
    EXPECT_THROW(Id::of("x/y"), std::runtime_error);
}

TEST_F(IdTest, ValidationError_EachRule) {
    struct Case { std::string text; Rule rule; };
    const std::vector<Case> cases = {
        {"", Rule::EMPTY},
        {"bad\xc3", Rule::INVALID_UTF8},
        {"tab\there", Rule::CONTROL_CHARACTER},
        {"q?x", Rule::RESERVED_CHARACTER},
        {"up/../down", Rule::RESERVED_CHARACTER},
        {"up..down", Rule::PATH_TRAVERSAL},
        {"two words", Rule::WHITESPACE},
    };

    for (const auto& c : cases) {
        try {
            (void)Id::of(c.text);
            ADD_FAILURE() << "accepted: " << c.text;
        } catch (const ValidationError& e) {
            EXPECT_EQ(e.getRule(), c.rule) << c.text;
            EXPECT_EQ(e.getInput(), c.text);
        }
    }
}

TEST_F(IdTest, TryOf) {
    auto ok = Id::tryOf("my-service");
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, "my-service");

    EXPECT_FALSE(Id::tryOf("a..b").has_value());
    EXPECT_FALSE(Id::tryOf("").has_value());
}

TEST_F(IdTest, CanCastFrom) {
    EXPECT_TRUE(Id::canCastFrom("my-service"));
    EXPECT_FALSE(Id::canCastFrom("has space"));
}

TEST_F(IdTest, NoTrimmingOrFolding) {
    auto id = Id::of("MixedCase-ID");
    EXPECT_EQ(id.getValue(), "MixedCase-ID");
    EXPECT_NE(id, Id::of("mixedcase-id"));
}

// ============================================================================
// Numbers
// ============================================================================

TEST_F(IdTest, FromNumber) {
    EXPECT_EQ(Id::fromNumber(0), "0");
    EXPECT_EQ(Id::fromNumber(42), "42");
    EXPECT_EQ(Id::fromNumber(18446744073709551615ULL), "18446744073709551615");
}

TEST_F(IdTest, ToNumber) {
    EXPECT_EQ(Id::of("42").toNumber(), std::optional<std::uint64_t>(42));
    EXPECT_EQ(Id::fromNumber(123456789).toNumber(), std::optional<std::uint64_t>(123456789));
    EXPECT_FALSE(Id::of("42a").toNumber().has_value());
    EXPECT_FALSE(Id::of("-1").toNumber().has_value());
    EXPECT_FALSE(Id::of("my-service").toNumber().has_value());
    EXPECT_FALSE(Id::of("18446744073709551616").toNumber().has_value());
}

// ============================================================================
// Accessors
// ============================================================================

TEST_F(IdTest, GetValue_ReturnsReference) {
    auto id = Id::of("stable");
    const std::string& a = id.getValue();
    const std::string& b = id.getValue();
    EXPECT_EQ(&a, &b);
}

TEST_F(IdTest, StartsWith) {
    auto id = Id::of("service-alpha");
    EXPECT_TRUE(id.startsWith("service"));
    EXPECT_TRUE(id.startsWith(""));
    EXPECT_TRUE(id.startsWith("service-alpha"));
    EXPECT_FALSE(id.startsWith("service-alpha-beta"));
    EXPECT_FALSE(id.startsWith("alpha"));
}

TEST_F(IdTest, GetSize_CoversText) {
    auto shortId = Id::of("a");
    auto longId = Id::of(std::string(1000, 'x'));
    EXPECT_GE(shortId.getSize(), sizeof(Id));
    EXPECT_GE(longId.getSize(), sizeof(Id) + 1000);
}

TEST_F(IdTest, StreamOutput_Verbatim) {
    std::ostringstream oss;
    oss << Id::of("日本語") << "|" << Id::of("my-service");
    EXPECT_EQ(oss.str(), "日本語|my-service");
}

// ============================================================================
// Equality, ordering, hashing
// ============================================================================

TEST_F(IdTest, Determinism_EqualAndSameHash) {
    std::hash<Id> hasher;
    for (const auto& s : validSamples_) {
        auto a = Id::of(s);
        auto b = Id::of(s);
        EXPECT_EQ(a, b);
        EXPECT_FALSE(a != b);
        EXPECT_EQ(hasher(a), hasher(b));
        EXPECT_EQ(hasher(a), std::hash<std::string>()(s));
    }
}

TEST_F(IdTest, Ordering_MatchesCodepointOrder) {
    for (const auto& x : validSamples_) {
        for (const auto& y : validSamples_) {
            auto a = Id::of(x);
            auto b = Id::of(y);
            EXPECT_EQ(a < b, x < y) << x << " vs " << y;
            EXPECT_EQ(a > b, x > y);
            EXPECT_EQ(a <= b, x <= y);
            EXPECT_EQ(a >= b, x >= y);
        }
    }
}

TEST_F(IdTest, Ordering_NonAsciiAfterAscii) {
    // U+00E9 (0xC3 0xA9) sorts after every ASCII code point
    EXPECT_LT(Id::of("z"), Id::of("é"));
    EXPECT_LT(Id::of("é"), Id::of("日"));
    EXPECT_LT(Id::of("日"), Id::of("🚀"));
}

TEST_F(IdTest, MixedComparisons) {
    auto id = Id::of("beta");
    EXPECT_TRUE(id == "beta");
    EXPECT_TRUE("beta" == id);
    EXPECT_TRUE(id == std::string("beta"));
    EXPECT_TRUE(id != "alpha");
    EXPECT_TRUE("alpha" != id);
    EXPECT_TRUE(id < "gamma");
    EXPECT_TRUE("alpha" < id);
}

TEST_F(IdTest, OrderedContainers) {
    std::set<Id> ids;
    ids.insert(Id::of("charlie"));
    ids.insert(Id::of("alpha"));
    ids.insert(Id::of("bravo"));
    ids.insert(Id::of("alpha"));

    ASSERT_EQ(ids.size(), 3u);
    EXPECT_EQ(*ids.begin(), "alpha");
    EXPECT_EQ(*ids.rbegin(), "charlie");

    std::map<Id, int> counts;
    counts[Id::of("x")] = 1;
    counts[Id::of("x")] += 1;
    EXPECT_EQ(counts.at(Id::of("x")), 2);
}

TEST_F(IdTest, UnorderedContainers) {
    std::unordered_set<Id> ids;
    for (const auto& s : validSamples_) {
        ids.insert(Id::of(s));
        ids.insert(Id::of(s));
    }
    EXPECT_EQ(ids.size(), validSamples_.size());
    EXPECT_EQ(ids.count(Id::of("日本語")), 1u);

    std::unordered_map<Id, std::string> owners;
    owners.emplace(Id::of("svc"), "team-a");
    EXPECT_EQ(owners.at(Id::of("svc")), "team-a");
}

TEST_F(IdTest, CopyAndAssign) {
    auto a = Id::of("first");
    auto b = a;
    EXPECT_EQ(a, b);

    b = Id::of("second");
    EXPECT_EQ(a, "first");
    EXPECT_EQ(b, "second");

    std::vector<Id> ids = {Id::of("c"), Id::of("a"), Id::of("b")};
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(ids[0], "a");
    EXPECT_EQ(ids[2], "c");
}

TEST_F(IdTest, MoveThenReassign) {
    auto a = Id::of("original");
    Id b = std::move(a);
    EXPECT_EQ(b, "original");

    a = Id::of("replacement");
    EXPECT_EQ(a, "replacement");
    EXPECT_EQ(a.length(), 11u);
    EXPECT_EQ(b, "original");
}

TEST_F(IdTest, SharedAcrossThreads) {
    const auto id = Id::of("shared");
    std::vector<std::thread> threads;
    std::vector<int> matches(8, 0);

    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&id, &matches, t]() {
            for (int i = 0; i < 1000; ++i) {
                if (id == "shared" && std::hash<Id>()(id) == std::hash<std::string>()("shared")) {
                    ++matches[t];
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    for (int m : matches) {
        EXPECT_EQ(m, 1000);
    }
}
