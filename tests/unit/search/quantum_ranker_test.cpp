#include <cmath>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <common/test_helpers.h>
#include <qms/search/quantum_ranker.h>

using namespace qms;
using namespace qms::search;
using qms::tests::makeMovie;

namespace {

TokenSet tokens(const std::string& query) {
    return QueryTokenizer{}.tokenize(query);
}

// Two strong matches; the more relevant one is the less popular
std::vector<catalog::Movie> heistCandidates() {
    return {makeMovie(1, "The Crew", "bank heist", 50.0, {"genre:80", "genre:53"}),
            makeMovie(2, "Heist", "a bank job", 90.0, {"genre:80", "genre:28"}),
            makeMovie(3, "Up", "balloon", 10.0, {"genre:16"}),
            makeMovie(4, "Cars", "racing", 10.0, {"genre:16"})};
}

} // namespace

// Amplitude simulation

TEST(AmplitudeSimulatorTest, UniformState) {
    auto amplitudes = AmplitudeSimulator::uniform(4);
    ASSERT_EQ(amplitudes.size(), 4u);
    for (double a : amplitudes) {
        EXPECT_DOUBLE_EQ(a, 0.5);
    }
    EXPECT_NEAR(AmplitudeSimulator::squaredNorm(amplitudes), 1.0, 1e-12);
    EXPECT_TRUE(AmplitudeSimulator::uniform(0).empty());
}

TEST(AmplitudeSimulatorTest, IterationCount) {
    EXPECT_EQ(AmplitudeSimulator::iterationCount(1, 1), 1u);   // floor(0.785) -> 1
    EXPECT_EQ(AmplitudeSimulator::iterationCount(2, 1), 1u);
    EXPECT_EQ(AmplitudeSimulator::iterationCount(4, 1), 1u);
    EXPECT_EQ(AmplitudeSimulator::iterationCount(10, 1), 2u);
    EXPECT_EQ(AmplitudeSimulator::iterationCount(100, 1), 7u);
    EXPECT_EQ(AmplitudeSimulator::iterationCount(100, 100), 1u);
    EXPECT_EQ(AmplitudeSimulator::iterationCount(10, 0), 2u); // treated as one target
    EXPECT_EQ(AmplitudeSimulator::iterationCount(0, 0), 0u);
}

TEST(AmplitudeSimulatorTest, IterationCountStaysWithinBounds) {
    for (size_t n = 1; n <= 200; ++n) {
        for (size_t m = 1; m <= n; m += (n / 10) + 1) {
            auto r = AmplitudeSimulator::iterationCount(n, m);
            EXPECT_GE(r, 1u) << "N=" << n << " M=" << m;
            EXPECT_LE(r, n) << "N=" << n << " M=" << m;
        }
    }
}

TEST(AmplitudeSimulatorTest, OracleFlipsOnlyMarked) {
    AmplitudeVector amplitudes{0.5, 0.5, 0.5, 0.5};
    AmplitudeSimulator::applyOracle(amplitudes, {false, true, false, true});
    EXPECT_EQ(amplitudes, (AmplitudeVector{0.5, -0.5, 0.5, -0.5}));
}

TEST(AmplitudeSimulatorTest, SingleRoundFindsOneOfFour) {
    auto amplitudes = AmplitudeSimulator::uniform(4);
    std::vector<bool> marked{false, false, true, false};

    AmplitudeSimulator::applyOracle(amplitudes, marked);
    AmplitudeSimulator::applyDiffusion(amplitudes);

    auto probs = AmplitudeSimulator::probabilities(amplitudes);
    EXPECT_NEAR(probs[2], 1.0, 1e-12);
    EXPECT_NEAR(probs[0], 0.0, 1e-12);
    EXPECT_NEAR(probs[1], 0.0, 1e-12);
    EXPECT_NEAR(probs[3], 0.0, 1e-12);
}

TEST(AmplitudeSimulatorTest, DiffusionPreservesNorm) {
    for (size_t n : {2u, 3u, 7u, 16u, 33u}) {
        auto amplitudes = AmplitudeSimulator::uniform(n);
        std::vector<bool> marked(n, false);
        marked[n / 2] = true;
        marked[0] = true;

        for (int round = 0; round < 12; ++round) {
            AmplitudeSimulator::applyOracle(amplitudes, marked);
            AmplitudeSimulator::applyDiffusion(amplitudes);
            EXPECT_NEAR(AmplitudeSimulator::squaredNorm(amplitudes), 1.0, 1e-9)
                << "N=" << n << " round=" << round;
        }
    }
}

// Marking

TEST(QuantumRankerTest, MarksAboveMean) {
    QuantumRanker ranker;
    std::vector<catalog::Movie> movies{makeMovie(1, "A", "", 0.0), makeMovie(2, "B", "", 0.0),
                                       makeMovie(3, "C", "", 0.0)};
    auto marked = ranker.markRelevant({10.0, 20.0, 30.0}, movies);
    EXPECT_EQ(marked, (std::vector<bool>{false, false, true}));
}

TEST(QuantumRankerTest, ThresholdMultiplierWidensMarking) {
    RankingConfig cfg;
    cfg.relevanceThresholdMultiplier = 0.4;
    QuantumRanker ranker(cfg);
    std::vector<catalog::Movie> movies{makeMovie(1, "A", "", 0.0), makeMovie(2, "B", "", 0.0),
                                       makeMovie(3, "C", "", 0.0)};
    auto marked = ranker.markRelevant({10.0, 20.0, 30.0}, movies);
    EXPECT_EQ(marked, (std::vector<bool>{true, true, true}));
}

TEST(QuantumRankerTest, UniformScoresMarkClassicalBest) {
    QuantumRanker ranker;
    std::vector<catalog::Movie> movies{makeMovie(1, "A", "", 5.0), makeMovie(2, "B", "", 9.0),
                                       makeMovie(3, "C", "", 9.0)};
    auto marked = ranker.markRelevant({5.0, 5.0, 5.0}, movies);
    EXPECT_EQ(marked, (std::vector<bool>{false, true, false}));
}

// Ranking

TEST(QuantumRankerTest, DreamScenarioSelectsInception) {
    QuantumRanker ranker;
    auto candidates = qms::tests::dreamCandidates();

    auto result = ranker.rank(candidates, tokens("dream inside dreams"));
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result.value().index, 0u);
    EXPECT_EQ(result.value().movieId, 27205);
    EXPECT_EQ(result.value().mode, RankingMode::Quantum);
    EXPECT_EQ(result.value().iterations, 1u);
    EXPECT_EQ(result.value().markedCount, 1u);
    EXPECT_NEAR(result.value().topProbability, 0.5, 1e-12);
    EXPECT_FALSE(result.value().tunneled);
}

TEST(QuantumRankerTest, AmplifiesSingleMatchToCertainty) {
    QuantumRanker ranker;
    std::vector<catalog::Movie> candidates{makeMovie(1, "Alien", "space horror", 10.0),
                                           makeMovie(2, "Heat", "heist crime", 10.0),
                                           makeMovie(3, "Up", "balloon house", 10.0),
                                           makeMovie(4, "Jaws", "shark beach", 10.0)};

    auto result = ranker.rank(candidates, tokens("heist"));
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().index, 1u);
    EXPECT_EQ(result.value().iterations, 1u);
    EXPECT_NEAR(result.value().topProbability, 1.0, 1e-12);
    EXPECT_NEAR(result.value().topScore, 11.0, 1e-9);
    EXPECT_FALSE(result.value().tunneled);
}

TEST(QuantumRankerTest, TunnelingPrefersClearlyMoreRelevantRunnerUp) {
    // Both heist films are marked and end with equal probability; popularity
    // picks "Heist" (29.0) but "The Crew" scores 35.0, more than 15% higher.
    QuantumRanker ranker;
    auto candidates = heistCandidates();

    auto result = ranker.rank(candidates, tokens("bank heist crew"));
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value().tunneled);
    EXPECT_EQ(result.value().index, 0u);
    EXPECT_EQ(result.value().markedCount, 2u);
    EXPECT_NEAR(result.value().topScore, 35.0, 1e-9);
}

TEST(QuantumRankerTest, TunnelingMarginIsConfigurable) {
    RankingConfig cfg;
    cfg.tunnelingMargin = 0.5;
    QuantumRanker ranker(cfg);
    auto candidates = heistCandidates();

    auto result = ranker.rank(candidates, tokens("bank heist crew"));
    ASSERT_TRUE(result);
    EXPECT_FALSE(result.value().tunneled);
    EXPECT_EQ(result.value().index, 1u);
}

TEST(QuantumRankerTest, SingleCandidate) {
    QuantumRanker ranker;
    std::vector<catalog::Movie> candidates{makeMovie(1, "Solaris", "space station", 12.0)};

    auto result = ranker.rank(candidates, tokens("ocean"));
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().index, 0u);
    EXPECT_EQ(result.value().iterations, 1u);
    EXPECT_NEAR(result.value().topProbability, 1.0, 1e-12);
}

TEST(QuantumRankerTest, EmptyCandidateSetFails) {
    QuantumRanker ranker;
    auto result = ranker.rank({}, tokens("anything"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::EmptyCandidateSet);
}

TEST(QuantumRankerTest, EmptyTokenSetIsInvalidQuery) {
    QuantumRanker ranker;
    std::vector<catalog::Movie> candidates{makeMovie(27205, "Inception", "dream heist", 10.0),
                                           makeMovie(597, "Titanic", "ship romance", 80.0)};

    auto result = ranker.rank(candidates, TokenSet{});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::InvalidQuery);

    auto none = ranker.rank({}, TokenSet{});
    ASSERT_FALSE(none);
    EXPECT_EQ(none.error().code, ErrorCode::EmptyCandidateSet);
}

TEST(QuantumRankerTest, IndexAndIterationsInRangeAcrossSizes) {
    QuantumRanker ranker;
    const std::vector<std::string> words{"space", "heist", "dream", "ship", "shark", "robot"};
    auto query = tokens("space robot heist");

    for (size_t n = 1; n <= 40; ++n) {
        std::vector<catalog::Movie> candidates;
        for (size_t i = 0; i < n; ++i) {
            candidates.push_back(makeMovie(static_cast<MovieId>(i + 1), "Movie " + std::to_string(i),
                                           words[i % words.size()] + " " + words[(i * 5) % words.size()],
                                           static_cast<double>((i * 37) % 100)));
        }
        auto result = ranker.rank(candidates, query);
        ASSERT_TRUE(result) << "N=" << n;
        EXPECT_LT(result.value().index, n);
        EXPECT_GE(result.value().iterations, 1u);
        EXPECT_LE(result.value().iterations, n);
        EXPECT_GE(result.value().markedCount, 1u);
    }
}

TEST(QuantumRankerTest, IsDeterministic) {
    QuantumRanker ranker;
    auto candidates = heistCandidates();
    auto query = tokens("bank heist");

    auto first = ranker.rank(candidates, query);
    ASSERT_TRUE(first);
    for (int i = 0; i < 10; ++i) {
        auto again = ranker.rank(candidates, query);
        ASSERT_TRUE(again);
        EXPECT_EQ(again.value().index, first.value().index);
        EXPECT_EQ(again.value().iterations, first.value().iterations);
        EXPECT_DOUBLE_EQ(again.value().topProbability, first.value().topProbability);
    }
}
