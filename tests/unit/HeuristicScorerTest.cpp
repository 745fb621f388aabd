#include <gtest/gtest.h>
#include "forensic/Classifier.h"
#include "forensic/HeuristicScorer.h"
#include <random>

using namespace SynthScan::Forensic;
using Bucket = HeuristicScorer::Bucket;

class HeuristicScorerTest : public ::testing::Test {
protected:
    static Fakeprint evenlySpacedPeaks(size_t length, size_t spacing) {
        Fakeprint fakeprint;
        fakeprint.values.assign(length, 0.0);
        fakeprint.frequencies.assign(length, 0.0);
        for (size_t i = 0; i < length; i += spacing) {
            fakeprint.values[i] = 1.0;
        }
        return fakeprint;
    }

    HeuristicScorer scorer;
    FeatureExtractor extractor;
};

// ============================================================================
// Buckets
// ============================================================================

TEST_F(HeuristicScorerTest, PeakCountBucket) {
    EXPECT_NEAR(HeuristicScorer::evaluateBucket(Bucket::PeakCount, 49), 14.7, 1e-12);
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::PeakCount, 50), 20.0);
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::PeakCount, 150), 20.0);
    EXPECT_NEAR(HeuristicScorer::evaluateBucket(Bucket::PeakCount, 160), 19.0, 1e-12);
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::PeakCount, 400), 0.0);
}

TEST_F(HeuristicScorerTest, HighPeakCountBucket) {
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::HighPeakCount, 4), 12.0);
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::HighPeakCount, 5), 15.0);
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::HighPeakCount, 30), 15.0);
    EXPECT_NEAR(HeuristicScorer::evaluateBucket(Bucket::HighPeakCount, 40), 13.0, 1e-12);
    // Penalty capped at 10
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::HighPeakCount, 100), 5.0);
}

TEST_F(HeuristicScorerTest, MeanIntensityBucket) {
    EXPECT_NEAR(HeuristicScorer::evaluateBucket(Bucket::MeanIntensity, 0.05), 12.5, 1e-12);
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::MeanIntensity, 0.06), 15.0);
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::MeanIntensity, 0.10), 15.0);
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::MeanIntensity, 0.11), 10.0);
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::MeanIntensity, 0.12), 10.0);
    EXPECT_NEAR(HeuristicScorer::evaluateBucket(Bucket::MeanIntensity, 0.13), 7.2, 1e-12);
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::MeanIntensity, 0.5), 0.0);
}

TEST_F(HeuristicScorerTest, MaxIntensityBucket) {
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::MaxIntensity, 0.9), 8.0);
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::MaxIntensity, 0.8), 6.0);
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::MaxIntensity, 0.7), 6.0);
    EXPECT_NEAR(HeuristicScorer::evaluateBucket(Bucket::MaxIntensity, 0.6), 6.0, 1e-12);
    EXPECT_NEAR(HeuristicScorer::evaluateBucket(Bucket::MaxIntensity, 0.3), 3.0, 1e-12);
}

TEST_F(HeuristicScorerTest, Percentile90Bucket) {
    EXPECT_NEAR(HeuristicScorer::evaluateBucket(Bucket::Percentile90, 0.1), 8.0, 1e-12);
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::Percentile90, 0.12), 10.0);
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::Percentile90, 0.22), 10.0);
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::Percentile90, 0.25), 5.0);
    EXPECT_NEAR(HeuristicScorer::evaluateBucket(Bucket::Percentile90, 0.3), 2.7, 1e-12);
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::Percentile90, 1.0), 0.0);
}

TEST_F(HeuristicScorerTest, PeriodicityBucket) {
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::Periodicity, 0.6), 12.0);
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::Periodicity, 0.5), 8.0);
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::Periodicity, 0.45), 8.0);
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::Periodicity, 0.4), 4.0);
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::Periodicity, 0.3), 2.0);
    EXPECT_NEAR(HeuristicScorer::evaluateBucket(Bucket::Periodicity, 0.2), 1.6, 1e-12);
    EXPECT_NEAR(HeuristicScorer::evaluateBucket(Bucket::Periodicity, 0.1), 0.8, 1e-12);
}

TEST_F(HeuristicScorerTest, KurtosisBonusBucket) {
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::KurtosisBonus, 16.0), 20.0);
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::KurtosisBonus, 15.0), 20.0);
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::KurtosisBonus, 12.0), 17.0);
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::KurtosisBonus, 10.0), 15.0);
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::KurtosisBonus, 8.0), 11.5);
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::KurtosisBonus, 6.0), 8.0);
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::KurtosisBonus, 5.0), 4.0);
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::KurtosisBonus, 4.0), 0.0);
    EXPECT_DOUBLE_EQ(HeuristicScorer::evaluateBucket(Bucket::KurtosisBonus, 2.0), 0.0);
}

TEST_F(HeuristicScorerTest, HighFrequencyAdjustment) {
    EXPECT_DOUBLE_EQ(HeuristicScorer::highFrequencyAdjustment(0.0, 0.0, 0.0), 3.0);
    EXPECT_DOUBLE_EQ(HeuristicScorer::highFrequencyAdjustment(0.0, 11.0, 0.0), 10.0);
    EXPECT_DOUBLE_EQ(HeuristicScorer::highFrequencyAdjustment(0.0, 0.0, 0.6), 10.0);
    EXPECT_DOUBLE_EQ(HeuristicScorer::highFrequencyAdjustment(0.0, 10.0, 0.5), 3.0);
    EXPECT_DOUBLE_EQ(HeuristicScorer::highFrequencyAdjustment(1e-7, 20.0, 1.0), 2.0);
    EXPECT_DOUBLE_EQ(HeuristicScorer::highFrequencyAdjustment(5e-6, 0.0, 0.0), 2.0);
    EXPECT_DOUBLE_EQ(HeuristicScorer::highFrequencyAdjustment(2e-5, 0.0, 0.0), -3.0);
    EXPECT_DOUBLE_EQ(HeuristicScorer::highFrequencyAdjustment(1e-4, 0.0, 0.0), 0.0);
}

// ============================================================================
// Full scoring
// ============================================================================

TEST_F(HeuristicScorerTest, SilenceScoresLow) {
    Fakeprint silence;
    silence.values.assign(3072, 0.0);
    silence.frequencies.assign(3072, 0.0);

    ScoreDetail detail = scorer.score(extractor.extract(silence, 0.0));

    EXPECT_DOUBLE_EQ(detail.regularityMultiplier, 1.0);
    EXPECT_DOUBLE_EQ(detail.peakCountPoints, 0.0);
    EXPECT_DOUBLE_EQ(detail.meanIntensityPoints, 0.0);
    EXPECT_DOUBLE_EQ(detail.maxIntensityPoints, 0.0);
    EXPECT_DOUBLE_EQ(detail.kurtosisBonus, 0.0);
    EXPECT_DOUBLE_EQ(detail.hfAdjustment, 3.0);
    EXPECT_FALSE(detail.combinedIndicator);
    EXPECT_DOUBLE_EQ(detail.score, 3.0);
    EXPECT_FALSE(detail.isAiGenerated());
}

TEST_F(HeuristicScorerTest, RegularPeaksScoreHigh) {
    ScoreDetail detail = scorer.score(extractor.extract(evenlySpacedPeaks(1000, 10), 0.0));

    EXPECT_EQ(detail.features.peakCountMedium, 100);
    EXPECT_NEAR(detail.regularityMultiplier, 2.0, 0.01);
    EXPECT_NEAR(detail.peakCountPoints, 40.0, 0.1);
    EXPECT_TRUE(detail.combinedIndicator);
    EXPECT_DOUBLE_EQ(detail.combinedBonus, 15.0);
    EXPECT_DOUBLE_EQ(detail.abundanceBonus, 5.0);
    EXPECT_GT(detail.rawScore, 100.0);
    EXPECT_DOUBLE_EQ(detail.score, 100.0);
    EXPECT_GT(detail.score, 70.0);
    EXPECT_TRUE(detail.isAiGenerated());
}

TEST_F(HeuristicScorerTest, NegativeTotalClipsToZero) {
    FeatureVector features;
    features.highFreqEnergy = 2e-5;

    ScoreDetail detail = scorer.score(features);
    EXPECT_DOUBLE_EQ(detail.rawScore, -3.0);
    EXPECT_DOUBLE_EQ(detail.score, 0.0);
}

TEST_F(HeuristicScorerTest, CombinedIndicatorRequiresAllThree) {
    FeatureVector features;
    features.kurtosis = 7.0;
    features.highFreqEnergy = 1e-5;
    features.peakRegularityScore = 0.4;
    EXPECT_TRUE(scorer.score(features).combinedIndicator);

    features.kurtosis = 10.0;
    EXPECT_FALSE(scorer.score(features).combinedIndicator);

    features.kurtosis = 7.0;
    features.highFreqEnergy = 5e-5;
    EXPECT_FALSE(scorer.score(features).combinedIndicator);

    features.highFreqEnergy = 1e-5;
    features.peakRegularityScore = 0.3;
    EXPECT_FALSE(scorer.score(features).combinedIndicator);
}

TEST_F(HeuristicScorerTest, AbundanceBonus) {
    FeatureVector features;
    features.peakCountMedium = 51;
    features.peakRegularityScore = 0.61;
    EXPECT_DOUBLE_EQ(scorer.score(features).abundanceBonus, 5.0);

    features.peakCountMedium = 50;
    EXPECT_DOUBLE_EQ(scorer.score(features).abundanceBonus, 0.0);
}

TEST_F(HeuristicScorerTest, SameFeaturesGiveIdenticalDetail) {
    FeatureVector features = extractor.extract(evenlySpacedPeaks(900, 7), 3e-6);

    ScoreDetail first = scorer.score(features);
    ScoreDetail second = scorer.score(features);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first.features, features);
}

TEST_F(HeuristicScorerTest, ScoreAndVerdictStayInRange) {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> count(0, 400);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::uniform_real_distribution<double> kurt(0.0, 30.0);
    std::uniform_real_distribution<double> hf(0.0, 1e-4);

    for (int trial = 0; trial < 500; ++trial) {
        FeatureVector f;
        f.peakCountMedium = count(rng);
        f.peakCountHigh = count(rng) / 4;
        f.peakRegularityScore = unit(rng);
        f.mean = unit(rng) * 0.3;
        f.maxValue = unit(rng);
        f.p90 = unit(rng) * 0.5;
        f.periodicityScore = unit(rng);
        f.kurtosis = kurt(rng);
        f.highFreqEnergy = hf(rng);

        ScoreDetail detail = scorer.score(f);
        ASSERT_GE(detail.score, 0.0);
        ASSERT_LE(detail.score, 100.0);

        ClassificationResult result = HeuristicClassifier::fromScore(detail);
        EXPECT_EQ(result.isAiGenerated, detail.score > 50.0);
        EXPECT_GE(result.confidence, 0.0);
        EXPECT_LE(result.confidence, 1.0);
        EXPECT_DOUBLE_EQ(result.aiProbability + result.humanProbability, 100.0);
    }
}

// ============================================================================
// Heuristic classifier
// ============================================================================

TEST_F(HeuristicScorerTest, ClassifierResultContract) {
    HeuristicClassifier classifier;
    FakeprintAnalysis analysis;
    analysis.fakeprint = evenlySpacedPeaks(1000, 10);
    analysis.features = extractor.extract(analysis.fakeprint, 0.0);

    ClassificationResult result = classifier.classify(analysis);
    EXPECT_EQ(classifier.getName(), "heuristic");
    EXPECT_TRUE(result.isAiGenerated);
    EXPECT_DOUBLE_EQ(result.aiProbability, 100.0);
    EXPECT_DOUBLE_EQ(result.humanProbability, 0.0);
    EXPECT_DOUBLE_EQ(result.confidence, 1.0);
    ASSERT_TRUE(result.details.has_value());
    EXPECT_EQ(result.details->features, analysis.features);
}

TEST_F(HeuristicScorerTest, ConfidenceIsDistanceFromThreshold) {
    ScoreDetail detail;
    detail.score = 30.0;
    ClassificationResult result = HeuristicClassifier::fromScore(detail);
    EXPECT_FALSE(result.isAiGenerated);
    EXPECT_DOUBLE_EQ(result.confidence, 0.4);

    detail.score = 50.0;
    result = HeuristicClassifier::fromScore(detail);
    EXPECT_FALSE(result.isAiGenerated);
    EXPECT_DOUBLE_EQ(result.confidence, 0.0);
}
