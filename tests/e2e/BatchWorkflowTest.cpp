#include <gtest/gtest.h>
#include "core/AudioBuffer.h"
#include "core/DetectorConfig.h"
#include "dsp/AudioFile.h"
#include "forensic/FakeprintDetector.h"
#include "forensic/ResultSerializer.h"
#include "forensic/ScoreReporter.h"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

using namespace SynthScan;

/**
 * @brief End-to-end batch run: config file -> detector -> files -> JSON report
 *
 * Mirrors what the command-line tool does for several inputs, including a
 * corrupt file in the middle of the batch.
 */
class BatchWorkflowTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = "/tmp/synthscan_e2e";
        std::filesystem::create_directories(testDir);
    }

    void TearDown() override {
        if (std::filesystem::exists(testDir)) {
            std::filesystem::remove_all(testDir);
        }
    }

    std::string writeTone(const std::string& name, double frequency, int sampleRate) {
        const int numSamples = sampleRate * 2;
        Core::AudioBuffer buffer(2, numSamples);
        for (int i = 0; i < numSamples; ++i) {
            const float s = 0.4f * static_cast<float>(std::sin(2.0 * M_PI * frequency * i / sampleRate));
            buffer.getWritePointer(0)[i] = s;
            buffer.getWritePointer(1)[i] = 0.5f * s;
        }

        std::string path = testDir + "/" + name;
        DSP::AudioFile audioFile;
        EXPECT_TRUE(audioFile.save(path, buffer, sampleRate, 24));
        return path;
    }

    std::string writeCorrupt(const std::string& name) {
        std::string path = testDir + "/" + name;
        std::ofstream file(path, std::ios::binary);
        file << "RIFF0000WAVEjunk";
        return path;
    }

    std::string testDir;
};

TEST_F(BatchWorkflowTest, E2E_BatchWithCorruptFile) {
    std::vector<std::string> paths = {
        writeTone("first.wav", 440.0, 16000),
        writeCorrupt("second.wav"),
        writeTone("third.wav", 6500.0, 48000),
    };

    Forensic::FakeprintDetector detector;
    Forensic::BatchResult batch = detector.analyzeBatch(paths);

    ASSERT_EQ(batch.total(), 3u);
    EXPECT_EQ(batch.succeeded(), 2u);

    EXPECT_TRUE(batch.items[0].success);
    EXPECT_EQ(batch.items[0].filename, "first.wav");
    EXPECT_FALSE(batch.items[1].success);
    EXPECT_EQ(batch.items[1].filename, "second.wav");
    EXPECT_FALSE(batch.items[1].error.empty());
    EXPECT_FALSE(batch.items[1].analysis.has_value());
    EXPECT_TRUE(batch.items[2].success);
    EXPECT_EQ(batch.items[2].filename, "third.wav");

    nlohmann::json report = Forensic::ResultSerializer::toJson(batch);
    EXPECT_EQ(report["status"], "success");
    EXPECT_EQ(report["total"].get<size_t>(), 3u);
    ASSERT_EQ(report["results"].size(), 3u);
    EXPECT_EQ(report["results"][0]["status"], "success");
    EXPECT_TRUE(report["results"][0].contains("details"));
    EXPECT_EQ(report["results"][1]["status"], "error");
    EXPECT_TRUE(report["results"][1].contains("error"));
    EXPECT_EQ(report["results"][2]["status"], "success");

    // Report survives a round trip through text
    nlohmann::json parsed = nlohmann::json::parse(report.dump(2));
    EXPECT_EQ(parsed, report);
}

TEST_F(BatchWorkflowTest, E2E_ConfigDrivesDetector) {
    std::string configPath = testDir + "/config.json";
    {
        std::ofstream file(configPath);
        file << R"({"max_duration": 1.0, "allowed_extensions": ["wav", "wave"]})";
    }

    Core::DetectorConfig config = Core::DetectorConfig::fromJsonFile(configPath);
    Forensic::FakeprintDetector detector(config);

    std::string wav = writeTone("clip.wav", 1000.0, 16000);
    std::string wave = testDir + "/clip.wave";
    std::filesystem::copy_file(wav, wave);

    Forensic::BatchResult batch = detector.analyzeBatch({wav, wave, testDir + "/clip.flac"});
    ASSERT_EQ(batch.total(), 3u);
    EXPECT_TRUE(batch.items[0].success);
    EXPECT_TRUE(batch.items[1].success);
    EXPECT_FALSE(batch.items[2].success);

    // Duration reflects the capped audio
    EXPECT_NEAR(batch.items[0].analysis->durationSeconds, 1.0, 1e-9);
}

TEST_F(BatchWorkflowTest, E2E_VerboseReport) {
    Forensic::FakeprintDetector detector;
    Forensic::FileAnalysis analysis = detector.analyzeFile(writeTone("tone.wav", 440.0, 16000));
    ASSERT_TRUE(analysis.result.details.has_value());

    std::ostringstream out;
    Forensic::ScoreReporter reporter(out);
    reporter.print(*analysis.result.details);

    const std::string text = out.str();
    EXPECT_NE(text.find("SCORE"), std::string::npos);
    EXPECT_NE(text.find("CONCLUSION"), std::string::npos);
}
