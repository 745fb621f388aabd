#include "core/DetectorConfig.h"
#include "forensic/FakeprintDetector.h"
#include "forensic/ResultSerializer.h"
#include "forensic/ScoreReporter.h"

#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace SynthScan;

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] FILE...\n";
    std::cout << "Options:\n";
    std::cout << "  --config FILE  Load settings from a JSON file\n";
    std::cout << "  --model FILE   Classify with a trained linear model\n";
    std::cout << "  --json         Print results as JSON\n";
    std::cout << "  --verbose      Print the full score breakdown\n";
    std::cout << "  --info         Show detector information\n";
    std::cout << "  --version      Show version\n";
    std::cout << "  --help         Show this help\n";
}

void printInfo(std::ostream& out, const Forensic::DetectorInfo& info) {
    out << info.name << " v" << info.version << "\n";
    out << "  Method:          " << info.method << "\n";
    out << "  Frequency range: " << info.frequencyRange << "\n";
    out << "  Model status:    " << info.modelStatus << "\n";
    out << "  Formats:        ";
    for (const auto& ext : info.supportedFormats) {
        out << " " << ext;
    }
    out << "\n  Max duration:    " << info.maxDurationSeconds << " sec\n";
}

void printAnalysis(std::ostream& out, const Forensic::FileAnalysis& analysis, bool verbose) {
    const auto& result = analysis.result;

    out << analysis.filename << ": "
        << (result.isAiGenerated ? "AI-generated" : "human") << std::fixed << std::setprecision(1)
        << " (AI " << result.aiProbability << "%, human " << result.humanProbability
        << "%, confidence " << std::setprecision(2) << result.confidence << ")"
        << std::defaultfloat << "\n";
    out << "  duration " << std::setprecision(2) << std::fixed << analysis.durationSeconds
        << " sec, quality " << analysis.quality << std::defaultfloat << "\n";

    if (verbose && result.details) {
        Forensic::ScoreReporter(out).print(*result.details);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath;
    std::string modelPath;
    bool jsonOutput = false;
    bool verbose = false;
    bool showInfo = false;
    std::vector<std::string> files;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "--model") {
            if (i + 1 >= argc) {
                std::cerr << arg << " requires a file argument\n";
                return 1;
            }
            (arg == "--config" ? configPath : modelPath) = argv[++i];
        } else if (arg == "--json") {
            jsonOutput = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--info") {
            showInfo = true;
        } else if (arg == "--version") {
            std::cout << "Version: " << Forensic::FakeprintDetector::kVersion << "\n";
            return 0;
        } else if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        } else {
            files.push_back(arg);
        }
    }

    if (files.empty() && !showInfo) {
        printUsage(argv[0]);
        return 1;
    }

    // Keep stdout clean for JSON; component logs go to stderr instead
    std::ostream out(std::cout.rdbuf());
    if (jsonOutput) {
        std::cout.rdbuf(std::cerr.rdbuf());
    }

    Core::DetectorConfig config;
    std::unique_ptr<Forensic::FakeprintDetector> detector;
    try {
        if (!configPath.empty()) {
            config = Core::DetectorConfig::fromJsonFile(configPath);
        }
        config.applyEnvironment();
        config.verbose = config.verbose || verbose;

        detector = std::make_unique<Forensic::FakeprintDetector>(config);
    } catch (const Core::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        std::cout.rdbuf(out.rdbuf());
        return 1;
    }

    if (!modelPath.empty() && !detector->loadModel(modelPath)) {
        std::cerr << "Continuing with heuristic classification\n";
    }

    int exitCode = 0;

    if (showInfo) {
        if (jsonOutput) {
            out << Forensic::ResultSerializer::toJson(detector->getInfo()).dump(2) << "\n";
        } else {
            printInfo(out, detector->getInfo());
        }
    }

    if (files.size() == 1) {
        try {
            Forensic::FileAnalysis analysis = detector->analyzeFile(files.front());
            if (jsonOutput) {
                out << Forensic::ResultSerializer::toJson(analysis).dump(2) << "\n";
            } else {
                printAnalysis(out, analysis, config.verbose);
            }
        } catch (const std::exception& e) {
            if (jsonOutput) {
                out << Forensic::ResultSerializer::errorJson(files.front(), e.what()).dump(2) << "\n";
            }
            std::cerr << "Error analyzing " << files.front() << ": " << e.what() << "\n";
            exitCode = 1;
        }
    } else if (files.size() > 1) {
        Forensic::BatchResult batch = detector->analyzeBatch(files);
        if (jsonOutput) {
            out << Forensic::ResultSerializer::toJson(batch).dump(2) << "\n";
        } else {
            for (const auto& item : batch.items) {
                if (item.success) {
                    printAnalysis(out, *item.analysis, config.verbose);
                } else {
                    out << item.filename << ": error: " << item.error << "\n";
                }
            }
            out << batch.succeeded() << "/" << batch.total() << " files analyzed\n";
        }
    }

    std::cout.rdbuf(out.rdbuf());
    return exitCode;
}
