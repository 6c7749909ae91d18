#include "AudioFileAnalyzer.h"
#include "ClassifierConfig.h"
#include "FootstepTypes.h"
#include <iostream>

namespace
{
    juce::String pad(const juce::String& text, int width)
    {
        return text.paddedRight(' ', width);
    }

    float parseOffset(const juce::ArgumentList& args, const juce::String& option)
    {
        const auto value = args.getValueForOption(option);

        if (!value.containsAnyOf("0123456789"))
            juce::ConsoleApplication::fail("Expected a number for " + option);

        return value.getFloatValue();
    }

    void applySettings(const juce::ArgumentList& args, AnalysisContext& context)
    {
        if (args.containsOption("--sensitivity"))
            context.setSensitivityOffset(parseOffset(args, "--sensitivity"));

        if (args.containsOption("--calibration"))
            context.setCalibrationOffset(parseOffset(args, "--calibration"));
    }

    ClassifierConfig loadClassifierConfig(const juce::ArgumentList& args)
    {
        ClassifierConfig config;

        if (!args.containsOption("--config"))
            return config;

        const auto file = juce::File::getCurrentWorkingDirectory().getChildFile(args.getValueForOption("--config"));
        const auto result = ClassifierConfig::loadFromXmlFile(file, config);

        if (result.failed())
            juce::ConsoleApplication::fail(result.getErrorMessage());

        return config;
    }

    void printResults(const juce::File& file, const AudioFileAnalyzer::Results& results, const AnalysisContext& context)
    {
        const auto& summary = results.summary;
        const auto rule = juce::String::repeatedString("=", 60);

        std::cout << rule << "\n"
                  << "File: " << file.getFileName() << "\n"
                  << "Duration: " << juce::String(summary.durationSeconds, 2) << "s\n"
                  << "Sensitivity: " << context.getSensitivitySettings().getSensitivityLabel()
                  << ", calibration " << context.getSensitivitySettings().getCalibrationLabel() << "\n"
                  << "Ambient level: " << juce::String(summary.ambientLevel, 1) << " dB"
                  << (summary.ambientCalibrated ? "" : " (not calibrated)") << "\n"
                  << "Total events detected: " << summary.totalEvents << "\n"
                  << juce::String::repeatedString("-", 60) << "\n";

        for (auto type : FootstepTypes::getAllTypes())
            if (const auto count = summary.getCount(type); count > 0)
                std::cout << "  " << pad(FootstepTypes::getDisplayName(type), 18) << count << "\n";

        if (summary.totalEvents > 0)
            std::cout << "Average dB: " << juce::String(summary.averageDecibels, 1) << "\n"
                      << "Average frequency: " << juce::String(summary.averageDominantFrequency, 0) << " Hz\n";

        std::cout << "\n";

        int index = 1;
        for (const auto& event : results.events)
        {
            const auto& c = event.classification;
            std::cout << pad(juce::String(index++), 4)
                      << pad(juce::String(event.timestampInRecording, 2) + "s", 10)
                      << pad(FootstepTypes::getDisplayName(c.type), 18)
                      << pad(juce::String(c.decibelLevel, 1) + " dB", 10)
                      << pad(juce::String(c.dominantFrequency, 0) + " Hz", 10)
                      << juce::roundToInt(c.confidence * 100.0f) << "%\n";
        }

        std::cout << rule << std::endl;
    }

    void runAnalyse(const juce::ArgumentList& args)
    {
        args.checkMinNumArguments(2);
        const auto file = args[1].resolveAsExistingFile();

        AnalysisContext context;
        applySettings(args, context);

        AudioFileAnalyzer analyzer(context, loadClassifierConfig(args));
        AudioFileAnalyzer::Results results;

        const auto result = analyzer.analyse(file, results);

        if (result.failed())
            juce::ConsoleApplication::fail(result.getErrorMessage());

        printResults(file, results, context);
    }

    void runProfile(const juce::ArgumentList& args)
    {
        args.checkMinNumArguments(2);
        const auto file = args[1].resolveAsExistingFile();

        auto threshold = AudioFileAnalyzer::defaultProfileThresholdDb;

        if (args.containsOption("--threshold"))
            threshold = parseOffset(args, "--threshold");

        AnalysisContext context;
        applySettings(args, context);

        AudioFileAnalyzer analyzer(context);
        std::vector<SpectralProfile> profiles;

        const auto result = analyzer.spectralProfile(file, threshold, profiles);

        if (result.failed())
            juce::ConsoleApplication::fail(result.getErrorMessage());

        std::cout << "Spectral profile of " << file.getFileName() << ": " << (int) profiles.size()
                  << " buffers at or above " << juce::String(threshold, 1) << " dB\n";

        for (const auto& p : profiles)
        {
            std::cout << pad(juce::String(p.timestamp, 2) + "s", 10)
                      << "dB " << pad(juce::String(p.decibelLevel, 1), 7)
                      << "dom " << pad(juce::String(p.dominantFrequency, 0) + " Hz", 10)
                      << "centroid " << pad(juce::String(p.spectralCentroid, 0) + " Hz", 10)
                      << "crest " << pad(juce::String(p.crestFactor, 2), 7)
                      << "impact " << juce::String(p.impactRatio * 100.0f, 0) << "% "
                      << "lowMid " << juce::String(p.lowMidRatio * 100.0f, 0) << "% "
                      << "mid " << juce::String(p.midRatio * 100.0f, 0) << "% "
                      << "highMid " << juce::String(p.highMidRatio * 100.0f, 0) << "% "
                      << "high " << juce::String(p.highRatio * 100.0f, 0) << "%\n";
        }

        std::cout << std::flush;
    }
}

int main(int argc, char* argv[])
{
    juce::ConsoleApplication app;

    app.addHelpCommand("--help|-h", "FootstepAnalyzer: detects and classifies footstep noise in recordings", true);
    app.addVersionCommand("--version|-v", "FootstepAnalyzer 1.0.0");

    app.addCommand({ "analyse",
                     "analyse <file> [--sensitivity=<dB>] [--calibration=<dB>] [--config=<xml>]",
                     "Detects footsteps in an audio file and prints the events and a summary",
                     "Sensitivity is clamped to [-10, 10] dB (positive = fewer detections), calibration to [-20, 20] dB.\n"
                     "--config loads a <ClassifierConfig> XML file.",
                     runAnalyse });

    app.addCommand({ "profile",
                     "profile <file> [--threshold=<dB>] [--calibration=<dB>]",
                     "Prints the level and band balance of loud buffers",
                     "Buffers below the threshold (default 35 dB) or closer than 0.25 s to the previous profile are skipped.",
                     runProfile });

    return app.findAndRunCommand(argc, argv);
}
