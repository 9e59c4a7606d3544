#include "core/gcode_generator.h"
#include "core/pattern_expander.h"
#include "core/preview.h"
#include "core/tube_void.h"
#include "core/validator.h"
#include "nwss-toolpath/config.h"
#include "nwss-toolpath/job_file.h"
#include "nwss-toolpath/utils.h"

#include <iostream>
#include <string>
#include <vector>

using namespace nwss::toolpath;

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " <job_file> [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config <file>         Settings file (default: nwss-toolpath.conf)" << std::endl;
    std::cout << "  --output <dir>          Output base directory (default: output)" << std::endl;
    std::cout << "  --preview <file>        Write an SVG preview of the operations" << std::endl;
    std::cout << "  --coords <mode>         Preview coordinate labels [off, feature, toolpath] (default: off)" << std::endl;
    std::cout << "  --no-subroutines        Inline every operation (no M98 calls)" << std::endl;
    std::cout << "  --validate-only         Check the job and stop" << std::endl;
    std::cout << "  --verbose               Print debug diagnostics" << std::endl;
}

void printMessages(const std::string& title, const std::vector<std::string>& messages) {
    if (messages.empty()) {
        return;
    }
    std::cout << title << ":" << std::endl;
    for (const auto& message : messages) {
        std::cout << "  - " << message << std::endl;
    }
}

bool writePreview(const Project& project, const GenerationSettings& settings,
                  const ToolParams& tool, ToolType toolType, CoordsMode coords,
                  const std::string& previewFile) {
    ExpandedOperations expanded;
    try {
        expanded = PatternExpander::expandAll(project.operations);
    } catch (const std::exception& e) {
        std::cerr << "Error: Could not expand operations for the preview: " << e.what() << std::endl;
        return false;
    }

    const ToolParams* cutParams = toolType == ToolType::END_MILL ? &tool : nullptr;
    double drillDiameter = toolType == ToolType::DRILL ? tool.toolDiameter : 0.0;
    double endMillDiameter = cutParams ? cutParams->toolDiameter : 0.0;
    TubeVoid::FilterResult filtered = TubeVoid::filter(expanded, project.material,
                                                       project.tubeVoidSkip,
                                                       drillDiameter, endMillDiameter);

    PreviewOptions options = PreviewRenderer::optionsFor(project, settings, cutParams, coords);
    Scene scene = PreviewRenderer::render(filtered.operations, options);

    std::cout << "Generating preview: " << previewFile << std::endl;
    if (!Utils::writePreviewSVG(scene, previewFile)) {
        return false;
    }
    std::cout << "Preview created successfully." << std::endl;
    return true;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    // Parse command line arguments
    std::string jobFile = argv[1];
    std::string configFile = "nwss-toolpath.conf";
    std::string outputDir = "output";
    std::string previewFile;
    CoordsMode coords = CoordsMode::OFF;
    bool noSubroutines = false;
    bool validateOnly = false;
    bool verbose = false;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        }
        else if (arg == "--output" && i + 1 < argc) {
            outputDir = argv[++i];
        }
        else if (arg == "--preview" && i + 1 < argc) {
            previewFile = argv[++i];
        }
        else if (arg == "--coords" && i + 1 < argc) {
            std::string mode = argv[++i];
            if (!parseCoordsMode(mode, coords)) {
                std::cerr << "Error: Unknown coordinate mode: " << mode << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        }
        else if (arg == "--no-subroutines") {
            noSubroutines = true;
        }
        else if (arg == "--validate-only") {
            validateOnly = true;
        }
        else if (arg == "--verbose") {
            verbose = true;
        }
        else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    // Settings: first run writes the defaults so they can be edited
    ToolpathConfig config;
    if (ToolpathConfig::isFirstRun(configFile)) {
        std::cout << "No settings file found, writing defaults to: " << configFile << std::endl;
        if (!config.saveToFile(configFile)) {
            std::cerr << "Error: Continuing with default settings." << std::endl;
        }
    } else if (!config.loadFromFile(configFile)) {
        std::cerr << "Error: Failed to load settings file." << std::endl;
        return 1;
    }

    // Operations
    std::cout << "Reading job file: " << jobFile << std::endl;
    JobFile job;
    if (!job.loadFromFile(jobFile)) {
        std::cerr << "Error: Failed to parse job file." << std::endl;
        for (const auto& error : job.getErrors()) {
            std::cerr << "  " << error << std::endl;
        }
        return 1;
    }

    Project project = job.getProject();
    project.material = config.toMaterialSpec();

    GenerationSettings settings = config.toGenerationSettings();
    settings.verbose = verbose;
    if (noSubroutines) {
        settings.supportsSubroutines = false;
    }

    ToolParams tool = config.toToolParams();
    const ToolParams* drillParams = config.getToolType() == ToolType::DRILL ? &tool : nullptr;
    const ToolParams* cutParams = config.getToolType() == ToolType::END_MILL ? &tool : nullptr;

    std::cout << "Project: " << project.name << " (" << toString(project.type) << ")" << std::endl;
    std::cout << "  Drill operations: " << project.operations.drillHoles.size() << std::endl;
    std::cout << "  Circle operations: " << project.operations.circularCuts.size() << std::endl;
    std::cout << "  Hexagon operations: " << project.operations.hexagonalCuts.size() << std::endl;
    std::cout << "  Line operations: " << project.operations.lineCuts.size() << std::endl;
    std::cout << "  Tool: " << config.getToolTypeString() << " "
              << Utils::formatNumber(tool.toolDiameter, 4) << " in" << std::endl;

    if (validateOnly) {
        ValidationReport report = Validator::validateProject(project, settings, drillParams, cutParams);
        printMessages("Warnings", report.warnings);
        printMessages("Errors", report.errors);
        if (!report.isValid()) {
            std::cerr << "Error: Validation failed." << std::endl;
            return 1;
        }
        std::cout << "Validation passed." << std::endl;
        return 0;
    }

    GenerationResult result = GCodeGenerator::generateProject(project, settings, drillParams, cutParams);
    printMessages("Warnings", result.warnings);
    printMessages("Skipped (tube void)", result.skippedOperations);

    if (!result.isValid()) {
        printMessages("Errors", result.errors);
        std::cerr << "Error: G-code generation failed." << std::endl;
        return 1;
    }

    double materialDepth = GCodeGenerator::projectMaterialDepth(project, settings, drillParams);
    std::string configDump = Utils::formatConfigDump(project, config, materialDepth);

    std::string directory;
    if (!Utils::writeOutputDirectory(outputDir, result, configDump, directory)) {
        std::cerr << "Error: Failed to write output files." << std::endl;
        return 1;
    }
    std::cout << "Wrote main.tap and " << result.subroutines.size()
              << " subroutine files to: " << directory << std::endl;

    if (!previewFile.empty() &&
        !writePreview(project, settings, tool, config.getToolType(), coords, previewFile)) {
        return 1;
    }

    return 0;
}
