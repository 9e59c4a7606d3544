#include "nwss-toolpath/utils.h"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <iostream>
#include <system_error>

namespace nwss {
namespace toolpath {

namespace {

const std::string RULE(60, '=');
const std::string SECTION_RULE(40, '-');

void section(std::ostringstream& out, const std::string& title) {
    out << SECTION_RULE << "\n" << title << "\n" << SECTION_RULE << "\n";
}

const char* yesNo(bool value) {
    return value ? "True" : "False";
}

} // namespace

bool Utils::writeTextFile(const std::string& filename, const std::string& content) {
    std::ofstream outFile(filename, std::ios::binary);
    if (!outFile.is_open()) {
        std::cerr << "Error: Could not open file for writing: " << filename << std::endl;
        return false;
    }

    outFile << content;
    outFile.close();
    if (!outFile) {
        std::cerr << "Error: Failed while writing: " << filename << std::endl;
        return false;
    }
    return true;
}

bool Utils::writeOutputDirectory(const std::string& baseDir,
                                 const GenerationResult& result,
                                 const std::string& configDump,
                                 std::string& directory) {
    if (!result.isValid()) {
        std::cerr << "Error: Refusing to write output for a failed generation" << std::endl;
        return false;
    }

    std::filesystem::path projectDir = std::filesystem::path(baseDir) / result.projectName;
    std::error_code ec;
    std::filesystem::create_directories(projectDir, ec);
    if (ec) {
        std::cerr << "Error: Could not create output directory " << projectDir.string()
                  << ": " << ec.message() << std::endl;
        return false;
    }
    directory = projectDir.string();

    if (!writeTextFile((projectDir / "main.tap").string(), result.mainProgram)) {
        return false;
    }

    for (const auto& subroutine : result.subroutines) {
        std::string name = std::to_string(subroutine.first) + ".nc";
        if (!writeTextFile((projectDir / name).string(), subroutine.second)) {
            return false;
        }
    }

    return writeTextFile((projectDir / "config.txt").string(), configDump);
}

std::string Utils::formatConfigDump(const Project& project,
                                    const ToolpathConfig& config,
                                    double materialDepth) {
    std::ostringstream out;

    char stamp[32] = "";
    std::time_t now = std::time(nullptr);
    std::tm* local = std::localtime(&now);
    if (local) {
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", local);
    }

    out << RULE << "\n";
    out << "G-CODE GENERATION CONFIG\n";
    out << "Generated: " << stamp << "\n";
    out << RULE << "\n\n";

    section(out, "PROJECT");
    out << "Name: " << project.name << "\n";
    out << "Type: " << toString(project.type) << "\n";
    out << "Tube Void Skip: " << yesNo(project.tubeVoidSkip) << "\n\n";

    const MaterialSpec material = config.toMaterialSpec();
    section(out, "MATERIAL");
    out << "Name: " << material.name << "\n";
    out << "Form: " << toString(material.form) << "\n";
    if (material.form == MaterialForm::TUBE) {
        out << "Outer Width: " << material.outerWidth << " in\n";
        out << "Outer Height: " << material.outerHeight << " in\n";
        out << "Wall Thickness: " << material.wallThickness << " in\n";
    } else {
        out << "Thickness: " << material.thickness << " in\n";
    }
    out << "\n";

    const ToolParams tool = config.toToolParams();
    section(out, "TOOL");
    out << "Type: " << config.getToolTypeString() << "\n";
    out << "Size: " << tool.toolDiameter << " in\n";
    if (tool.tipCompensation > 0.0) {
        out << "Tip Compensation: " << tool.tipCompensation << " in\n";
    }
    out << "\n";

    section(out, "G-CODE PARAMETERS");
    out << "Spindle Speed: " << tool.spindleSpeed << " RPM\n";
    out << "Feed Rate: " << tool.feedRate << " in/min\n";
    out << "Plunge Rate: " << tool.plungeRate << " in/min\n";
    if (config.getToolType() == ToolType::DRILL) {
        out << "Pecking Depth: " << tool.peckingDepth << " in\n";
    } else {
        out << "Pass Depth: " << tool.passDepth << " in\n";
    }
    out << "Material Depth: " << formatNumber(materialDepth) << " in\n\n";

    const GenerationSettings settings = config.toGenerationSettings();
    section(out, "MACHINE SETTINGS");
    out << "Name: " << config.getMachineName() << "\n";
    out << "Max X: " << settings.maxX << " in\n";
    out << "Max Y: " << settings.maxY << " in\n";
    out << "Controller: " << config.getController() << "\n";
    out << "Supports Subroutines: " << yesNo(settings.supportsSubroutines) << "\n";
    out << "G-code Base Path: " << settings.basePath << "\n\n";

    section(out, "GENERAL SETTINGS");
    out << "Safety Height: " << settings.safetyHeight << " in\n";
    out << "Travel Height: " << settings.travelHeight << " in\n";
    out << "Spindle Warmup: " << settings.spindleWarmupSeconds << " sec\n";
    out << "Lead-In (circle/hexagon/line): " << toString(settings.circleLeadIn) << "/"
        << toString(settings.hexagonLeadIn) << "/" << toString(settings.lineLeadIn) << "\n";
    out << "Ramp Angle: " << settings.rampAngle << " deg\n";
    out << "Helix Pitch: " << settings.helixPitch << " in\n";
    out << "First Pass Feed Factor: " << settings.firstPassFeedFactor << "\n";
    out << "Corner Slowdown: " << yesNo(settings.cornerSlowdownEnabled) << " ("
        << settings.cornerFeedFactor << ")\n";
    out << "Arc Slowdown: " << yesNo(settings.arcSlowdownEnabled) << " ("
        << settings.arcFeedFactor << ")\n";
    out << "Cut Through Buffer: " << settings.cutThroughBuffer << " in\n\n";

    const OperationSet& ops = project.operations;
    section(out, "OPERATIONS (as entered)");
    for (const auto& op : ops.drillHoles) {
        out << "drill " << op.id << " " << toString(op.pattern) << " at (" << op.start.x << ", "
            << op.start.y << ")\n";
    }
    for (const auto& op : ops.circularCuts) {
        out << "circle " << op.id << " " << toString(op.pattern) << " d=" << op.diameter
            << " at (" << op.center.x << ", " << op.center.y << ") "
            << toString(op.compensation) << "\n";
    }
    for (const auto& op : ops.hexagonalCuts) {
        out << "hexagon " << op.id << " " << toString(op.pattern) << " ftf=" << op.flatToFlat
            << " at (" << op.center.x << ", " << op.center.y << ") "
            << toString(op.compensation) << "\n";
    }
    for (const auto& op : ops.lineCuts) {
        out << "line " << op.id << " " << op.points.size() << " points "
            << toString(op.compensation) << "\n";
    }
    out << "\n";

    out << RULE << "\n";
    out << "END CONFIG\n";
    out << RULE;

    return out.str();
}

bool Utils::writePreviewSVG(const Scene& scene, const std::string& filename) {
    return writeTextFile(filename, PreviewRenderer::toSVG(scene));
}

std::string Utils::formatNumber(double value, int precision) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

} // namespace toolpath
} // namespace nwss
