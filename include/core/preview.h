#ifndef NWSS_TOOLPATH_PREVIEW_H
#define NWSS_TOOLPATH_PREVIEW_H

#include "core/gcode_generator.h"
#include "core/geometry.h"
#include "core/operations.h"
#include <string>
#include <vector>

namespace nwss {
namespace toolpath {

/**
 * Which coordinates the preview prints next to each feature
 */
enum class CoordsMode {
    OFF,
    FEATURE,    // Nominal feature geometry
    TOOLPATH    // Compensated tool center
};

std::string toString(CoordsMode mode);
bool parseCoordsMode(const std::string& text, CoordsMode& mode);

/**
 * Drawing attributes of one primitive
 */
struct SceneStyle {
    std::string stroke;
    std::string fill;
    double strokeWidth;
    std::string dashArray;      // Empty for a solid stroke
    double opacity;
    double fontSize;            // TEXT only
    bool bold;
    std::string anchor;         // TEXT only: start, middle or end

    SceneStyle()
        : fill("none")
        , strokeWidth(1.0)
        , opacity(1.0)
        , fontSize(10.0)
        , bold(false)
    {}
};

/**
 * One drawable element, already in screen space
 */
struct ScenePrimitive {
    enum Kind {
        RECT,       // points[0] = top-left, size = (width, height)
        LINE,       // points[0] -> points[1]
        CIRCLE,     // points[0] = center, radius
        POLYGON,    // points
        PATH,       // pathData holds SVG path commands
        TEXT        // points[0] = anchor position, text
    };

    Kind kind;
    std::vector<Point2D> points;
    Point2D size;
    double radius;
    std::string pathData;
    std::string text;
    SceneStyle style;

    ScenePrimitive() : kind(LINE), radius(0.0) {}
};

/**
 * Everything needed to draw a project preview, in painting order
 */
struct Scene {
    double width;               // Pixels
    double height;
    std::string background;
    std::vector<ScenePrimitive> primitives;

    Scene() : width(0.0), height(0.0) {}

    size_t count(ScenePrimitive::Kind kind) const;
};

/**
 * Inputs of one preview that do not come from the operations
 */
struct PreviewOptions {
    double width;               // Material extent in inches
    double height;
    double wallThickness;       // > 0 draws the tube void
    double toolDiameter;        // > 0 draws compensated toolpaths
    CoordsMode coords;
    bool showLineLeadIn;
    double leadInDistance;

    PreviewOptions()
        : width(24.0)
        , height(18.0)
        , wallThickness(0.0)
        , toolDiameter(0.0)
        , coords(CoordsMode::OFF)
        , showLineLeadIn(false)
        , leadInDistance(0.0)
    {}
};

/**
 * Projects expanded operations onto a 2D scene. Compensation and lead-in
 * points come from the same routines the generator uses.
 */
class PreviewRenderer {
public:
    static constexpr double PADDING = 20.0;
    static constexpr double SCALE = 50.0;       // Pixels per inch

    /**
     * Build the scene
     * @param operations Expanded (and filtered) operations
     * @param options Material size, tool and label settings
     */
    static Scene render(const ExpandedOperations& operations, const PreviewOptions& options);

    /**
     * Preview options for a project: tube stock is laid out as working length by
     * the face that is up, sheets use the machine bounds
     */
    static PreviewOptions optionsFor(const Project& project, const GenerationSettings& settings,
                                     const ToolParams* cutParams, CoordsMode coords);

    /**
     * Machine (Y up) to screen (Y down) coordinates
     */
    static Point2D toScreen(const Point2D& point, double materialHeight);

    /**
     * Angular span in degrees (0, 360] when travelling from start to end
     */
    static double arcSpan(const Point2D& start, const Point2D& end, const Point2D& center,
                          bool clockwise);

    /**
     * SVG arc flags. Without a hint the shorter way round is taken.
     */
    static void arcFlags(const Point2D& start, const Point2D& end, const Point2D& center,
                         ArcHint hint, int& largeArc, int& sweep);

    /**
     * SVG path data ("M", "L", "A", closing "Z") for a line path
     */
    static std::string pathData(const std::vector<PathPoint>& points, double materialHeight);

    /**
     * Serialise a scene as a standalone SVG document
     */
    static std::string toSVG(const Scene& scene);
};

} // namespace toolpath
} // namespace nwss

#endif // NWSS_TOOLPATH_PREVIEW_H
