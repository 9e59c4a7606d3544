#include "core/preview.h"
#include "core/errors.h"
#include "core/hexagon.h"
#include "core/lead_in.h"
#include "core/tool_compensation.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace nwss {
namespace toolpath {

namespace {

namespace Colors {
const char* const DRILL = "#2F055A";
const char* const CIRCLE = "#5a7a8a";
const char* const HEXAGON = "#c9a87c";
const char* const LINE = "#5a8a6e";
const char* const LEAD_IN = "#ff8c00";
const char* const LEAD_IN_STROKE = "#cc7000";
const char* const BACKGROUND = "#f8f9fa";
const char* const GRID = "#e9ecef";
const char* const MATERIAL_OUTLINE = "#dee2e6";
const char* const TUBE_VOID_FILL = "#e9ecef";
const char* const TUBE_VOID_STROKE = "#ced4da";
const char* const AXIS_LABEL = "#6c757d";
} // namespace Colors

const int AXIS_LABEL_INTERVAL = 5;
const char* const TOOLPATH_DASH = "5,3";
const double TOOLPATH_OPACITY = 0.7;

std::string num(double value) {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

std::string fixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

std::string coordLabel(double x, double y) {
    return "(" + fixed(x, 3) + ", " + fixed(y, 3) + ")";
}

std::string escapeXml(const std::string& text) {
    std::string out;
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += c; break;
        }
    }
    return out;
}

ScenePrimitive text(const Point2D& at, const std::string& content, const std::string& color,
                    double fontSize, bool bold, const std::string& anchor) {
    ScenePrimitive p;
    p.kind = ScenePrimitive::TEXT;
    p.points.push_back(at);
    p.text = content;
    p.style.fill = color;
    p.style.fontSize = fontSize;
    p.style.bold = bold;
    p.style.anchor = anchor;
    return p;
}

ScenePrimitive outlineStyle(ScenePrimitive::Kind kind, const std::string& color, bool toolpath) {
    ScenePrimitive p;
    p.kind = kind;
    p.style.stroke = color;
    p.style.strokeWidth = toolpath ? 1.5 : 2.0;
    if (toolpath) {
        p.style.dashArray = TOOLPATH_DASH;
        p.style.opacity = TOOLPATH_OPACITY;
    }
    return p;
}

std::vector<Point2D> screenPoints(const std::vector<Point2D>& points, double height) {
    std::vector<Point2D> screen;
    screen.reserve(points.size());
    for (const auto& p : points) {
        screen.push_back(PreviewRenderer::toScreen(p, height));
    }
    return screen;
}

// Coordinate labels are collected while drawing and painted last
struct Label {
    Point2D at;
    std::string text;
    std::string color;
};

void drawBackground(Scene& scene, const PreviewOptions& options) {
    const double P = PreviewRenderer::PADDING;
    const double S = PreviewRenderer::SCALE;
    double w = options.width * S;
    double h = options.height * S;

    ScenePrimitive outline;
    outline.kind = ScenePrimitive::RECT;
    outline.points.push_back(Point2D(P, P));
    outline.size = Point2D(w, h);
    outline.style.stroke = Colors::MATERIAL_OUTLINE;
    outline.style.strokeWidth = 2.0;
    scene.primitives.push_back(outline);

    if (options.wallThickness > 0.0) {
        double wall = options.wallThickness * S;
        double innerW = w - wall * 2.0;
        double innerH = h - wall * 2.0;
        if (innerW > 0.0 && innerH > 0.0) {
            ScenePrimitive tubeVoid;
            tubeVoid.kind = ScenePrimitive::RECT;
            tubeVoid.points.push_back(Point2D(P + wall, P + wall));
            tubeVoid.size = Point2D(innerW, innerH);
            tubeVoid.style.fill = Colors::TUBE_VOID_FILL;
            tubeVoid.style.stroke = Colors::TUBE_VOID_STROKE;
            tubeVoid.style.dashArray = "4,4";
            scene.primitives.push_back(tubeVoid);
        }
    }

    // One grid line per inch
    for (int x = 0; x <= static_cast<int>(options.width); ++x) {
        ScenePrimitive line;
        line.kind = ScenePrimitive::LINE;
        line.points.push_back(Point2D(P + x * S, P));
        line.points.push_back(Point2D(P + x * S, P + h));
        line.style.stroke = Colors::GRID;
        scene.primitives.push_back(line);
    }
    for (int y = 0; y <= static_cast<int>(options.height); ++y) {
        ScenePrimitive line;
        line.kind = ScenePrimitive::LINE;
        line.points.push_back(Point2D(P, P + y * S));
        line.points.push_back(Point2D(P + w, P + y * S));
        line.style.stroke = Colors::GRID;
        scene.primitives.push_back(line);
    }

    for (int x = 0; x <= static_cast<int>(options.width); x += AXIS_LABEL_INTERVAL) {
        scene.primitives.push_back(text(Point2D(P + x * S, P + h + 15), std::to_string(x),
                                        Colors::AXIS_LABEL, 13, false, "middle"));
    }
    for (int y = 0; y <= static_cast<int>(options.height); y += AXIS_LABEL_INTERVAL) {
        double py = P + (options.height - y) * S;
        scene.primitives.push_back(text(Point2D(P - 5, py + 4), std::to_string(y),
                                        Colors::AXIS_LABEL, 13, false, "end"));
    }
}

} // namespace

std::string toString(CoordsMode mode) {
    switch (mode) {
        case CoordsMode::FEATURE: return "feature";
        case CoordsMode::TOOLPATH: return "toolpath";
        case CoordsMode::OFF: break;
    }
    return "off";
}

bool parseCoordsMode(const std::string& text, CoordsMode& mode) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "off") {
        mode = CoordsMode::OFF;
    } else if (lower == "feature") {
        mode = CoordsMode::FEATURE;
    } else if (lower == "toolpath") {
        mode = CoordsMode::TOOLPATH;
    } else {
        return false;
    }
    return true;
}

size_t Scene::count(ScenePrimitive::Kind kind) const {
    return static_cast<size_t>(std::count_if(primitives.begin(), primitives.end(),
                                             [kind](const ScenePrimitive& p) {
                                                 return p.kind == kind;
                                             }));
}

Point2D PreviewRenderer::toScreen(const Point2D& point, double materialHeight) {
    return Point2D(PADDING + point.x * SCALE, PADDING + (materialHeight - point.y) * SCALE);
}

double PreviewRenderer::arcSpan(const Point2D& start, const Point2D& end, const Point2D& center,
                                bool clockwise) {
    double startAngle = std::atan2(start.y - center.y, start.x - center.x);
    double endAngle = std::atan2(end.y - center.y, end.x - center.x);

    double span = clockwise ? startAngle - endAngle : endAngle - startAngle;
    double degrees = Geometry::toDegrees(span);
    if (degrees <= 0.0) {
        degrees += 360.0;
    }
    return degrees;
}

void PreviewRenderer::arcFlags(const Point2D& start, const Point2D& end, const Point2D& center,
                               ArcHint hint, int& largeArc, int& sweep) {
    bool clockwise;
    if (hint == ArcHint::CW) {
        clockwise = true;
    } else if (hint == ArcHint::CCW) {
        clockwise = false;
    } else {
        clockwise = arcSpan(start, end, center, true) < arcSpan(start, end, center, false);
    }

    // Y is flipped on screen, so a machine CW arc is drawn with sweep 1
    sweep = clockwise ? 1 : 0;
    largeArc = arcSpan(start, end, center, clockwise) > 180.0 ? 1 : 0;
}

std::string PreviewRenderer::pathData(const std::vector<PathPoint>& points,
                                      double materialHeight) {
    std::vector<std::string> parts;
    Point2D previous;

    for (size_t i = 0; i < points.size(); ++i) {
        Point2D screen = toScreen(points[i].position(), materialHeight);

        if (i == 0) {
            parts.push_back("M " + num(screen.x) + " " + num(screen.y));
        } else if (points[i].isArc()) {
            int largeArc = 0;
            int sweep = 0;
            arcFlags(points[i - 1].position(), points[i].position(), points[i].center,
                     points[i].hint, largeArc, sweep);
            Point2D center = toScreen(points[i].center, materialHeight);
            double radius = previous.distanceTo(center);
            parts.push_back("A " + fixed(radius, 4) + " " + fixed(radius, 4) + " 0 " +
                            std::to_string(largeArc) + " " + std::to_string(sweep) + " " +
                            fixed(screen.x, 4) + " " + fixed(screen.y, 4));
        } else {
            parts.push_back("L " + num(screen.x) + " " + num(screen.y));
        }
        previous = screen;
    }

    if (points.size() > 2 && Geometry::isClosed(pathPositions(points))) {
        parts.push_back("Z");
    }

    std::string data;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            data += " ";
        }
        data += parts[i];
    }
    return data;
}

PreviewOptions PreviewRenderer::optionsFor(const Project& project,
                                           const GenerationSettings& settings,
                                           const ToolParams* cutParams, CoordsMode coords) {
    PreviewOptions options;
    options.coords = coords;

    const MaterialSpec& material = project.material;
    if (material.form == MaterialForm::TUBE) {
        options.width = project.workingLength > 0.0 ? project.workingLength : 12.0;
        options.height = project.narrowFaceUp ? material.outerHeight : material.outerWidth;
        options.wallThickness = material.wallThickness;
    } else {
        options.width = settings.maxX;
        options.height = settings.maxY;
    }

    if (project.type == ProjectType::CUT && cutParams) {
        options.toolDiameter = cutParams->toolDiameter;
    }

    // Without a tool the ramp length is estimated from a 0.1" pass
    double passDepth = (cutParams && cutParams->passDepth > 0.0) ? cutParams->passDepth : 0.1;
    options.showLineLeadIn = settings.lineLeadIn == LeadInType::RAMP;
    options.leadInDistance = LeadIn::leadInDistance(settings.rampAngle, passDepth);
    return options;
}

Scene PreviewRenderer::render(const ExpandedOperations& operations,
                              const PreviewOptions& options) {
    Scene scene;
    scene.width = options.width * SCALE + PADDING * 2.0;
    scene.height = options.height * SCALE + PADDING * 2.0;
    scene.background = Colors::BACKGROUND;

    const double H = options.height;
    const bool compensate = options.toolDiameter > 0.0;
    std::vector<Label> labels;
    int sequence = 1;

    drawBackground(scene, options);

    // Drill points
    for (const auto& point : operations.drillPoints) {
        Point2D c = toScreen(point, H);

        ScenePrimitive dot;
        dot.kind = ScenePrimitive::CIRCLE;
        dot.points.push_back(c);
        dot.radius = 4.0;
        dot.style.fill = Colors::DRILL;
        scene.primitives.push_back(dot);

        scene.primitives.push_back(text(Point2D(c.x + 8, c.y - 8), std::to_string(sequence),
                                        Colors::DRILL, 14, true, ""));
        if (options.coords != CoordsMode::OFF) {
            labels.push_back({Point2D(c.x + 8, c.y + 14), coordLabel(point.x, point.y),
                              Colors::DRILL});
        }
        ++sequence;
    }

    // Circles
    for (const auto& circle : operations.circles) {
        Point2D c = toScreen(circle.center, H);
        double r = circle.diameter / 2.0 * SCALE;

        ScenePrimitive feature = outlineStyle(ScenePrimitive::CIRCLE, Colors::CIRCLE, false);
        feature.points.push_back(c);
        feature.radius = r;
        scene.primitives.push_back(feature);

        double cutRadius = circle.diameter / 2.0;
        bool compensated = false;
        if (compensate && circle.compensation != CompensationMode::NONE) {
            try {
                cutRadius = ToolCompensation::cutRadius(circle.diameter, options.toolDiameter,
                                                        circle.compensation);
                compensated = true;
            } catch (const InvalidGeometryError&) {
                // No toolpath to draw; validation reports the failure
            }
        }
        if (compensated) {
            ScenePrimitive toolpath = outlineStyle(ScenePrimitive::CIRCLE, Colors::CIRCLE, true);
            toolpath.points.push_back(c);
            toolpath.radius = cutRadius * SCALE;
            scene.primitives.push_back(toolpath);
        }

        scene.primitives.push_back(text(Point2D(c.x, c.y + 5), std::to_string(sequence),
                                        Colors::CIRCLE, 16, true, "middle"));

        std::string centerText = coordLabel(circle.center.x, circle.center.y);
        if (options.coords == CoordsMode::FEATURE) {
            labels.push_back({Point2D(c.x, c.y + r + 14),
                              centerText + " d=" + fixed(circle.diameter, 3), Colors::CIRCLE});
        } else if (options.coords == CoordsMode::TOOLPATH) {
            labels.push_back({Point2D(c.x, c.y + r + 14),
                              centerText + " r=" + fixed(cutRadius, 3), Colors::CIRCLE});
        }
        ++sequence;
    }

    // Hexagons
    for (const auto& hexagon : operations.hexagons) {
        Point2D c = toScreen(hexagon.center, H);
        double circumradius = Hexagon::circumradius(hexagon.flatToFlat) * SCALE;

        ScenePrimitive feature = outlineStyle(ScenePrimitive::POLYGON, Colors::HEXAGON, false);
        feature.points = screenPoints(Hexagon::vertices(hexagon.center, hexagon.flatToFlat), H);
        scene.primitives.push_back(feature);

        double flatToFlat = hexagon.flatToFlat;
        if (compensate && hexagon.compensation != CompensationMode::NONE) {
            std::vector<Point2D> vertices;
            try {
                vertices = ToolCompensation::hexagonVertices(hexagon.center, hexagon.flatToFlat,
                                                             options.toolDiameter,
                                                             hexagon.compensation);
            } catch (const InvalidGeometryError&) {
                // Nothing to draw; validation reports the failure
            }
            if (!vertices.empty()) {
                ScenePrimitive toolpath =
                    outlineStyle(ScenePrimitive::POLYGON, Colors::HEXAGON, true);
                toolpath.points = screenPoints(vertices, H);
                scene.primitives.push_back(toolpath);

                // Twice the apothem, which is the vertex distance times cos(30)
                flatToFlat = vertices[0].distanceTo(hexagon.center) * std::sqrt(3.0);
            }
        }

        scene.primitives.push_back(text(Point2D(c.x, c.y + 5), std::to_string(sequence),
                                        Colors::HEXAGON, 16, true, "middle"));

        std::string centerText = coordLabel(hexagon.center.x, hexagon.center.y);
        if (options.coords == CoordsMode::FEATURE) {
            labels.push_back({Point2D(c.x, c.y + circumradius + 14),
                              centerText + " ftf=" + fixed(hexagon.flatToFlat, 3),
                              Colors::HEXAGON});
        } else if (options.coords == CoordsMode::TOOLPATH) {
            labels.push_back({Point2D(c.x, c.y + circumradius + 14),
                              centerText + " ftf=" + fixed(flatToFlat, 3), Colors::HEXAGON});
        }
        ++sequence;
    }

    // Line paths
    for (const auto& line : operations.lines) {
        if (line.points.empty()) {
            continue;
        }

        ScenePrimitive feature = outlineStyle(ScenePrimitive::PATH, Colors::LINE, false);
        feature.pathData = pathData(line.points, H);
        scene.primitives.push_back(feature);

        std::vector<PathPoint> toolPoints = line.points;
        bool compensated = false;
        if (compensate && line.compensation != CompensationMode::NONE) {
            try {
                toolPoints = ToolCompensation::compensateLinePath(
                    line.points, options.toolDiameter, line.compensation);
                compensated = true;
            } catch (const InvalidGeometryError&) {
                // Drawn uncompensated; validation reports the failure
            }
        }
        if (compensated) {
            ScenePrimitive toolpath = outlineStyle(ScenePrimitive::PATH, Colors::LINE, true);
            toolpath.pathData = pathData(toolPoints, H);
            scene.primitives.push_back(toolpath);
        }

        // Lead-in marker, planned exactly as the generator plans it
        bool manual = line.leadIn.isManual();
        bool wanted = manual ? line.leadIn.type != LeadInType::NONE : options.showLineLeadIn;
        if (wanted && options.leadInDistance > 0.0 && toolPoints.size() >= 2) {
            LeadInType type = manual ? line.leadIn.type : LeadInType::RAMP;
            LeadInPlan plan = LeadIn::planLine(toolPoints, line.compensation, type, manual,
                                               line.leadIn.approachAngle, options.leadInDistance);
            if (plan.type == LeadInType::RAMP) {
                Point2D from = toScreen(plan.leadInPoint, H);
                Point2D to = toScreen(plan.profileStart, H);

                ScenePrimitive ramp;
                ramp.kind = ScenePrimitive::LINE;
                ramp.points.push_back(from);
                ramp.points.push_back(to);
                ramp.style.stroke = Colors::LEAD_IN;
                ramp.style.strokeWidth = 2.0;
                ramp.style.dashArray = "3,2";
                scene.primitives.push_back(ramp);

                ScenePrimitive marker;
                marker.kind = ScenePrimitive::CIRCLE;
                marker.points.push_back(from);
                marker.radius = 4.0;
                marker.style.fill = Colors::LEAD_IN;
                marker.style.stroke = Colors::LEAD_IN_STROKE;
                scene.primitives.push_back(marker);
            }
        }

        // Sequence number at the centroid of the nominal points
        Point2D centroid;
        for (const auto& p : line.points) {
            centroid = centroid + toScreen(p.position(), H);
        }
        centroid = centroid * (1.0 / line.points.size());
        scene.primitives.push_back(text(Point2D(centroid.x, centroid.y + 5),
                                        std::to_string(sequence), Colors::LINE, 16, true,
                                        "middle"));

        if (options.coords != CoordsMode::OFF) {
            const std::vector<PathPoint>& shown =
                options.coords == CoordsMode::TOOLPATH ? toolPoints : line.points;
            for (const auto& p : shown) {
                Point2D s = toScreen(p.position(), H);
                labels.push_back({Point2D(s.x + 8, s.y + 14), coordLabel(p.x, p.y), Colors::LINE});
            }
        }
        ++sequence;
    }

    for (const auto& label : labels) {
        scene.primitives.push_back(text(label.at, label.text, label.color, 10, false, ""));
    }

    return scene;
}

std::string PreviewRenderer::toSVG(const Scene& scene) {
    std::ostringstream svg;
    svg << "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\"0 0 " << num(scene.width) << " "
        << num(scene.height) << "\" width=\"" << num(scene.width) << "\" height=\""
        << num(scene.height) << "\" style=\"background: " << scene.background << ";\">\n";

    for (const auto& p : scene.primitives) {
        const SceneStyle& style = p.style;

        std::ostringstream paint;
        paint << " fill=\"" << style.fill << "\"";
        if (!style.stroke.empty()) {
            paint << " stroke=\"" << style.stroke << "\" stroke-width=\""
                  << num(style.strokeWidth) << "\"";
        }
        if (!style.dashArray.empty()) {
            paint << " stroke-dasharray=\"" << style.dashArray << "\"";
        }
        if (style.opacity < 1.0) {
            paint << " opacity=\"" << num(style.opacity) << "\"";
        }

        switch (p.kind) {
            case ScenePrimitive::RECT:
                svg << "<rect x=\"" << num(p.points[0].x) << "\" y=\"" << num(p.points[0].y)
                    << "\" width=\"" << num(p.size.x) << "\" height=\"" << num(p.size.y) << "\""
                    << paint.str() << "/>\n";
                break;
            case ScenePrimitive::LINE:
                svg << "<line x1=\"" << num(p.points[0].x) << "\" y1=\"" << num(p.points[0].y)
                    << "\" x2=\"" << num(p.points[1].x) << "\" y2=\"" << num(p.points[1].y)
                    << "\"" << paint.str() << "/>\n";
                break;
            case ScenePrimitive::CIRCLE:
                svg << "<circle cx=\"" << num(p.points[0].x) << "\" cy=\"" << num(p.points[0].y)
                    << "\" r=\"" << num(p.radius) << "\"" << paint.str() << "/>\n";
                break;
            case ScenePrimitive::POLYGON: {
                svg << "<polygon points=\"";
                for (size_t i = 0; i < p.points.size(); ++i) {
                    svg << (i > 0 ? " " : "") << num(p.points[i].x) << "," << num(p.points[i].y);
                }
                svg << "\"" << paint.str() << "/>\n";
                break;
            }
            case ScenePrimitive::PATH:
                svg << "<path d=\"" << p.pathData << "\"" << paint.str() << "/>\n";
                break;
            case ScenePrimitive::TEXT:
                svg << "<text x=\"" << num(p.points[0].x) << "\" y=\"" << num(p.points[0].y)
                    << "\" font-size=\"" << num(style.fontSize) << "\"";
                if (style.bold) {
                    svg << " font-weight=\"bold\"";
                }
                svg << " fill=\"" << style.fill << "\"";
                if (!style.anchor.empty()) {
                    svg << " text-anchor=\"" << style.anchor << "\"";
                }
                svg << " font-family=\"Arial, sans-serif\">" << escapeXml(p.text) << "</text>\n";
                break;
        }
    }

    svg << "</svg>\n";
    return svg.str();
}

} // namespace toolpath
} // namespace nwss
