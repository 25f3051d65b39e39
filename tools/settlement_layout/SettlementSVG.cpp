#include "SettlementSVG.h"
#include "settlegen/geom/Footprint.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

using namespace settlegen;

namespace {

constexpr float kMargin = 20.0f;

struct ViewTransform {
    glm::vec2 origin{0.0f};
    float scale = 1.0f;

    glm::vec2 apply(const glm::vec2& world) const { return (world - origin) * scale; }
};

// Convert Catmull-Rom spline segment to Bezier control points
void catmullRomToBezier(
    const glm::vec2& p0, const glm::vec2& p1, const glm::vec2& p2, const glm::vec2& p3,
    float tension,
    glm::vec2& cp1, glm::vec2& cp2
) {
    float t = (1.0f - tension) / 6.0f;
    cp1 = p1 + t * (p2 - p0);
    cp2 = p2 - t * (p3 - p1);
}

// Grid streets stay straight; only polylines with interior points get curves
std::string streetPath(const std::vector<glm::vec2>& points, const ViewTransform& view, bool curved) {
    if (points.size() < 2) return "";

    std::vector<glm::vec2> pts;
    pts.reserve(points.size());
    for (const auto& p : points) pts.push_back(view.apply(p));

    std::ostringstream path;
    path << std::fixed << std::setprecision(2);
    path << "M " << pts[0].x << " " << pts[0].y;

    if (!curved || pts.size() == 2) {
        for (size_t i = 1; i < pts.size(); ++i) {
            path << " L " << pts[i].x << " " << pts[i].y;
        }
        return path.str();
    }

    std::vector<glm::vec2> extended;
    extended.push_back(pts.front());
    extended.insert(extended.end(), pts.begin(), pts.end());
    extended.push_back(pts.back());

    for (size_t i = 0; i + 1 < pts.size(); ++i) {
        glm::vec2 cp1, cp2;
        catmullRomToBezier(extended[i], extended[i + 1], extended[i + 2], extended[i + 3], 0.5f, cp1, cp2);
        path << " C " << cp1.x << " " << cp1.y
             << " " << cp2.x << " " << cp2.y
             << " " << pts[i + 1].x << " " << pts[i + 1].y;
    }
    return path.str();
}

const char* getRoadColor(RoadClass road) {
    switch (road) {
        case RoadClass::Highway: return "#d4a574";  // Tan
        case RoadClass::Town:    return "#b8956e";
        case RoadClass::Dirt:    return "#8b7355";
        default:                 return "#888888";
    }
}

const char* getCategoryColor(BuildingCategory category) {
    switch (category) {
        case BuildingCategory::Residential:    return "#c9a27e";
        case BuildingCategory::Commercial:     return "#d9834f";
        case BuildingCategory::Industrial:     return "#7d7d8c";
        case BuildingCategory::Civic:          return "#b03a48";
        case BuildingCategory::Agricultural:   return "#8fa35a";
        case BuildingCategory::Infrastructure: return "#4f7ca8";
        default:                               return "#666666";
    }
}

} // namespace

bool writeSettlementsSVG(
    const std::string& filename,
    const std::vector<Settlement>& settlements,
    int outputWidth,
    int outputHeight
) {
    std::ofstream file(filename);
    if (!file) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Could not write %s", filename.c_str());
        return false;
    }

    // Fit every settlement's bounds into the canvas
    glm::vec2 lo(std::numeric_limits<float>::max());
    glm::vec2 hi(std::numeric_limits<float>::lowest());
    for (const auto& s : settlements) {
        lo = glm::min(lo, glm::vec2(s.bounds.minX, s.bounds.minZ));
        hi = glm::max(hi, glm::vec2(s.bounds.maxX, s.bounds.maxZ));
    }
    if (settlements.empty()) {
        lo = glm::vec2(-100.0f);
        hi = glm::vec2(100.0f);
    }
    lo -= glm::vec2(kMargin);
    hi += glm::vec2(kMargin);

    ViewTransform view;
    view.origin = lo;
    glm::vec2 extent = glm::max(hi - lo, glm::vec2(1.0f));
    view.scale = std::min(outputWidth / extent.x, outputHeight / extent.y);

    file << std::fixed << std::setprecision(2);
    file << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    file << "<svg xmlns=\"http://www.w3.org/2000/svg\" "
         << "width=\"" << outputWidth << "\" height=\"" << outputHeight << "\" "
         << "viewBox=\"0 0 " << outputWidth << " " << outputHeight << "\">\n";

    file << "  <rect width=\"100%\" height=\"100%\" fill=\"#f5f5dc\"/>\n";
    file << "  <!-- Settlements: " << settlements.size() << " -->\n";

    for (const auto& s : settlements) {
        glm::vec2 c = view.apply(s.position);
        file << "  <g id=\"" << s.id << "\">\n";

        file << "    <circle cx=\"" << c.x << "\" cy=\"" << c.y << "\" r=\"" << s.radius * view.scale
             << "\" fill=\"none\" stroke=\"#999999\" stroke-dasharray=\"4 4\"/>\n";

        for (const auto& street : s.streets) {
            bool curved = s.layoutType != LayoutType::Grid;
            file << "    <path d=\"" << streetPath(street.points, view, curved)
                 << "\" fill=\"none\" stroke=\"" << getRoadColor(street.roadClass)
                 << "\" stroke-width=\"" << std::max(1.0f, street.width * view.scale)
                 << "\" stroke-linecap=\"round\"/>\n";
        }

        for (const auto& b : s.buildings) {
            geom::Quad corners = geom::getCorners(b.footprint());
            file << "    <polygon points=\"";
            for (const auto& p : corners) {
                glm::vec2 q = view.apply(p);
                file << q.x << "," << q.y << " ";
            }
            file << "\" fill=\"" << getCategoryColor(b.category)
                 << "\" stroke=\"#333333\" stroke-width=\"0.5\"/>\n";
        }

        for (const auto& e : s.entryPoints) {
            glm::vec2 p = view.apply(e.position);
            file << "    <circle cx=\"" << p.x << "\" cy=\"" << p.y
                 << "\" r=\"4\" fill=\"" << getRoadColor(e.roadClass) << "\" stroke=\"#000000\"/>\n";
        }

        file << "    <text x=\"" << c.x << "\" y=\"" << (c.y - s.radius * view.scale - 6.0f)
             << "\" font-size=\"14\" text-anchor=\"middle\">" << s.name
             << " (" << getSettlementSizeName(s.size) << ", " << getLayoutTypeName(s.layoutType)
             << ")</text>\n";

        file << "  </g>\n";
    }

    file << "</svg>\n";

    if (!file) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed while writing %s", filename.c_str());
        return false;
    }

    SDL_Log("Saved SVG preview to: %s", filename.c_str());
    return true;
}
