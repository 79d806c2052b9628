#include <orthoedge/orthoedge.h>
#include <orthoedge/common/Logger.h>
#include <iostream>
#include <iomanip>
#include <memory>

using namespace orthoedge;

void printPath(const std::vector<Point>& points, const std::string& label = "") {
    std::cout << "  " << label;
    for (size_t i = 0; i < points.size(); ++i) {
        if (i > 0) std::cout << " -> ";
        std::cout << "(" << std::fixed << std::setprecision(1)
                  << points[i].x << "," << points[i].y << ")";
    }
    std::cout << "\n";
}

void printChain(const SegmentChain& chain) {
    for (const auto& segment : chain.segments()) {
        std::cout << "  [" << segment.chainIndex << "] "
                  << (segment.isHorizontal() ? "H" : "V")
                  << (segment.draggable ? " draggable" : " fixed")
                  << "  id=" << segment.id << "\n";
    }
}

int main() {
    Logger::initialize();
    std::cout << "=== Drag Demo: Segment Drag on an Orthogonal Connector ===\n\n";

    // 1. Two nodes, connector leaves A on the right and enters B on the left
    RouteRequest request;
    request.sourceRect = {0, 0, 100, 50};
    request.source = {Point{100, 25, "source"}, Side::Right};
    request.targetRect = {260, 150, 100, 50};
    request.target = {Point{260, 175, "target"}, Side::Left};
    request.obstacles = {Rect{170, 60, 40, 30}};

    RouteBuilder builder;

    std::cout << "1. Candidate waypoints:\n";
    printPath(builder.candidatesFor(request));

    // 2. Pathfinder proposal with jitter and a duplicate
    request.rawPoints = {{151, 25}, {152.5f, 26}, {150, 100}, {150, 173}};

    auto route = builder.build(request);

    std::cout << "\n2. Optimized route:\n";
    printPath(route.points());
    printChain(route.chain);
    std::cout << "  clear: " << (route.isClear() ? "yes" : "no") << "\n";

    // 3. Drag the vertical segment 60 screen pixels right at zoom 2
    auto viewport = std::make_shared<ViewportTransform>(Point{0, 0}, 2.0f);
    SegmentDragController controller(viewport);

    auto points = route.points();
    controller.setDragListener([&points](const SegmentDragEvent& event) {
        if (!PathEditor::applySegmentDrag(points, event)) {
            std::cout << "  " << event.dragId << " lost track of its segment\n";
        }
    });

    auto dragged = route.chain.draggableSegments();
    size_t verticalIndex = 0;
    for (const Segment* segment : dragged) {
        if (!segment->isHorizontal()) {
            verticalIndex = segment->chainIndex;
            break;
        }
    }

    auto started = controller.startDrag(route.chain, verticalIndex);
    if (!started.success) {
        std::cout << "\nDrag rejected: " << started.reason << "\n";
        return 1;
    }

    Point pointer = viewport->toScreen(route.chain.at(verticalIndex)->center());
    for (int step = 0; step < 3; ++step) {
        Point delta{20, 3};
        pointer = pointer + delta;
        controller.updateDrag(pointer, delta);
    }
    controller.endDrag();

    std::cout << "\n3. After dragging segment " << verticalIndex << " (" << started.dragId << "):\n";
    printPath(points);

    SegmentChain afterDrag(points);
    if (afterDrag.isOnPartnerLine(verticalIndex)) {
        std::cout << "  segment " << verticalIndex << " landed on a partner, collapsing\n";
    }

    points = PathEditor::simplify(points);
    auto blocked = builder.validate(points, request.obstacles);
    std::cout << "  blocked segments: " << blocked.size() << "\n";

    SegmentChain rebuilt(points);
    std::cout << "\n4. Drag handles (" << builder.config().handlerWidth << "x"
              << builder.config().handlerThickness << "):\n";
    for (const Segment* segment : rebuilt.draggableSegments()) {
        Rect handle = segment->handleRect(builder.config().handlerWidth,
                                          builder.config().handlerThickness);
        std::cout << "  [" << segment->chainIndex << "] at (" << handle.x << "," << handle.y
                  << ") " << handle.width << "x" << handle.height << "\n";
    }

    return 0;
}
