#include <gtest/gtest.h>
#include <orthoedge/orthoedge.h>
#include <memory>
#include <vector>

using namespace orthoedge;

class SegmentDragControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        viewport_ = std::make_shared<ViewportTransform>();
        controller_ = std::make_unique<SegmentDragController>(viewport_);
    }

    // Segment 1 is the only draggable one (horizontal)
    std::vector<Point> stair_ = {{10, 0, "p0"}, {10, 50, "p1"}, {90, 50, "p2"}, {90, 100, "p3"}};

    // Segments 1 and 3 are vertical, 2 horizontal
    std::vector<Point> zigzag_ = {
        {0, 0, "a"}, {20, 0, "b"}, {20, 50, "c"}, {80, 50, "d"}, {80, 100, "e"}, {100, 100, "f"}
    };

    std::shared_ptr<ViewportTransform> viewport_;
    std::unique_ptr<SegmentDragController> controller_;
};

// ============== Start Tests ==============

TEST_F(SegmentDragControllerTest, StartDrag_InteriorSegment) {
    SegmentChain chain(stair_);

    auto result = controller_->startDrag(chain, 1);

    ASSERT_TRUE(result.success) << result.reason;
    EXPECT_FALSE(result.dragId.empty());
    EXPECT_TRUE(controller_->isDragging());

    const auto& state = controller_->currentState();
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->dragId, result.dragId);
    EXPECT_EQ(state->draggedSegmentId, "p1");
    EXPECT_EQ(state->chainIndex, 1u);
    EXPECT_EQ(state->orientation, SegmentOrientation::Horizontal);
    EXPECT_EQ(state->originalFrom.start, Point(10, 50));
    EXPECT_EQ(state->originalFrom.end, Point(90, 50));
}

TEST_F(SegmentDragControllerTest, StartDrag_RejectsEndSegments) {
    SegmentChain chain(stair_);

    EXPECT_FALSE(controller_->startDrag(chain, 0).success);
    EXPECT_FALSE(controller_->startDrag(chain, 2).success);
    EXPECT_FALSE(controller_->isDragging());
}

TEST_F(SegmentDragControllerTest, StartDrag_RejectsOutOfRange) {
    SegmentChain chain(stair_);

    auto result = controller_->startDrag(chain, 7);

    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.reason.empty());
}

TEST_F(SegmentDragControllerTest, StartDrag_SecondDragIsRejected) {
    SegmentChain chain(zigzag_);

    auto first = controller_->startDrag(chain, 1);
    ASSERT_TRUE(first.success);

    auto second = controller_->startDrag(chain, 2);

    EXPECT_FALSE(second.success);
    EXPECT_EQ(controller_->currentState()->dragId, first.dragId);
    EXPECT_EQ(controller_->currentState()->chainIndex, 1u);
}

TEST_F(SegmentDragControllerTest, StartDrag_FreshIdPerGesture) {
    SegmentChain chain(stair_);

    auto first = controller_->startDrag(chain, 1);
    controller_->endDrag();
    auto second = controller_->startDrag(chain, 1);

    ASSERT_TRUE(first.success);
    ASSERT_TRUE(second.success);
    EXPECT_NE(first.dragId, second.dragId);
}

// ============== Update Tests ==============

TEST_F(SegmentDragControllerTest, UpdateDrag_HorizontalFollowsDy) {
    SegmentChain chain(stair_);
    ASSERT_TRUE(controller_->startDrag(chain, 1).success);

    auto event = controller_->updateDrag(Point{50, 70}, Point{0, 20});

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->from.start, Point(10, 50));
    EXPECT_EQ(event->from.end, Point(90, 50));
    EXPECT_EQ(event->to.start, Point(10, 70));
    EXPECT_EQ(event->to.end, Point(90, 70));
}

TEST_F(SegmentDragControllerTest, UpdateDrag_HorizontalIgnoresDx) {
    SegmentChain chain(stair_);
    ASSERT_TRUE(controller_->startDrag(chain, 1).success);

    auto event = controller_->updateDrag(Point{80, 50}, Point{30, 0});

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->to.start, Point(10, 50));
    EXPECT_EQ(event->to.end, Point(90, 50));
}

TEST_F(SegmentDragControllerTest, UpdateDrag_VerticalFollowsDx) {
    SegmentChain chain(zigzag_);
    ASSERT_TRUE(controller_->startDrag(chain, 3).success);

    auto event = controller_->updateDrag(Point{60, 80}, Point{-20, 5});

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->to.start, Point(60, 50));
    EXPECT_EQ(event->to.end, Point(60, 100));
}

TEST_F(SegmentDragControllerTest, UpdateDrag_ZoomScalesDelta) {
    viewport_->setZoom(2.0f);
    viewport_->setPanOffset(Point{15, -40});
    SegmentChain chain(stair_);
    ASSERT_TRUE(controller_->startDrag(chain, 1).success);

    auto event = controller_->updateDrag(Point{300, 300}, Point{0, 20});

    ASSERT_TRUE(event.has_value());
    EXPECT_FLOAT_EQ(event->to.start.y, 60.0f);
    EXPECT_FLOAT_EQ(event->to.end.y, 60.0f);
}

TEST_F(SegmentDragControllerTest, UpdateDrag_EventsChain) {
    SegmentChain chain(stair_);
    ASSERT_TRUE(controller_->startDrag(chain, 1).success);

    auto first = controller_->updateDrag(Point{50, 60}, Point{0, 10});
    auto second = controller_->updateDrag(Point{50, 65}, Point{0, 5});

    ASSERT_TRUE(first && second);
    EXPECT_EQ(second->from.start, first->to.start);
    EXPECT_EQ(second->from.end, first->to.end);
    EXPECT_EQ(second->to.start, Point(10, 65));
    EXPECT_EQ(controller_->currentState()->currentTo.start, Point(10, 65));
    EXPECT_EQ(controller_->currentState()->originalFrom.start, Point(10, 50));
}

TEST_F(SegmentDragControllerTest, UpdateDrag_WithoutDragIsIgnored) {
    EXPECT_FALSE(controller_->updateDrag(Point{0, 0}, Point{5, 5}).has_value());
}

TEST_F(SegmentDragControllerTest, UpdateDrag_NotifiesListener) {
    std::vector<SegmentDragEvent> received;
    controller_->setDragListener([&](const SegmentDragEvent& e) { received.push_back(e); });
    SegmentChain chain(stair_);
    auto started = controller_->startDrag(chain, 1);
    ASSERT_TRUE(started.success);

    controller_->updateDrag(Point{50, 55}, Point{0, 5});
    controller_->updateDrag(Point{50, 60}, Point{0, 5});

    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0].dragId, started.dragId);
    EXPECT_EQ(received[1].to.start, Point(10, 60));
}

// ============== End / Cancel Tests ==============

TEST_F(SegmentDragControllerTest, EndDrag_ReturnsFinalState) {
    SegmentChain chain(stair_);
    ASSERT_TRUE(controller_->startDrag(chain, 1).success);
    controller_->updateDrag(Point{50, 80}, Point{0, 30});

    auto finished = controller_->endDrag();

    ASSERT_TRUE(finished.has_value());
    EXPECT_EQ(finished->currentTo.start, Point(10, 80));
    EXPECT_FALSE(controller_->isDragging());
    EXPECT_FALSE(controller_->endDrag().has_value());
}

TEST_F(SegmentDragControllerTest, CancelDrag_KeepsLastAppliedPosition) {
    SegmentChain chain(stair_);
    ASSERT_TRUE(controller_->startDrag(chain, 1).success);
    controller_->updateDrag(Point{50, 60}, Point{0, 10});

    auto cancelled = controller_->cancelDrag();

    ASSERT_TRUE(cancelled.has_value());
    EXPECT_EQ(cancelled->currentTo.start, Point(10, 60));
    EXPECT_FALSE(controller_->isDragging());
    EXPECT_FALSE(controller_->cancelDrag().has_value());
}

TEST_F(SegmentDragControllerTest, IsDraggingSegment_FollowsRebuiltChain) {
    SegmentChain chain(stair_);
    ASSERT_TRUE(controller_->startDrag(chain, 1).success);
    EXPECT_TRUE(controller_->isDraggingSegment(*chain.at(1)));
    EXPECT_FALSE(controller_->isDraggingSegment(*chain.at(2)));

    auto event = controller_->updateDrag(Point{50, 70}, Point{0, 20});
    ASSERT_TRUE(event.has_value());
    ASSERT_TRUE(PathEditor::applySegmentDrag(stair_, *event));
    SegmentChain rebuilt(stair_);

    EXPECT_TRUE(controller_->isDraggingSegment(*rebuilt.at(1)));
    EXPECT_FALSE(controller_->isDraggingSegment(*chain.at(1)));

    controller_->endDrag();
    EXPECT_FALSE(controller_->isDraggingSegment(*rebuilt.at(1)));
}

// ============== Transform Tests ==============

TEST_F(SegmentDragControllerTest, NullTransformFallsBackToIdentity) {
    SegmentDragController controller(nullptr);
    controller.setTransform(nullptr);
    SegmentChain chain(stair_);
    ASSERT_TRUE(controller.startDrag(chain, 1).success);

    auto event = controller.updateDrag(Point{50, 70}, Point{0, 20});

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->to.start, Point(10, 70));
}

TEST(ViewportTransformTest, RoundTrip) {
    ViewportTransform viewport(Point{10, -20}, 1.5f, Point{100, 50});

    Point screen = viewport.toScreen(Point{40, 60});

    EXPECT_FLOAT_EQ(screen.x, 175.0f);
    EXPECT_FLOAT_EQ(screen.y, 110.0f);
    Point back = viewport.toDiagram(screen);
    EXPECT_FLOAT_EQ(back.x, 40.0f);
    EXPECT_FLOAT_EQ(back.y, 60.0f);
}

TEST(ViewportTransformTest, NonPositiveZoomIsIgnored) {
    ViewportTransform viewport;
    viewport.setZoom(0.0f);
    EXPECT_FLOAT_EQ(viewport.zoom(), 1.0f);
    viewport.setZoom(-2.0f);
    EXPECT_FLOAT_EQ(viewport.zoom(), 1.0f);
}

// ============== Drag Session Tests ==============

TEST_F(SegmentDragControllerTest, FullGesture_CollapsesOntoPartner) {
    SegmentChain chain(zigzag_);
    controller_->setDragListener([this](const SegmentDragEvent& e) {
        ASSERT_TRUE(PathEditor::applySegmentDrag(zigzag_, e));
    });
    ASSERT_TRUE(controller_->startDrag(chain, 3).success);

    controller_->updateDrag(Point{50, 75}, Point{-30, 0});
    controller_->updateDrag(Point{20, 75}, Point{-30, 0});
    controller_->endDrag();

    auto simplified = PathEditor::simplify(zigzag_);
    std::vector<Point> expected = {{0, 0}, {20, 0}, {20, 100}, {100, 100}};
    EXPECT_EQ(simplified, expected);
}

TEST_F(SegmentDragControllerTest, OptimizedRouteStaysOrthogonalUnderDrag) {
    RouteRequest request;
    request.sourceRect = Rect{0, 0, 100, 50};
    request.source = {Point{100, 25, "source"}, Side::Right};
    request.targetRect = Rect{200, 150, 100, 50};
    request.target = {Point{200, 175, "target"}, Side::Left};
    request.rawPoints = {{150, 25}, {150, 175}};
    ConnectorRoute route = RouteBuilder().build(request);

    for (const Segment* segment : route.chain.draggableSegments()) {
        auto points = route.points();
        ASSERT_TRUE(controller_->startDrag(route.chain, segment->chainIndex).success);

        auto event = controller_->updateDrag(Point{200, 120}, Point{20, 20});
        ASSERT_TRUE(event.has_value());
        ASSERT_TRUE(PathEditor::applySegmentDrag(points, *event));
        controller_->endDrag();

        SegmentChain moved(points);
        for (const auto& s : moved.segments()) {
            EXPECT_TRUE(s.isOrthogonal()) << "segment " << s.chainIndex
                                          << " after dragging " << segment->chainIndex;
        }
        EXPECT_EQ(points.front(), route.points().front());
        EXPECT_EQ(points.back(), route.points().back());
    }
}
