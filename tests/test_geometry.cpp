#include <gtest/gtest.h>
#include "geometry.hpp"

class GeometryTest : public ::testing::Test {
protected:
    static BoundingBox box(int x, int y, int w, int h, float c = 0.9f) {
        return BoundingBox{x, y, w, h, c};
    }

    static Detection det(const BoundingBox& b) {
        Detection d;
        d.bounding_boxes.push_back(b);
        d.raw_confidence = b.confidence;
        return d;
    }
};

TEST_F(GeometryTest, IdenticalBoxesHaveUnitIoU) {
    EXPECT_DOUBLE_EQ(iou(box(10, 10, 50, 50), box(10, 10, 50, 50)), 1.0);
}

TEST_F(GeometryTest, PartialOverlap) {
    // 50x50 boxes offset by 25 in x: inter 25*50=1250, union 5000-1250=3750
    EXPECT_NEAR(iou(box(0, 0, 50, 50), box(25, 0, 50, 50)), 1250.0 / 3750.0, 1e-12);
}

TEST_F(GeometryTest, TouchingBoxesHaveZeroIoU) {
    EXPECT_DOUBLE_EQ(iou(box(0, 0, 50, 50), box(50, 0, 50, 50)), 0.0);
    EXPECT_DOUBLE_EQ(iou(box(0, 0, 50, 50), box(0, 50, 50, 50)), 0.0);
}

TEST_F(GeometryTest, DisjointBoxes) {
    EXPECT_DOUBLE_EQ(iou(box(0, 0, 10, 10), box(100, 100, 10, 10)), 0.0);
}

TEST_F(GeometryTest, ZeroAreaBoxes) {
    EXPECT_DOUBLE_EQ(iou(box(0, 0, 0, 0), box(0, 0, 0, 0)), 0.0);
}

TEST_F(GeometryTest, IoUIsSymmetric) {
    auto a = box(3, 7, 40, 30);
    auto b = box(20, 15, 35, 50);
    EXPECT_DOUBLE_EQ(iou(a, b), iou(b, a));
}

TEST_F(GeometryTest, LargeCoordinatesDoNotOverflow) {
    auto a = box(0, 0, 100000, 100000);
    auto b = box(50000, 0, 100000, 100000);
    EXPECT_NEAR(iou(a, b), 1.0 / 3.0, 1e-9);
}

TEST_F(GeometryTest, CenterUsesIntegerDivision) {
    auto b = box(10, 20, 5, 7);
    EXPECT_EQ(b.center_x(), 12);
    EXPECT_EQ(b.center_y(), 23);
    EXPECT_EQ(b.area(), 35);
}

TEST_F(GeometryTest, RoiContainmentIsInclusive) {
    Roi roi{100, 100, 200, 200};
    EXPECT_TRUE(point_in_roi(100, 100, roi));
    EXPECT_TRUE(point_in_roi(300, 300, roi));
    EXPECT_FALSE(point_in_roi(301, 300, roi));
    EXPECT_FALSE(point_in_roi(99, 150, roi));
}

TEST_F(GeometryTest, CenterInRoi) {
    Roi roi{100, 100, 200, 200};
    // center (300, 300) sits on the far corner
    EXPECT_TRUE(center_in_roi(box(290, 290, 20, 20), roi));
    // center (301, 300)
    EXPECT_FALSE(center_in_roi(box(291, 290, 20, 20), roi));
}

TEST_F(GeometryTest, PrimaryIoUUsesFirstBoxOnly) {
    Detection a = det(box(0, 0, 50, 50));
    Detection b = det(box(500, 500, 50, 50));
    b.bounding_boxes.push_back(box(0, 0, 50, 50));
    EXPECT_DOUBLE_EQ(primary_iou(a, b), 0.0);
    EXPECT_FALSE(detections_similar(a, b, kTemporalIouThreshold));
}

TEST_F(GeometryTest, EmptyDetectionsAreNeverSimilar) {
    Detection a;
    Detection b = det(box(0, 0, 50, 50));
    EXPECT_DOUBLE_EQ(primary_iou(a, b), 0.0);
    EXPECT_FALSE(detections_similar(a, b, 0.0));
}

TEST_F(GeometryTest, SimilarityThresholdIsStrict) {
    // 1250/3750 = 0.333..., similar at 0.3 but not at 1/3
    Detection a = det(box(0, 0, 50, 50));
    Detection b = det(box(25, 0, 50, 50));
    EXPECT_TRUE(detections_similar(a, b, kNmsIouThreshold));
    EXPECT_FALSE(detections_similar(a, b, 1250.0 / 3750.0));
}

TEST_F(GeometryTest, ShrinkRoiKeepsCenter) {
    Roi r = shrink_roi(Roi{0, 0, 640, 480}, 0.8);
    EXPECT_EQ(r.width, 512);
    EXPECT_EQ(r.height, 384);
    EXPECT_EQ(r.x, 64);
    EXPECT_EQ(r.y, 48);
}

TEST_F(GeometryTest, ShrinkRoiIgnoresOutOfRangeFraction) {
    Roi roi{10, 20, 300, 200};
    EXPECT_EQ(shrink_roi(roi, 1.0), roi);
    EXPECT_EQ(shrink_roi(roi, 0.0), roi);
    EXPECT_EQ(shrink_roi(roi, 1.5), roi);
}
