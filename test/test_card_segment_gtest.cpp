// test_card_segment_gtest.cpp - Unit tests for inline image markers
//
// Tests card_segment.hpp:
// - Marker scanning and segmentation
// - Out-of-range markers kept as literal text
// - Marker reconciliation and its idempotence
// - Marker insertion

#include <gtest/gtest.h>
#include "cardpage/card_segment.hpp"

using namespace cardpage;

// ============================================================================
// Marker Scanning
// ============================================================================

TEST(CardSegmentTest, FindsMarkers) {
    std::vector<ImageMarker> markers = find_image_markers("x[image12]y[image 3]");
    ASSERT_EQ(markers.size(), 2u);
    EXPECT_EQ(markers[0].pos, 1u);
    EXPECT_EQ(markers[0].length, 9u);
    EXPECT_EQ(markers[0].number, 12);
    EXPECT_EQ(markers[1].pos, 11u);
    EXPECT_EQ(markers[1].number, 3);
}

TEST(CardSegmentTest, IgnoresMalformedMarkers) {
    EXPECT_TRUE(find_image_markers("[image] [Image1] [image1 [imagex] [ image1]").empty());
}

TEST(CardSegmentTest, OverlongNumberIsNeverValid) {
    std::vector<ImageMarker> markers = find_image_markers("[image99999999999]");
    ASSERT_EQ(markers.size(), 1u);
    EXPECT_LT(markers[0].number, 1);
}

TEST(CardSegmentTest, FormatMarker) {
    EXPECT_EQ(format_image_marker(1), "[image1]");
    EXPECT_EQ(format_image_marker(4), "[image4]");
}

// ============================================================================
// Segmentation
// ============================================================================

TEST(CardSegmentTest, SplitsTextAroundImage) {
    std::vector<ContentSegment> segs = segment_content("Hello world. [image1] Goodbye.", 1);
    ASSERT_EQ(segs.size(), 3u);
    EXPECT_EQ(segs[0], ContentSegment::text("Hello world. "));
    EXPECT_EQ(segs[1], ContentSegment::image(0));
    EXPECT_EQ(segs[2], ContentSegment::text(" Goodbye."));
}

TEST(CardSegmentTest, OmitsEmptyTextSpans) {
    std::vector<ContentSegment> segs = segment_content("[image1][image2]", 2);
    ASSERT_EQ(segs.size(), 2u);
    EXPECT_EQ(segs[0], ContentSegment::image(0));
    EXPECT_EQ(segs[1], ContentSegment::image(1));
}

TEST(CardSegmentTest, SpacedMarkerResolves) {
    std::vector<ContentSegment> segs = segment_content("[image 2] tail", 2);
    ASSERT_EQ(segs.size(), 2u);
    EXPECT_EQ(segs[0], ContentSegment::image(1));
    EXPECT_EQ(segs[1], ContentSegment::text(" tail"));
}

TEST(CardSegmentTest, OutOfRangeMarkerStaysLiteral) {
    std::vector<ContentSegment> segs = segment_content("[image5]", 2);
    ASSERT_EQ(segs.size(), 1u);
    EXPECT_EQ(segs[0], ContentSegment::text("[image5]"));

    segs = segment_content("[image0]", 2);
    ASSERT_EQ(segs.size(), 1u);
    EXPECT_EQ(segs[0], ContentSegment::text("[image0]"));
}

TEST(CardSegmentTest, LiteralMarkerJoinsSurroundingText) {
    std::vector<ContentSegment> segs = segment_content("a [image3] b [image1] c", 1);
    ASSERT_EQ(segs.size(), 3u);
    EXPECT_EQ(segs[0], ContentSegment::text("a [image3] b "));
    EXPECT_EQ(segs[1], ContentSegment::image(0));
    EXPECT_EQ(segs[2], ContentSegment::text(" c"));
}

TEST(CardSegmentTest, EmptyContent) {
    EXPECT_TRUE(segment_content("", 3).empty());
}

// ============================================================================
// Reconciliation
// ============================================================================

TEST(CardSegmentTest, ConsistentInputIsUnchanged) {
    std::vector<std::string> images = {"A", "B"};
    MarkerReconcileResult r = reconcile_markers("a[image1]b[image2]", images);
    EXPECT_FALSE(r.changed);
    EXPECT_EQ(r.content, "a[image1]b[image2]");
    EXPECT_EQ(r.images, images);
    EXPECT_EQ(r.source_indices, (std::vector<int>{0, 1}));
}

TEST(CardSegmentTest, RemovedImageRenumbersMarkers) {
    MarkerReconcileResult r = reconcile_markers("[image1] x [image3]", {"A", "B", "C"});
    EXPECT_TRUE(r.changed);
    EXPECT_EQ(r.content, "[image1] x [image2]");
    EXPECT_EQ(r.images, (std::vector<std::string>{"A", "C"}));
    EXPECT_EQ(r.source_indices, (std::vector<int>{0, 2}));
}

TEST(CardSegmentTest, OutOfRangeMarkerIsDropped) {
    MarkerReconcileResult r = reconcile_markers("[image1] and [image4]", {"A"});
    EXPECT_TRUE(r.changed);
    EXPECT_EQ(r.content, "[image1] and ");
    EXPECT_EQ(r.images, (std::vector<std::string>{"A"}));
}

TEST(CardSegmentTest, ReorderedMarkersReorderImages) {
    MarkerReconcileResult r = reconcile_markers("[image2] then [image1]", {"A", "B"});
    EXPECT_TRUE(r.changed);
    EXPECT_EQ(r.content, "[image1] then [image2]");
    EXPECT_EQ(r.images, (std::vector<std::string>{"B", "A"}));
}

TEST(CardSegmentTest, UnreferencedImagesAreDropped) {
    MarkerReconcileResult r = reconcile_markers("no markers", {"A"});
    EXPECT_TRUE(r.changed);
    EXPECT_EQ(r.content, "no markers");
    EXPECT_TRUE(r.images.empty());
}

TEST(CardSegmentTest, DuplicateMarkerDuplicatesImage) {
    MarkerReconcileResult r = reconcile_markers("[image1] [image1]", {"A"});
    EXPECT_TRUE(r.changed);
    EXPECT_EQ(r.content, "[image1] [image2]");
    EXPECT_EQ(r.images, (std::vector<std::string>{"A", "A"}));
}

TEST(CardSegmentTest, ReconcileIsIdempotent) {
    struct Case { const char* content; std::vector<std::string> images; };
    std::vector<Case> cases = {
        {"[image1] x [image3]", {"A", "B", "C"}},
        {"[image2] then [image1] [image9]", {"A", "B"}},
        {"plain", {"A", "B"}},
        {"[image1] [image1] [image 2]", {"A", "B"}},
        {"", {}},
    };
    for (const Case& c : cases) {
        MarkerReconcileResult once = reconcile_markers(c.content, c.images);
        MarkerReconcileResult twice = reconcile_markers(once.content, once.images);
        EXPECT_FALSE(twice.changed) << c.content;
        EXPECT_EQ(twice.content, once.content) << c.content;
        EXPECT_EQ(twice.images, once.images) << c.content;
    }
}

TEST(CardSegmentTest, RemapDimensions) {
    ImageDimensions dims;
    dims[0] = ImageSize{800, 400};
    dims[2] = ImageSize{100, 100};
    ImageDimensions remapped = remap_image_dimensions(dims, {2, 1, 0});
    ASSERT_EQ(remapped.size(), 2u);
    EXPECT_FLOAT_EQ(remapped[0].width, 100);
    EXPECT_EQ(remapped.count(1), 0u);
    EXPECT_FLOAT_EQ(remapped[2].width, 800);
}

// ============================================================================
// Marker Insertion
// ============================================================================

TEST(CardSegmentTest, InsertAppendsImage) {
    std::string content = "Hello";
    std::vector<std::string> images;
    EXPECT_TRUE(insert_image_marker(content, images, 5, "A"));
    EXPECT_EQ(content, "Hello[image1]");
    EXPECT_EQ(images, (std::vector<std::string>{"A"}));
}

TEST(CardSegmentTest, InsertClampsPosition) {
    std::string content = "ab";
    std::vector<std::string> images;
    EXPECT_TRUE(insert_image_marker(content, images, 100, "A"));
    EXPECT_EQ(content, "ab[image1]");
}

TEST(CardSegmentTest, InsertSnapsToCodepointBoundary) {
    std::string content = "中";
    std::vector<std::string> images;
    EXPECT_TRUE(insert_image_marker(content, images, 1, "A"));
    EXPECT_EQ(content, "[image1]中");
}

TEST(CardSegmentTest, InsertRespectsImageLimit) {
    std::string content = "[image1][image2][image3][image4]";
    std::vector<std::string> images = {"A", "B", "C", "D"};
    EXPECT_FALSE(insert_image_marker(content, images, 0, "E"));
    EXPECT_EQ(content, "[image1][image2][image3][image4]");
    EXPECT_EQ(images.size(), 4u);
}

TEST(CardSegmentTest, InsertBeforeExistingThenReconcile) {
    std::string content = "[image1] tail";
    std::vector<std::string> images = {"A"};
    ASSERT_TRUE(insert_image_marker(content, images, 0, "B"));
    EXPECT_EQ(content, "[image2][image1] tail");

    MarkerReconcileResult r = reconcile_markers(content, images);
    EXPECT_TRUE(r.changed);
    EXPECT_EQ(r.content, "[image1][image2] tail");
    EXPECT_EQ(r.images, (std::vector<std::string>{"B", "A"}));
}
