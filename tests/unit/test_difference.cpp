#include "color/Difference.h"
#include "core/Errors.h"
#include "test_helpers.h"

#include <doctest/doctest.h>

using namespace PolyTest;

TEST_SUITE_BEGIN("poly.difference");

TEST_CASE("identical_buffers_match_fully") {
    rgba c = { 12, 34, 56, 255 };
    TargetImage t = flat_target(5, 4, c);
    CHECK(PixelDifference(t.pixels, t.pixels) == 0);
    CHECK(MatchPercentage(0, MaxDifference(5, 4)) == doctest::Approx(100.0));
}

TEST_CASE("black_against_white_is_max_difference") {
    rgba black = { 0, 0, 0, 255 };
    rgba white = { 255, 255, 255, 255 };
    TargetImage a = flat_target(2, 3, black);
    TargetImage b = flat_target(2, 3, white);
    const distance_accum_t max = MaxDifference(2, 3);
    CHECK(max == 2 * 3 * 3 * 255);
    CHECK(PixelDifference(a.pixels, b.pixels) == max);
    CHECK(MatchPercentage(PixelDifference(a.pixels, b.pixels), max) == doctest::Approx(0.0));
}

TEST_CASE("alpha_channel_is_not_scored") {
    rgba opaque = { 100, 150, 200, 255 };
    rgba clear = { 100, 150, 200, 0 };
    TargetImage a = flat_target(3, 3, opaque);
    TargetImage b = flat_target(3, 3, clear);
    CHECK(PixelDifference(a.pixels, b.pixels) == 0);
}

TEST_CASE("difference_sums_channels") {
    rgba t = { 10, 20, 30, 255 };
    rgba r = { 15, 10, 30, 255 };
    TargetImage a = flat_target(2, 2, t);
    TargetImage b = flat_target(2, 2, r);
    CHECK(PixelDifference(a.pixels, b.pixels) == 4 * (5 + 10));
    CHECK(MatchPercentage(MaxDifference(2, 2) / 2, MaxDifference(2, 2)) == doctest::Approx(50.0));
}

TEST_CASE("length_mismatch_throws") {
    pixel_buffer a(40, 0);
    pixel_buffer b(44, 0);
    CHECK_THROWS_AS(PixelDifference(a, b), DimensionMismatchError);
    CHECK_THROWS_AS(VisualizeDifference(a, b), DimensionMismatchError);
    try {
        PixelDifference(a, b);
    } catch (const DimensionMismatchError& e) {
        CHECK(std::string(e.what()).find("Invalid data comparison") == 0);
    }
}

TEST_CASE("bad_normalization_rejected") {
    CHECK_THROWS_AS(MatchPercentage(0, 0), InvalidArgumentError);
    CHECK_THROWS_AS(MatchPercentage(10, -1), InvalidArgumentError);
    CHECK_THROWS_AS(MaxDifference(0, 10), InvalidArgumentError);
    CHECK_THROWS_AS(MaxDifference(10, -1), InvalidArgumentError);
}

TEST_CASE("visualization_alpha_tracks_similarity") {
    rgba t = { 100, 100, 100, 255 };
    TargetImage target = flat_target(2, 1, t);
    pixel_buffer rendered = target.pixels;
    // second pixel off by 1 on each channel
    rendered[4] = 101;
    rendered[5] = 99;
    rendered[6] = 101;

    pixel_buffer overlay = VisualizeDifference(target.pixels, rendered);
    REQUIRE(overlay.size() == target.pixels.size());
    CHECK(overlay[0] == 0);
    CHECK(overlay[1] == 0);
    CHECK(overlay[2] == 0);
    CHECK(overlay[3] == 255);
    CHECK(overlay[7] == 254);

    rgba black = { 0, 0, 0, 255 };
    rgba white = { 255, 255, 255, 255 };
    pixel_buffer far = VisualizeDifference(flat_target(1, 1, black).pixels, flat_target(1, 1, white).pixels);
    CHECK(far[3] == 0);
}

TEST_SUITE_END();
