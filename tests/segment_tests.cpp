// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/core/segment.hpp>

using namespace surge::core;

TEST_CASE("Segment progress tracking", "[segment]") {
    Segment seg(SegmentSpec{2, 1000, 500});

    SECTION("Fresh segment") {
        CHECK(seg.index() == 2);
        CHECK(seg.downloaded() == 0);
        CHECK(seg.resume_offset() == 1000);
        CHECK(seg.remaining() == 500u);
        CHECK_FALSE(seg.is_complete());
        CHECK(seg.state() == SegmentState::pending);
    }

    SECTION("Partial progress moves the resume offset") {
        seg.add_downloaded(200);
        CHECK(seg.resume_offset() == 1200);
        CHECK(seg.remaining() == 300u);
    }

    SECTION("Full progress completes") {
        seg.add_downloaded(500);
        CHECK(seg.is_complete());
        CHECK(seg.remaining() == 0u);
    }
}

TEST_CASE("Segment restored from a checkpoint", "[segment]") {
    SECTION("Completed segment starts completed") {
        Segment seg(SegmentSpec{0, 0, 100}, 100);
        CHECK(seg.state() == SegmentState::completed);
    }

    SECTION("Partial segment keeps its offset") {
        Segment seg(SegmentSpec{1, 100, 100}, 40);
        CHECK(seg.resume_offset() == 140);
        CHECK_FALSE(seg.is_complete());
    }
}

TEST_CASE("Segment with unknown length", "[segment]") {
    Segment seg(SegmentSpec{0, 0, std::nullopt});
    seg.add_downloaded(4096);
    CHECK_FALSE(seg.length());
    CHECK_FALSE(seg.remaining());
    CHECK_FALSE(seg.is_complete());

    seg.set_length(seg.downloaded());
    CHECK(seg.is_complete());
}

TEST_CASE("Segment view reflects state and error", "[segment]") {
    Segment seg(SegmentSpec{3, 0, 10});
    seg.state(SegmentState::failed);
    seg.error(make_error_code(DownloadErrc::not_found));
    seg.add_retry();

    auto view = seg.view();
    CHECK(view.index == 3);
    CHECK(view.state == SegmentState::failed);
    CHECK(view.error == DownloadErrc::not_found);
    CHECK(view.retries == 1);
    CHECK(to_string(view.state) == std::string_view("failed"));
}
