// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/core/resume_store.hpp>
#include "support/temp_dir.hpp"
#include <nlohmann/json.hpp>

using namespace surge::core;
using surge::test::TempDir;
using surge::test::write_text;

namespace {

ResumeRecord sample_record(TaskId id = 7) {
    ResumeRecord r;
    r.task_id = id;
    r.url = "https://example.com/big.iso";
    r.destination = "/tmp/big.iso";
    r.total_size = 3000;
    r.requested_segments = 3;
    r.min_segment_size = 1000;
    r.supports_ranges = true;
    r.etag = "\"v1\"";
    r.checksum = Checksum{HashAlgo::sha256, "ab12"};
    r.segments = {
        {0, 0, 1000, 1000},
        {1, 1000, 1000, 250},
        {2, 2000, 1000, 0},
    };
    r.created_at = 1700000000;
    r.updated_at = 1700000100;
    return r;
}

} // namespace

TEST_CASE("ResumeStore - save and load", "[resume]") {
    TempDir dir;
    ResumeStore store(dir.path() / "state");

    auto record = sample_record();
    REQUIRE(!store.save(record));
    CHECK(std::filesystem::exists(store.record_path(7)));
    CHECK_FALSE(std::filesystem::exists(dir.path() / "state" / "7.json.tmp"));

    auto loaded = store.load(7);
    REQUIRE(loaded.has_value());
    CHECK(*loaded == record);
    CHECK(loaded->partial_bytes() == 1250);
    CHECK(loaded->plan().size() == 3);

    SECTION("Saving again replaces the record") {
        record.segments[2].downloaded = 500;
        REQUIRE(!store.save(record));
        CHECK(store.load(7)->partial_bytes() == 1750);
    }

    SECTION("Remove deletes it and tolerates absence") {
        CHECK(!store.remove(7));
        CHECK(!store.remove(7));
        auto missing = store.load(7);
        REQUIRE_FALSE(missing);
        CHECK(missing.error() == DownloadErrc::resume_not_found);
    }
}

TEST_CASE("ResumeStore - list", "[resume]") {
    TempDir dir;
    ResumeStore store(dir.path());

    SECTION("Missing directory lists nothing") {
        ResumeStore absent(dir.path() / "nope");
        auto ids = absent.list();
        REQUIRE(ids);
        CHECK(ids->empty());
    }

    SECTION("Ids ascend, other files are ignored") {
        REQUIRE(!store.save(sample_record(12)));
        REQUIRE(!store.save(sample_record(3)));
        write_text(dir.path() / "notes.txt", "x");
        write_text(dir.path() / "abc.json", "{}");
        auto ids = store.list();
        REQUIRE(ids);
        CHECK(*ids == std::vector<TaskId>{3, 12});
    }
}

TEST_CASE("parse_record - forward compatible", "[resume]") {
    auto j = nlohmann::json::parse(serialize_record(sample_record()));
    j["future_field"] = {{"anything", 1}};
    j["segments"][0]["hint"] = "extra";

    auto parsed = parse_record(j.dump());
    REQUIRE(parsed);
    CHECK(*parsed == sample_record());
}

TEST_CASE("parse_record - corrupt input", "[resume]") {
    auto base = nlohmann::json::parse(serialize_record(sample_record()));
    auto corrupt = [](const nlohmann::json& j) {
        auto r = parse_record(j.dump());
        return !r && r.error() == DownloadErrc::resume_corrupt;
    };

    SECTION("Not JSON") {
        auto r = parse_record("{ this is not json");
        REQUIRE_FALSE(r);
        CHECK(r.error() == ErrorKind::resume_corrupt);
    }

    SECTION("Missing required field") {
        auto j = base;
        j.erase("url");
        CHECK(corrupt(j));
    }

    SECTION("Wrong type") {
        auto j = base;
        j["total_size"] = "3000";
        CHECK(corrupt(j));
    }

    SECTION("Gap in the plan") {
        auto j = base;
        j["segments"][1]["offset"] = 1001;
        CHECK(corrupt(j));
    }

    SECTION("Progress beyond the segment") {
        auto j = base;
        j["segments"][1]["downloaded"] = 1001;
        CHECK(corrupt(j));
    }

    SECTION("Plan does not add up to the size") {
        auto j = base;
        j["total_size"] = 4000;
        CHECK(corrupt(j));
    }

    SECTION("Newer format version") {
        auto j = base;
        j["version"] = RESUME_FORMAT_VERSION + 1;
        CHECK(corrupt(j));
    }
}

TEST_CASE("ResumeStore - id mismatch is corrupt", "[resume]") {
    TempDir dir;
    ResumeStore store(dir.path());
    write_text(store.record_path(5), serialize_record(sample_record(6)));
    auto r = store.load(5);
    REQUIRE_FALSE(r);
    CHECK(r.error() == DownloadErrc::resume_corrupt);
}
