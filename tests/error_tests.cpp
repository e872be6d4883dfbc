// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/core/error.hpp>
#include <surge/disk/error.hpp>
#include <cerrno>

using namespace surge::core;
using surge::disk::DiskErrc;

TEST_CASE("Error codes map onto the failure taxonomy", "[error]") {
    SECTION("Transport failures are transient") {
        for (auto e : {DownloadErrc::timeout, DownloadErrc::connection_lost, DownloadErrc::refused,
                       DownloadErrc::server_error, DownloadErrc::throttled}) {
            auto ec = make_error_code(e);
            CHECK(ec == ErrorKind::transient_network);
            CHECK(is_retriable(ec));
        }
    }

    SECTION("Client errors are permanent") {
        for (auto e : {DownloadErrc::not_found, DownloadErrc::forbidden,
                       DownloadErrc::http_client_error, DownloadErrc::range_ignored}) {
            auto ec = make_error_code(e);
            CHECK(ec == ErrorKind::permanent_http);
            CHECK_FALSE(is_retriable(ec));
        }
    }

    SECTION("Probe, resume and verification kinds") {
        CHECK(make_error_code(DownloadErrc::unreachable) == ErrorKind::probe);
        CHECK(make_error_code(DownloadErrc::probe_ambiguous) == ErrorKind::probe);
        CHECK(make_error_code(DownloadErrc::resume_corrupt) == ErrorKind::resume_corrupt);
        CHECK(make_error_code(DownloadErrc::checksum_mismatch) == ErrorKind::verification);
        CHECK(make_error_code(DownloadErrc::size_mismatch) == ErrorKind::verification);
        CHECK(make_error_code(DownloadErrc::cancelled) == ErrorKind::cancelled);
        CHECK(make_error_code(DownloadErrc::invalid_state) == ErrorKind::usage);
    }

    SECTION("Disk errors are filesystem errors") {
        auto ec = make_error_code(DiskErrc::disk_full);
        CHECK(ec == ErrorKind::filesystem);
        CHECK_FALSE(is_retriable(ec));
    }

    SECTION("Messages are readable") {
        CHECK(make_error_code(DownloadErrc::checksum_mismatch).message() == "Checksum mismatch");
        CHECK_FALSE(make_error_code(DiskErrc::access_denied).message().empty());
    }
}

TEST_CASE("errno_to_error_code", "[error][disk]") {
    using surge::disk::errno_to_error_code;
    CHECK(!errno_to_error_code(0));
    CHECK(errno_to_error_code(ENOENT) == DiskErrc::file_not_found);
    CHECK(errno_to_error_code(EACCES) == DiskErrc::access_denied);
    CHECK(errno_to_error_code(ENOSPC) == DiskErrc::disk_full);
    CHECK(errno_to_error_code(EEXIST) == DiskErrc::file_exists);
    CHECK(errno_to_error_code(EIO, DiskErrc::read_error) == DiskErrc::read_error);
}
