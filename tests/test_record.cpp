/**
 * @file test_record.cpp
 * @brief Unit tests for record naming and the header file.
 */

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>
#include <holterwfdb/error.hpp>
#include <holterwfdb/file_io.hpp>
#include <holterwfdb/record.hpp>

#include <string>

using namespace holterwfdb;

TEST_CASE("File type extensions", "[record]") {
    REQUIRE(std::string(extension(FileType::Header)) == ".hea");
    REQUIRE(std::string(extension(FileType::Data)) == ".dat");
    REQUIRE(std::string(extension(FileType::Annotation)) == ".atr");
}

TEST_CASE("Artifact paths and record names", "[record]") {
    SECTION("artifact_path joins dir and base") {
        REQUIRE(artifact_path("out", "rec01", FileType::Data) == "out/rec01.dat");
        REQUIRE(artifact_path("out/", "rec01", FileType::Header) == "out/rec01.hea");
        REQUIRE(artifact_path("/tmp/x", "r", FileType::Annotation) == "/tmp/x/r.atr");
    }

    SECTION("record_name strips directory and last extension") {
        REQUIRE(record_name("/data/holter/rec01.bin") == "rec01");
        REQUIRE(record_name("patient.2024.bin") == "patient.2024");
        REQUIRE(record_name("noext") == "noext");
    }
}

TEST_CASE("Header text", "[record]") {
    SECTION("default three channels") {
        std::string expected = "rec 3 6 250\n"
                               "ECG 212 1 0 0 200 0 mV\n"
                               "ECG 212 1 0 3 200 0 mV\n"
                               "ECG 212 1 0 6 200 0 mV\n";
        REQUIRE(format_header("rec", 6, 250) == expected);
    }

    SECTION("zero frames") {
        std::string text = format_header("empty", 0, 256);
        REQUIRE(text.substr(0, text.find('\n')) == "empty 3 0 256");
    }

    SECTION("custom channels and gain") {
        std::string expected = "r 2 4 500\n"
                               "ECG 212 1 0 0 100 0 mV\n"
                               "ECG 212 1 0 3 100 0 mV\n";
        REQUIRE(format_header("r", 4, 500, 2, 100) == expected);
    }
}

TEST_CASE("Header parsing", "[record]") {
    SECTION("parses what format_header writes") {
        HeaderInfo info = parse_header(format_header("rec01", 921600, 256));
        REQUIRE(info.record == "rec01");
        REQUIRE(info.channels == 3);
        REQUIRE(info.frames == 921600);
        REQUIRE(info.sample_rate == 256);
        REQUIRE(info.signals.size() == 3);
        REQUIRE(info.signals[2].byte_offset == 6);
        REQUIRE(info.signals[1].format == 212);
        REQUIRE(info.signals[0].gain == 200);
        REQUIRE(info.signals[0].units == "mV");
    }

    SECTION("comment lines are skipped") {
        HeaderInfo info = parse_header("r 1 2 100\n# comment\nECG 212 1 0 0 200 0 mV\n");
        REQUIRE(info.signals.size() == 1);
    }

    SECTION("empty text") {
        REQUIRE_THROWS_AS(parse_header(""), InvalidDataException);
    }

    SECTION("malformed record line") {
        REQUIRE_THROWS_AS(parse_header("rec three 6 250\n"), InvalidDataException);
        REQUIRE_THROWS_AS(parse_header("rec 3 6 70000\n"), InvalidDataException);
    }

    SECTION("malformed signal line") {
        REQUIRE_THROWS_AS(parse_header("r 1 2 100\nECG 212 x\n"), InvalidDataException);
    }

    SECTION("channel count mismatch") {
        REQUIRE_THROWS_AS(parse_header("r 3 2 100\nECG 212 1 0 0 200 0 mV\n"),
                          InvalidDataException);
    }
}

TEST_CASE("Header file on disk", "[record]") {
    holterwfdb::test::TempDir dir;
    std::string path = artifact_path(dir.str(), "rec", FileType::Header);
    write_file(path, format_header("rec", 10, 360));

    HeaderInfo info = read_header_file(path);
    REQUIRE(info.frames == 10);
    REQUIRE(info.sample_rate == 360);

    REQUIRE_THROWS_AS(read_header_file(dir.str() + "/missing.hea"), ReadException);
}

TEST_CASE("Listing records", "[record]") {
    holterwfdb::test::TempDir dir;

    SECTION("only header files count, sorted") {
        write_file(artifact_path(dir.str(), "b", FileType::Header), "b 3 0 256\n");
        write_file(artifact_path(dir.str(), "a", FileType::Header), "a 3 0 256\n");
        write_file(artifact_path(dir.str(), "a", FileType::Data), "");
        write_file(artifact_path(dir.str(), "c", FileType::Data), "");
        write_file(dir.str() + "/notes.txt", "x");

        std::vector<std::string> records = list_records(dir.str());
        std::vector<std::string> expected = {"a", "b"};
        REQUIRE(records == expected);
    }

    SECTION("empty directory") {
        REQUIRE(list_records(dir.str()).empty());
    }

    SECTION("missing directory") {
        REQUIRE(list_records(dir.str() + "/nope").empty());
    }
}
