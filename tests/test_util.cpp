#include <catch2/catch.hpp>
#include "util.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace memcat;

// ── Timestamps ───────────────────────────────────────────────────

TEST_CASE("format_timestamp: ISO 8601 UTC with microseconds", "[util]") {
    auto tp = std::chrono::system_clock::time_point(std::chrono::seconds(1738314902)) +
              std::chrono::microseconds(123456);
    REQUIRE(format_timestamp(tp) == "2025-01-31T09:15:02.123456Z");
}

TEST_CASE("format_timestamp: zero fraction is padded", "[util]") {
    auto tp = std::chrono::system_clock::time_point(std::chrono::seconds(0));
    REQUIRE(format_timestamp(tp) == "1970-01-01T00:00:00.000000Z");
}

TEST_CASE("format_timestamp: fixed width sorts chronologically", "[util]") {
    auto base = std::chrono::system_clock::time_point(std::chrono::seconds(1738314902));
    auto a = format_timestamp(base + std::chrono::microseconds(9));
    auto b = format_timestamp(base + std::chrono::microseconds(10));
    auto c = format_timestamp(base + std::chrono::seconds(1));
    REQUIRE(a < b);
    REQUIRE(b < c);
}

TEST_CASE("format_compact_timestamp: digits only", "[util]") {
    REQUIRE(format_compact_timestamp(1738314902123456LL) == "20250131091502123456");
    REQUIRE(format_compact_timestamp(0) == "19700101000000000000");
}

TEST_CASE("epoch_micros: counts microseconds", "[util]") {
    auto tp = std::chrono::system_clock::time_point(std::chrono::seconds(2)) +
              std::chrono::microseconds(5);
    REQUIRE(epoch_micros(tp) == 2000005);
}

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: removes leading and trailing whitespace", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
    REQUIRE(trim("\t\n hi \r\n") == "hi");
}

TEST_CASE("trim: empty and all-whitespace return empty", "[util]") {
    REQUIRE(trim("").empty());
    REQUIRE(trim("   \t ").empty());
}

// ── case folding ─────────────────────────────────────────────────

TEST_CASE("to_lower: ASCII only", "[util]") {
    REQUIRE(to_lower("Content-Length") == "content-length");
    REQUIRE(to_lower("ÁB") == "Áb");
}

TEST_CASE("utf8_to_lower: ASCII and Latin-1 capitals", "[util]") {
    REQUIRE(utf8_to_lower("PYTHON") == "python");
    REQUIRE(utf8_to_lower("REUNIÃO") == "reunião");
    REQUIRE(utf8_to_lower("NEGÓCIO") == "negócio");
    REQUIRE(utf8_to_lower("FAMÍLIA") == "família");
    REQUIRE(utf8_to_lower("ÇÉÊÔÕÜ") == "çéêôõü");
}

TEST_CASE("utf8_to_lower: leaves other characters alone", "[util]") {
    REQUIRE(utf8_to_lower("já é") == "já é");
    REQUIRE(utf8_to_lower("2×3") == "2×3");
    REQUIRE(utf8_to_lower("ΑΒΓ") == "ΑΒΓ");
    REQUIRE(utf8_to_lower("") == "");
}

TEST_CASE("utf8_to_lower: stray lead byte does not swallow the next character", "[util]") {
    REQUIRE(utf8_to_lower("\xC3" "ABC") == "\xC3" "abc");
    REQUIRE(utf8_to_lower("ABC\xC3") == "abc\xC3");
    // Still folds a real continuation byte right after
    REQUIRE(utf8_to_lower("\xC3" "\xC3\x81") == "\xC3" "\xC3\xA1");
}

// ── utf8_truncate ────────────────────────────────────────────────

TEST_CASE("utf8_truncate: counts code points", "[util]") {
    REQUIRE(utf8_truncate("abcdef", 3) == "abc");
    REQUIRE(utf8_truncate("ãéíõú", 2) == "ãé");
    REQUIRE(utf8_truncate("curto", 100) == "curto");
    REQUIRE(utf8_truncate("abc", 0).empty());
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: path without tilde unchanged", "[util]") {
    REQUIRE(expand_home("/usr/local") == "/usr/local");
}

TEST_CASE("expand_home: tilde is expanded", "[util]") {
    std::string result = expand_home("~/.memcat");
    REQUIRE(result.find('~') == std::string::npos);
    REQUIRE(result.size() > std::string("/.memcat").size());
}

TEST_CASE("expand_home: empty string unchanged", "[util]") {
    REQUIRE(expand_home("").empty());
}

// ── atomic_write_file ────────────────────────────────────────────

TEST_CASE("atomic_write_file: creates parent directories", "[util]") {
    auto base = std::filesystem::temp_directory_path() /
                ("memcat_util_" + std::to_string(::getpid()));
    std::string path = (base / "nested" / "file.json").string();

    REQUIRE(atomic_write_file(path, "{\"a\":1}\n"));
    REQUIRE(atomic_write_file(path, "{\"a\":2}\n"));

    std::ifstream f(path);
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    REQUIRE(content == "{\"a\":2}\n");
    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));

    std::filesystem::remove_all(base);
}
