#include "rangeshift/core/errors.hpp"
#include "rangeshift/core/events.hpp"
#include "rangeshift/core/utils.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

namespace core = rangeshift::core;

TEST_CASE("glob_match_accepts_any_alternative") {
    REQUIRE(core::glob_match("*.fits;*.fit", "epoch_2001.fits"));
    REQUIRE(core::glob_match("*.fits;*.fit", "EPOCH_2001.FIT"));
    REQUIRE(core::glob_match("rap_????.fits", "rap_1999.fits"));
    REQUIRE_FALSE(core::glob_match("rap_????.fits", "rap_19999.fits"));
    REQUIRE_FALSE(core::glob_match("*.fits", "notes.txt"));
    REQUIRE_FALSE(core::glob_match("*.fits", "epochXfits"));
}

TEST_CASE("glob_match_treats_regex_characters_literally") {
    REQUIRE(core::glob_match("rap(v3)_*.fits", "rap(v3)_2001.fits"));
    REQUIRE_FALSE(core::glob_match("rap(v3)_*.fits", "rapv3_2001.fits"));
    REQUIRE(core::glob_match("cover+[afg]*.fits", "cover+[afg]_1990.fits"));
    REQUIRE_FALSE(core::glob_match("cover+[afg]*.fits", "coverra_1990.fits"));
    REQUIRE_NOTHROW(core::glob_match("epoch_(*.fits", "epoch_2001.fits"));
    REQUIRE_FALSE(core::glob_match("epoch_(*.fits", "epoch_2001.fits"));
    REQUIRE(core::glob_match(" *.fits ; *.fit ", "a.fit"));
    REQUIRE_FALSE(core::glob_match(";", "a.fits"));
}

TEST_CASE("sha256_file_matches_known_digest") {
    auto dir = std::filesystem::temp_directory_path() / "rangeshift_test_sha256";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    core::write_text(dir / "abc.txt", "abc");
    core::write_text(dir / "empty.txt", "");

    REQUIRE(core::sha256_file(dir / "abc.txt") ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(core::sha256_file(dir / "empty.txt") ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    REQUIRE_THROWS_AS(core::sha256_file(dir / "missing.txt"), rangeshift::IOError);

    std::filesystem::remove_all(dir);
}

TEST_CASE("run_id_and_timestamp_have_fixed_shape") {
    const std::string ts = core::get_iso_timestamp();
    REQUIRE(ts.size() == 24);
    REQUIRE(ts[10] == 'T');
    REQUIRE(ts.back() == 'Z');

    const std::string id = core::get_run_id();
    REQUIRE(id.size() == 25);
    REQUIRE(id[15] == 'Z');
    REQUIRE(id[16] == '_');
}

TEST_CASE("discover_files_filters_and_sorts") {
    auto dir = std::filesystem::temp_directory_path() / "rangeshift_test_discover";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    core::write_text(dir / "b_2002.fits", "x");
    core::write_text(dir / "a_2001.fit", "x");
    core::write_text(dir / "readme.txt", "x");

    auto files = core::discover_files(dir, "*.fits;*.fit");

    REQUIRE(files.size() == 2);
    REQUIRE(files[0].filename() == "a_2001.fit");
    REQUIRE(files[1].filename() == "b_2002.fits");
    REQUIRE(core::read_text(dir / "readme.txt") == "x");
    REQUIRE(core::discover_files(dir / "missing").empty());

    std::filesystem::remove_all(dir);
}

TEST_CASE("read_text_of_missing_file_throws") {
    REQUIRE_THROWS_AS(core::read_text("/nonexistent/rangeshift.txt"), rangeshift::IOError);
}

TEST_CASE("event_emitter_writes_one_json_line_per_event") {
    core::EventEmitter events;
    std::ostringstream out;

    events.phase_start("run1", rangeshift::Phase::CLUSTER_FIT, out);
    events.tile_failed("run1", 7, 2, true, "read failed", out);
    events.phase_progress("run1", rangeshift::Phase::TILE_PROCESSING, 3, 12, "tiles", out);
    events.phase_end("run1", rangeshift::Phase::CLUSTER_FIT, "ok", {{"k", 5}}, out);

    std::istringstream in(out.str());
    std::string line;
    std::vector<nlohmann::json> parsed;
    while (std::getline(in, line)) {
        parsed.push_back(nlohmann::json::parse(line));
    }

    REQUIRE(parsed.size() == 4);
    REQUIRE(parsed[0]["type"] == "phase_start");
    REQUIRE(parsed[0]["phase_name"] == "CLUSTER_FIT");
    REQUIRE(parsed[0]["phase"] == 3);
    REQUIRE(parsed[1]["tile_index"] == 7);
    REQUIRE(parsed[1]["will_retry"] == true);
    REQUIRE(parsed[2]["current"] == 3);
    REQUIRE(parsed[2]["total"] == 12);
    REQUIRE(parsed[2]["progress"].get<double>() == Catch::Approx(0.25));
    REQUIRE(parsed[3]["status"] == "ok");
    REQUIRE(parsed[3]["k"] == 5);
    REQUIRE(parsed[3]["run_id"] == "run1");
    REQUIRE(parsed[3]["ts"].get<std::string>().back() == 'Z');
}
