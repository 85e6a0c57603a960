#include "rangeshift/core/errors.hpp"
#include "rangeshift/io/epoch_source.hpp"
#include "rangeshift/io/fits_io.hpp"

#include <cmath>
#include <filesystem>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;
using rangeshift::Matrix2Df;
using rangeshift::io::FitsHeader;

namespace {

struct TempDir {
    fs::path path;
    explicit TempDir(const std::string& name) : path(fs::temp_directory_path() / name) {
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

rangeshift::Grid epoch_grid() {
    rangeshift::Grid g;
    g.width = 6;
    g.height = 4;
    g.origin_x = -1500000.0;
    g.origin_y = 2100000.0;
    g.pixel_width = 30.0;
    g.pixel_height = -30.0;
    g.crs = "EPSG:5070";
    return g;
}

// Two-band epoch cube whose pixel value is year * 100 + band * 10 + x + y.
fs::path write_epoch(const fs::path& dir, int year, const rangeshift::Grid& grid,
                     const std::vector<std::string>& bands) {
    FitsHeader h;
    h.set("YEAR", year);
    for (size_t b = 0; b < bands.size(); ++b) {
        h.set("BAND" + std::to_string(b + 1), bands[b]);
    }
    rangeshift::io::grid_to_header(grid, h);

    fs::path path = dir / ("epoch_" + std::to_string(year) + ".fits");
    rangeshift::io::FitsCubeWriter w(path, grid.width, grid.height, static_cast<int>(bands.size()),
                                     rangeshift::io::FitsPixelType::FLOAT32, h);
    for (size_t b = 0; b < bands.size(); ++b) {
        Matrix2Df plane(grid.height, grid.width);
        for (int y = 0; y < grid.height; ++y) {
            for (int x = 0; x < grid.width; ++x) {
                plane(y, x) = static_cast<float>(year * 100 + static_cast<int>(b) * 10 + x + y);
            }
        }
        w.write_region(static_cast<int>(b), 0, 0, plane);
    }
    w.close();
    return path;
}

} // namespace

TEST_CASE("fits_cube_writer_and_reader_agree_on_regions") {
    TempDir tmp("rangeshift_test_fits_cube");
    fs::path path = tmp.path / "labels.fits";

    FitsHeader h;
    h.set("RUNID", std::string("abc"));
    h.set("NEVER", 9999);
    {
        rangeshift::io::FitsCubeWriter w(path, 5, 3, 2, rangeshift::io::FitsPixelType::INT32, h);
        rangeshift::LabelMatrix left(3, 2);
        left << 0, 1,
                2, 3,
                4, 0;
        rangeshift::LabelMatrix right = rangeshift::LabelMatrix::Constant(3, 3, -1);
        w.write_region(1, 0, 0, left);
        w.write_region(1, 2, 0, right);
        w.close();
    }

    rangeshift::io::FitsCubeReader reader(path);
    REQUIRE(reader.info().width == 5);
    REQUIRE(reader.info().height == 3);
    REQUIRE(reader.info().planes == 2);
    REQUIRE(reader.info().header.get_string("RUNID") == std::string("abc"));
    REQUIRE(reader.info().header.get_int("NEVER") == 9999);

    auto planes = reader.read_region(1, 1, 3, 2);
    REQUIRE(planes.size() == 2);
    REQUIRE(planes[1](0, 0) == 3.0f);
    REQUIRE(planes[1](1, 0) == 0.0f);
    REQUIRE(planes[1](0, 1) == -1.0f);
    // Plane 0 was never written and reads back as zeros.
    REQUIRE(planes[0].isZero());

    float px[2];
    reader.read_pixel(0, 2, px);
    REQUIRE(px[1] == 4.0f);

    REQUIRE_THROWS_AS(reader.read_region(4, 0, 3, 1), rangeshift::ShapeError);
}

TEST_CASE("integer_blank_pixels_read_as_nan") {
    TempDir tmp("rangeshift_test_fits_blank");
    fs::path path = tmp.path / "cover_int16.fits";

    FitsHeader h;
    h.set("BLANK", -32768);
    {
        rangeshift::io::FitsCubeWriter w(path, 3, 2, 1, rangeshift::io::FitsPixelType::INT16, h);
        rangeshift::LabelMatrix cover(2, 3);
        cover << 12, -32768, 40,
                 0, 7, -32768;
        w.write_region(0, 0, 0, cover);
        w.close();
    }

    auto plane = rangeshift::io::read_fits_plane(path);
    REQUIRE(plane(0, 0) == 12.0f);
    REQUIRE(std::isnan(plane(0, 1)));
    REQUIRE(plane(1, 0) == 0.0f);
    REQUIRE(std::isnan(plane(1, 2)));

    rangeshift::io::FitsCubeReader reader(path);
    float px[1];
    reader.read_pixel(1, 0, px);
    REQUIRE(std::isnan(px[0]));
    reader.read_pixel(1, 1, px);
    REQUIRE(px[0] == 7.0f);
}

TEST_CASE("fits_writer_rejects_region_outside_cube") {
    TempDir tmp("rangeshift_test_fits_bounds");
    rangeshift::io::FitsCubeWriter w(tmp.path / "x.fits", 4, 4, 1,
                                     rangeshift::io::FitsPixelType::FLOAT32, FitsHeader());

    REQUIRE_THROWS_AS(w.write_region(0, 3, 3, Matrix2Df::Zero(2, 2)), rangeshift::ShapeError);
    REQUIRE_THROWS_AS(w.write_region(1, 0, 0, Matrix2Df::Zero(1, 1)), rangeshift::ShapeError);
    w.close();
}

TEST_CASE("grid_round_trips_through_header_keywords") {
    FitsHeader h;
    rangeshift::io::grid_to_header(epoch_grid(), h);

    rangeshift::Grid fallback;
    auto g = rangeshift::io::grid_from_header(h, 6, 4, fallback);

    REQUIRE(rangeshift::same_grid(g, epoch_grid()));
}

TEST_CASE("epoch_source_orders_files_by_year") {
    TempDir tmp("rangeshift_test_epoch_source");
    const std::vector<std::string> bands = {"AFG", "PFG"};
    auto p2003 = write_epoch(tmp.path, 2003, epoch_grid(), bands);
    auto p2001 = write_epoch(tmp.path, 2001, epoch_grid(), bands);
    auto p2002 = write_epoch(tmp.path, 2002, epoch_grid(), bands);

    auto src = rangeshift::io::EpochSource::open({p2003, p2001, p2002}, bands, "YEAR", rangeshift::Grid());

    REQUIRE(src.years() == std::vector<int>{2001, 2002, 2003});
    REQUIRE(rangeshift::same_grid(src.grid(), epoch_grid()));

    auto window = src.read_window(2, 1, 3, 2);
    REQUIRE(window.size() == 3);
    REQUIRE(window.grid.width == 3);
    REQUIRE(window.grid.origin_x == Catch::Approx(-1500000.0 + 60.0));
    REQUIRE(window.grid.origin_y == Catch::Approx(2100000.0 - 30.0));
    REQUIRE(window.epochs[1].year == 2002);
    REQUIRE(window.epochs[1].bands[1](0, 0) == Catch::Approx(2002 * 100 + 10 + 2 + 1));

    float px[2];
    src.read_pixel(2, 5, 3, px);
    REQUIRE(px[0] == Catch::Approx(2003 * 100 + 5 + 3));
    REQUIRE(px[1] == Catch::Approx(2003 * 100 + 10 + 5 + 3));
}

TEST_CASE("epoch_source_rejects_inconsistent_inputs") {
    TempDir tmp("rangeshift_test_epoch_bad");
    const std::vector<std::string> bands = {"AFG", "PFG"};
    auto good = write_epoch(tmp.path, 2000, epoch_grid(), bands);

    SECTION("band_names_differ") {
        REQUIRE_THROWS_AS(rangeshift::io::EpochSource::open({good}, {"PFG", "AFG"}, "YEAR", rangeshift::Grid()),
                          rangeshift::ShapeError);
    }
    SECTION("band_count_differs") {
        REQUIRE_THROWS_AS(rangeshift::io::EpochSource::open({good}, {"AFG", "PFG", "BGR"}, "YEAR",
                                                            rangeshift::Grid()),
                          rangeshift::ShapeError);
    }
    SECTION("grid_differs") {
        auto shifted_grid = epoch_grid();
        shifted_grid.origin_x += 30.0;
        auto shifted = write_epoch(tmp.path, 2001, shifted_grid, bands);
        REQUIRE_THROWS_AS(rangeshift::io::EpochSource::open({good, shifted}, bands, "YEAR", rangeshift::Grid()),
                          rangeshift::ShapeError);
    }
    SECTION("year_keyword_missing") {
        REQUIRE_THROWS_AS(rangeshift::io::EpochSource::open({good}, bands, "OBSYEAR", rangeshift::Grid()),
                          rangeshift::ShapeError);
    }
    SECTION("duplicate_year") {
        REQUIRE_THROWS_AS(rangeshift::io::EpochSource::open({good, good}, bands, "YEAR", rangeshift::Grid()),
                          rangeshift::ShapeError);
    }
}

TEST_CASE("missing_fits_file_is_a_fits_error") {
    REQUIRE_THROWS_AS(rangeshift::io::read_fits_info("/nonexistent/epoch.fits"), rangeshift::FitsError);
    REQUIRE_THROWS_AS(rangeshift::io::read_fits_info("/nonexistent/epoch.fits"), rangeshift::IOError);
}
