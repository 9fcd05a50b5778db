#include "field_grid.hpp"
#include "field_validation.hpp"
#include "npy_io.hpp"
#include "nowcast_errors.hpp"

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace nowcast;

namespace
{

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[field-grid-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

int expect_close(double actual, double expected, const std::string& label, double tol = 1.0e-9)
{
    if (!(std::abs(actual - expected) <= tol))
    {
        std::cerr << "[field-grid-regression] FAIL: " << label
                  << " actual=" << actual
                  << " expected=" << expected
                  << " tol=" << tol << std::endl;
        return 1;
    }
    return 0;
}

GridGeometry geometry(int rows, int cols)
{
    GridGeometry g;
    g.rows = rows;
    g.cols = cols;
    g.dx_m = 1000.0;
    g.dy_m = 1000.0;
    g.projection = "EPSG:3067";
    return g;
}

std::filesystem::path scratch_dir(const std::string& name)
{
    const std::filesystem::path dir = std::filesystem::temp_directory_path() / ("nowcast_field_grid_" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

int test_grid_construction_and_queries()
{
    int failures = 0;

    Field2D values(2, 3, std::vector<float>{0.0f, 10.0f, 20.0f, 30.0f, 2.0f, 40.0f});
    Mask2D valid = {1, 1, 1, 1, 1, 0};
    const FieldGrid grid(geometry(2, 3), 1000.0, values, valid);

    failures += expect_true(grid.rows() == 2 && grid.cols() == 3, "grid shape");
    failures += expect_true(grid.valid_count() == 5, "valid count");
    failures += expect_close(grid.nodata_fraction(), 1.0 / 6.0, "nodata fraction");
    failures += expect_true(grid.echo_count(5.0f) == 3, "echo count ignores no-data and weak cells");

    float lo = 0.0f;
    float hi = 0.0f;
    failures += expect_true(grid.value_range(lo, hi), "value range found");
    failures += expect_close(lo, 0.0, "range lo");
    failures += expect_close(hi, 30.0, "range hi excludes no-data cell");

    const FieldGrid moved = grid.retimed(1600.0);
    failures += expect_close(moved.timestamp_s(), 1600.0, "retimed timestamp");
    failures += expect_true(moved.values() == grid.values(), "retimed keeps values");

    const FieldGrid empty = FieldGrid::no_data(geometry(2, 3), 0.0);
    failures += expect_true(empty.valid_count() == 0, "no_data grid has no valid cells");
    failures += expect_close(empty.nodata_fraction(), 1.0, "no_data fraction");
    failures += expect_true(!empty.value_range(lo, hi), "no_data grid has no range");

    bool threw = false;
    try
    {
        FieldGrid bad(geometry(3, 3), 0.0, Field2D(2, 3));
    }
    catch (const std::invalid_argument&)
    {
        threw = true;
    }
    failures += expect_true(threw, "shape mismatch must throw");

    const Field2D& raster = grid.values();
    failures += expect_true(raster.row(1) == raster.data() + 3, "row pointer starts at the row offset");
    failures += expect_true(raster.row(1)[2] == raster(1, 2), "row pointer agrees with element access");

    const FieldGrid byte_mask(geometry(2, 3), 0.0, values, Mask2D{255, 255, 0, 255, 7, 0});
    failures += expect_true(byte_mask.valid_count() == 4, "non-zero mask bytes count as data");
    failures += expect_close(byte_mask.nodata_fraction(), 2.0 / 6.0, "non-zero mask bytes nodata fraction");
    failures += expect_true(byte_mask.valid_mask()[0] == 1 && byte_mask.valid_mask()[4] == 1,
                            "mask stored as 0/1");
    failures += expect_true(byte_mask.is_valid(1, 1) && !byte_mask.is_valid(0, 2), "byte mask queries");

    GridGeometry other = geometry(2, 3);
    failures += expect_true(other.compatible_with(geometry(2, 3)), "identical geometry is compatible");
    other.projection = "EPSG:4326";
    failures += expect_true(!other.compatible_with(geometry(2, 3)), "projection mismatch is incompatible");
    other = geometry(2, 3);
    other.dx_m = 2000.0;
    failures += expect_true(!other.compatible_with(geometry(2, 3)), "cell size mismatch is incompatible");

    return failures;
}

int test_input_preparation_guards()
{
    int failures = 0;

    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();
    Field2D values(2, 3, std::vector<float>{255.0f, nan, 3.0f, 12.0f, inf, 40.0f});
    const FieldGrid raw(geometry(2, 3), 0.0, values);

    InputConfig input;
    input.has_nodata_value = true;
    input.nodata_value = 255.0f;
    input.has_zero_below = true;
    input.zero_below = 5.0f;

    ValidationPolicy policy;
    policy.mode = GuardMode::Sanitize;
    GridValidationResult check;
    const FieldGrid prepared = prepare_input_grid(raw, policy, input, &check);

    failures += expect_true(!prepared.is_valid(0, 0), "sentinel becomes no-data");
    failures += expect_true(!prepared.is_valid(0, 1), "NaN becomes no-data when sanitizing");
    failures += expect_true(!prepared.is_valid(1, 1), "Inf becomes no-data when sanitizing");
    failures += expect_true(prepared.is_valid(0, 2), "weak echo stays valid");
    failures += expect_close(prepared.value(0, 2), 0.0, "weak echo floored to zero");
    failures += expect_close(prepared.value(1, 0), 12.0, "strong echo untouched");
    failures += expect_true(check.stats.sentinel_count == 1, "sentinel count");
    failures += expect_true(check.stats.nan_count == 1 && check.stats.inf_count == 1, "non-finite counts");
    failures += expect_true(check.stats.sanitized_nonfinite_count == 2, "sanitized count");
    failures += expect_true(check.stats.floored_count == 1, "floored count");
    failures += expect_true(!check.failed, "sanitize never fails");

    policy.mode = GuardMode::Off;
    const FieldGrid kept = prepare_input_grid(raw, policy, input, &check);
    failures += expect_true(kept.is_valid(0, 1), "off mode keeps non-finite cells valid");
    failures += expect_true(check.stats.sanitized_nonfinite_count == 0, "off mode sanitizes nothing");

    policy.mode = GuardMode::Strict;
    bool threw = false;
    try
    {
        (void)prepare_input_grid(raw, policy, input, &check);
    }
    catch (const ConfigurationError&)
    {
        threw = true;
    }
    failures += expect_true(threw, "strict mode rejects non-finite input");
    failures += expect_true(check.failed, "strict result flagged failed");

    GuardMode mode = GuardMode::Off;
    failures += expect_true(parse_guard_mode("Strict", mode) && mode == GuardMode::Strict, "parse strict");
    failures += expect_true(parse_guard_mode("sanitize", mode) && mode == GuardMode::Sanitize, "parse sanitize");
    failures += expect_true(!parse_guard_mode("lenient", mode), "unknown guard mode rejected");

    return failures;
}

int test_grid_statistics()
{
    int failures = 0;

    std::vector<float> ramp(100);
    for (int i = 0; i < 100; ++i)
    {
        ramp[static_cast<std::size_t>(i)] = static_cast<float>(i);
    }
    const FieldGrid grid(geometry(10, 10), 0.0, Field2D(10, 10, ramp));
    const FieldStats stats = compute_grid_stats(grid, true);

    failures += expect_true(stats.total_count == 100 && stats.valid_count == 100, "stats counts");
    failures += expect_close(stats.min_value, 0.0, "stats min");
    failures += expect_close(stats.max_value, 99.0, "stats max");
    failures += expect_close(stats.mean_value, 49.5, "stats mean", 1.0e-6);
    failures += expect_true(stats.p01 <= stats.p50 && stats.p50 <= stats.p99, "percentiles ordered");
    failures += expect_true(stats.p50 >= 40.0 && stats.p50 <= 60.0, "median near centre");

    const std::string json = field_stats_to_json(stats);
    failures += expect_true(json.find("\"valid_count\": 100") != std::string::npos, "stats json valid_count");
    failures += expect_true(json.front() == '{' && json.back() == '}', "stats json object");

    return failures;
}

void write_raw_npy(const std::filesystem::path& path, const std::string& descr,
                   const void* payload, std::size_t bytes)
{
    std::string header = "{'descr': '" + descr + "', 'fortran_order': False, 'shape': (2, 2), }";
    while ((10 + header.size() + 1) % 64 != 0)
    {
        header.push_back(' ');
    }
    header.push_back('\n');
    std::ofstream out(path, std::ios::binary);
    out.write("\x93NUMPY", 6);
    const unsigned char version[2] = {1, 0};
    out.write(reinterpret_cast<const char*>(version), 2);
    const unsigned char len[2] = {
        static_cast<unsigned char>(header.size() & 0xff),
        static_cast<unsigned char>((header.size() >> 8) & 0xff)
    };
    out.write(reinterpret_cast<const char*>(len), 2);
    out.write(header.data(), static_cast<std::streamsize>(header.size()));
    out.write(static_cast<const char*>(payload), static_cast<std::streamsize>(bytes));
}

int test_npy_round_trip_and_dtypes()
{
    int failures = 0;
    const std::filesystem::path dir = scratch_dir("npy");
    std::string error;

    const Field2D field(2, 3, std::vector<float>{1.5f, 0.0f, -2.0f, 30.0f, 255.0f, 7.25f});
    failures += expect_true(save_npy_field(dir / "nested" / "frame.npy", field, error), "save creates parents: " + error);

    Field2D loaded;
    failures += expect_true(load_npy_field(dir / "nested" / "frame.npy", loaded, error), "load float32: " + error);
    failures += expect_true(loaded == field, "float32 payload preserved");

    NpyArray2DShape shape;
    failures += expect_true(load_npy_2d_shape(dir / "nested" / "frame.npy", shape, error), "shape-only read");
    failures += expect_true(shape.rows == 2 && shape.cols == 3, "shape-only read values");

    // 8-bit radar composite as written by numpy
    const std::uint8_t u1[4] = {0, 10, 200, 255};
    write_raw_npy(dir / "composite.npy", "|u1", u1, sizeof(u1));
    Field2D composite;
    failures += expect_true(load_npy_field(dir / "composite.npy", composite, error), "load uint8: " + error);
    failures += expect_true(composite.rows() == 2 && composite.cols() == 2, "uint8 shape");
    if (composite.size() == 4)
    {
        failures += expect_close(composite(0, 1), 10.0, "uint8 widened");
        failures += expect_close(composite(1, 1), 255.0, "uint8 sentinel widened");
    }

    const double f8[4] = {0.5, -1.25, 42.0, 1.0e3};
    const std::uint16_t u2[4] = {0, 1, 4095, 65535};
    const std::int16_t i2[4] = {-32768, -5, 5, 32767};
    const std::int32_t i4[4] = {-100000, 0, 7, 100000};
    write_raw_npy(dir / "f8.npy", "<f8", f8, sizeof(f8));
    write_raw_npy(dir / "u2.npy", "<u2", u2, sizeof(u2));
    write_raw_npy(dir / "i2.npy", "<i2", i2, sizeof(i2));
    write_raw_npy(dir / "i4.npy", "<i4", i4, sizeof(i4));

    Field2D wide;
    failures += expect_true(load_npy_field(dir / "f8.npy", wide, error), "load float64: " + error);
    failures += expect_true(wide.size() == 4 && wide(0, 1) == -1.25f && wide(1, 1) == 1000.0f, "float64 narrowed");
    failures += expect_true(load_npy_field(dir / "u2.npy", wide, error), "load uint16: " + error);
    failures += expect_true(wide.size() == 4 && wide(1, 0) == 4095.0f && wide(1, 1) == 65535.0f, "uint16 widened");
    failures += expect_true(load_npy_field(dir / "i2.npy", wide, error), "load int16: " + error);
    failures += expect_true(wide.size() == 4 && wide(0, 0) == -32768.0f && wide(0, 1) == -5.0f, "int16 keeps sign");
    failures += expect_true(load_npy_field(dir / "i4.npy", wide, error), "load int32: " + error);
    failures += expect_true(wide.size() == 4 && wide(0, 0) == -100000.0f && wide(1, 1) == 100000.0f, "int32 widened");

    const float big_endian[4] = {1.0f, 2.0f, 3.0f, 4.0f};
    write_raw_npy(dir / "be.npy", ">f4", big_endian, sizeof(big_endian));
    error.clear();
    failures += expect_true(!load_npy_field(dir / "be.npy", wide, error), "big-endian payload rejected");
    write_raw_npy(dir / "c8.npy", "<c8", f8, sizeof(f8));
    failures += expect_true(!load_npy_field(dir / "c8.npy", wide, error), "complex payload rejected");

    {
        std::ofstream out(dir / "garbage.npy", std::ios::binary);
        out << "not an array";
    }
    error.clear();
    failures += expect_true(!load_npy_field(dir / "garbage.npy", composite, error), "garbage rejected");
    failures += expect_true(!error.empty(), "garbage error message");

    std::filesystem::remove_all(dir);
    return failures;
}

} // namespace

int main()
{
    int failures = 0;
    failures += test_grid_construction_and_queries();
    failures += test_input_preparation_guards();
    failures += test_grid_statistics();
    failures += test_npy_round_trip_and_dtypes();

    if (failures > 0)
    {
        std::cerr << "[field-grid-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[field-grid-regression] all checks passed" << std::endl;
    return 0;
}
