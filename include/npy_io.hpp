/**
 * @file npy_io.hpp
 * @brief Minimal NPY reader and writer for 2D raster frames.
 *
 * Reads little-endian C-order NumPy `.npy` payloads of dtype `float32`,
 * `float64`, `uint8` (8-bit reflectivity composites), `uint16`, `int16` or
 * `int32`, widened to float, and writes `float32`.
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "field2d.hpp"

namespace nowcast
{

/**
 * @brief In-memory representation of a 2D array payload, widened to float.
 */
struct NpyArray2D
{
    int rows = 0;
    int cols = 0;
    std::vector<float> data;
};

/**
 * @brief Shape metadata for a 2D NPY array.
 */
struct NpyArray2DShape
{
    int rows = 0;
    int cols = 0;
};

/**
 * @brief Load a full 2D NPY array from disk.
 * @param path Source file path.
 * @param out Destination array.
 * @param error Output message on failure.
 * @return `true` on success.
 */
bool load_npy_2d(const std::filesystem::path& path, NpyArray2D& out, std::string& error);

/**
 * @brief Read only the 2D shape metadata from a NPY file.
 */
bool load_npy_2d_shape(const std::filesystem::path& path, NpyArray2DShape& out, std::string& error);

/**
 * @brief Write a row-major float32 array as a version 1.0 NPY file.
 * @param path Destination; parent directories are created.
 * @param rows Row count.
 * @param cols Column count.
 * @param data Row-major values, rows*cols entries.
 * @param error Output message on failure.
 * @return `true` on success.
 */
bool save_npy_float32_2d(const std::filesystem::path& path,
                         int rows,
                         int cols,
                         const std::vector<float>& data,
                         std::string& error);

/**
 * @brief Load a NPY file straight into a Field2D.
 */
bool load_npy_field(const std::filesystem::path& path, Field2D& out, std::string& error);

/**
 * @brief Save a Field2D as a float32 NPY file.
 */
bool save_npy_field(const std::filesystem::path& path, const Field2D& field, std::string& error);

} // namespace nowcast
