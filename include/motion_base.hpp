#pragma once

#include <memory>
#include <string>
#include <vector>

#include "field2d.hpp"
#include "field_grid.hpp"

/*This header file contains the base classes and structures for the motion module.
The motion module estimates a dense displacement field between two aligned
reflectivity grids. The matching scheme is chosen by the user in the configuration file.
Estimation is robust to growth and decay of echo intensity.*/

namespace nowcast
{

/*Motion module configuration*/
struct MotionConfig
{
    std::string scheme_id = "block_match";     // "block_match" or "global_translation"
    int pyramid_levels = 3;                    // coarse-to-fine levels (capped by grid size)
    int block_size = 16;                       // matching block edge [cells at each level]
    int search_radius = 3;                     // displacement search half-width [cells at each level]
    std::string smoothing_filter = "box";      // "box" or "recursive_gaussian"
    int smoothing_kernel = 3;                  // smoothing width on the block grid [blocks]
    float signal_threshold = 5.0f;             // echo threshold; weaker cells do not drive matching
    double min_valid_fraction = 0.005;         // below this jointly-valid fraction: zero motion
    double min_overlap_fraction = 0.5;         // minimum overlap of a candidate with its block
    double min_correlation = 0.3;              // minimum ZNCC for a block estimate to be kept
    double displacement_penalty = 0.01;        // quadratic penalty on distance from the guess
    double outlier_threshold = 2.0;            // vector-median rejection distance [cells]
    bool subpixel = true;                      // parabolic sub-cell refinement at the finest level
    std::string fill_mode = "interpolate";     // "interpolate" or "zero"
};

/**
 * @brief Dense motion field in cells per second.
 *
 * `u` points along increasing column index, `v` along increasing row index.
 * `valid` flags cells whose vector comes from a direct estimate rather than
 * gap filling.
 */
struct MotionField
{
    int rows = 0;
    int cols = 0;
    Field2D u;
    Field2D v;
    Mask2D valid;
    bool low_confidence = true;
    double valid_fraction = 0.0;   // jointly-valid pixel fraction seen by the estimator
    double quality = 0.0;          // matching quality in [0, 1]
    double interval_s = 0.0;       // frame interval the field was estimated over

    /**
     * @brief Builds an all-zero (persistence) field.
     */
    static MotionField zero(int rows, int cols, double interval_s = 0.0);

    /**
     * @brief Returns a copy with every vector multiplied by `factor`.
     */
    MotionField scaled(double factor) const;

    bool same_shape(int r, int c) const { return rows == r && cols == c; }

    double max_speed_cells_per_s() const;
    double mean_speed_cells_per_s() const;
    double direct_fraction() const;
};

/**
 * @brief Displacement estimate in cells over one frame interval.
 */
struct DisplacementEstimate
{
    Field2D dx;            // column displacement [cells]
    Field2D dy;            // row displacement [cells]
    Mask2D direct;         // cells covered by a direct block estimate
    double quality = 0.0;  // mean correlation of kept blocks times their coverage
    bool any_valid = false;
};

/*Abstract base class for motion schemes*/
class MotionSchemeBase
{
public:
    virtual ~MotionSchemeBase() = default;

    virtual std::string name() const = 0;

    //Estimate the displacement carrying `prev` onto `curr`
    virtual DisplacementEstimate estimate_displacement(
        const FieldGrid& prev,
        const FieldGrid& curr,
        const MotionConfig& cfg) const = 0;
};

/**
 * @brief Fraction of cells with data in both grids and echo in at least one.
 */
double jointly_valid_fraction(const FieldGrid& prev, const FieldGrid& curr, float signal_threshold);

/**
 * @brief Estimates the motion field between two aligned grids.
 *
 * Throws ConfigurationError on geometry mismatch or a non-increasing
 * timestamp pair. Sparse echo never throws: the result is the zero field
 * flagged low-confidence.
 */
MotionField estimate_motion(const FieldGrid& prev, const FieldGrid& curr, const MotionConfig& cfg);

// Factory and lookup functions (names match ignoring case and separators)
std::unique_ptr<MotionSchemeBase> create_motion_scheme(const std::string& scheme_name);
std::vector<std::string> get_available_motion_schemes();

} // namespace nowcast
