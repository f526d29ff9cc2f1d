#ifndef DOCSCAN_DETECTOR_CONFIG_HPP
#define DOCSCAN_DETECTOR_CONFIG_HPP

// Tuning for one detection pipeline. Backend- or device-specific tuning is
// expressed by passing a different DetectorConfig, not by a different pipeline.
struct DetectorConfig {
    // Bumped whenever a default below changes meaning or value
    static const int kConfigVersion = 1;

    // Preprocessing
    double clahe_clip_limit;
    int clahe_tile_size;
    int blur_kernel_size;       // odd, 3..5
    int processing_width;       // 0 = detect at native resolution

    // Canny pass
    double canny_sigma;
    double canny_low_floor;
    double canny_high_floor;
    int close_kernel_size;

    // Adaptive-threshold fallback pass
    bool enable_fallback_pass;
    int adaptive_block_size;
    double adaptive_c;

    // Contour filtering
    double min_contour_area;        // absolute floor, px^2
    double min_contour_area_ratio;  // of frame area
    double max_contour_area_ratio;  // of frame area
    double approx_epsilon;          // of perimeter
    double approx_epsilon_relaxed;
    double min_quad_rectangularity;
    double min_box_rectangularity;  // rotated-box fallback
    double min_edge_length;         // absolute floor, px
    double min_edge_ratio;          // of the frame's short side
    double min_edge_aspect;
    double max_edge_aspect;

    // Sub-pixel refinement
    bool enable_corner_refinement;
    int refine_window_size;
    int refine_max_iterations;
    double refine_epsilon;

    DetectorConfig() {
        clahe_clip_limit = 2.5;
        clahe_tile_size = 8;
        blur_kernel_size = 5;
        processing_width = 0;

        canny_sigma = 0.33;
        canny_low_floor = 50.0;
        canny_high_floor = 150.0;
        close_kernel_size = 3;

        enable_fallback_pass = true;
        adaptive_block_size = 15;
        adaptive_c = 2.0;

        min_contour_area = 350.0;
        min_contour_area_ratio = 0.02;
        max_contour_area_ratio = 0.85;
        approx_epsilon = 0.01;
        approx_epsilon_relaxed = 0.02;
        min_quad_rectangularity = 0.7;
        min_box_rectangularity = 0.5;
        min_edge_length = 60.0;
        min_edge_ratio = 0.08;
        min_edge_aspect = 0.45;
        max_edge_aspect = 2.8;

        enable_corner_refinement = true;
        refine_window_size = 11;
        refine_max_iterations = 40;
        refine_epsilon = 0.001;
    }
};

// Policy constants for the GOOD / BAD_ANGLE / TOO_FAR verdict
struct QualityConfig {
    // Image space, absolute pixels
    double image_max_edge_misalignment;
    double image_edge_margin;

    // View space, ratios
    double view_min_area_ratio;
    double view_max_area_ratio;
    double view_max_skew_ratio;
    double view_min_opposite_edge_ratio;
    double view_max_opposite_edge_ratio;

    QualityConfig() {
        image_max_edge_misalignment = 100.0;
        image_edge_margin = 150.0;

        view_min_area_ratio = 0.06;
        view_max_area_ratio = 0.95;
        view_max_skew_ratio = 0.3;
        view_min_opposite_edge_ratio = 0.33;
        view_max_opposite_edge_ratio = 3.0;
    }
};

#endif // DOCSCAN_DETECTOR_CONFIG_HPP
