#include "astro_compute/registration/alignment.hpp"
#include "astro_compute/compute/dispatcher.hpp"
#include "astro_compute/core/errors.hpp"
#include "astro_compute/registration/correlation.hpp"

#include <opencv2/opencv.hpp>

#include <cstring>
#include <iostream>
#include <vector>

namespace astro_compute::registration {

Matrix2Df shift_image(const Matrix2Df& img, int dx, int dy) {
    if (img.size() == 0 || (dx == 0 && dy == 0)) {
        return img;
    }

    cv::Mat cv_img(static_cast<int>(img.rows()), static_cast<int>(img.cols()), CV_32F,
                   const_cast<float*>(img.data()));
    cv::Mat warp_matrix = (cv::Mat_<float>(2, 3) << 1.0f, 0.0f, static_cast<float>(dx),
                                                    0.0f, 1.0f, static_cast<float>(dy));

    cv::Mat shifted;
    cv::warpAffine(cv_img, shifted, warp_matrix, cv_img.size(), cv::INTER_NEAREST,
                   cv::BORDER_CONSTANT, cv::Scalar(0.0));

    Matrix2Df result(img.rows(), img.cols());
    std::memcpy(result.data(), shifted.data, img.size() * sizeof(float));
    return result;
}

Matrix2Df downsample_2x(const Matrix2Df& img) {
    const Eigen::Index rows = img.rows() / 2;
    const Eigen::Index cols = img.cols() / 2;
    Matrix2Df out(rows, cols);
    for (Eigen::Index r = 0; r < rows; ++r) {
        for (Eigen::Index c = 0; c < cols; ++c) {
            const float a = img(2 * r, 2 * c);
            const float b = img(2 * r, 2 * c + 1);
            const float d = img(2 * r + 1, 2 * c);
            const float e = img(2 * r + 1, 2 * c + 1);
            out(r, c) = (a + b + d + e) * 0.25f;
        }
    }
    return out;
}

namespace {

struct Level {
    Matrix2Df ref;
    Matrix2Df tgt;
    int radius = 0;
};

// Search `radius` around (cx, cy) by pre-shifting the target onto the centre
OffsetMatch search_around(compute::ComputeDispatcher& dispatcher, const Matrix2Df& ref,
                          const Matrix2Df& tgt, int cx, int cy, int radius) {
    const Roi roi = centered_roi(static_cast<uint32_t>(ref.cols()),
                                 static_cast<uint32_t>(ref.rows()));
    const Matrix2Df centred = shift_image(tgt, -cx, -cy);
    OffsetMatch match = dispatcher.find_offset(ref, centred, roi, radius);
    match.dx += cx;
    match.dy += cy;
    return match;
}

} // namespace

OffsetMatch find_offset_pyramid(compute::ComputeDispatcher& dispatcher,
                                const Matrix2Df& ref, const Matrix2Df& tgt,
                                const config::CorrelationConfig& cfg) {
    if (ref.size() == 0 || tgt.size() == 0) {
        throw ValidationError("offset search needs non-empty images");
    }

    if (!cfg.pyramid.enabled) {
        return search_around(dispatcher, ref, tgt, 0, 0, cfg.max_shift);
    }

    std::vector<Level> levels(3);
    levels[2] = {ref, tgt, cfg.pyramid.fine_max_shift};
    levels[1] = {downsample_2x(ref), downsample_2x(tgt), cfg.pyramid.mid_max_shift};
    levels[0] = {downsample_2x(levels[1].ref), downsample_2x(levels[1].tgt),
                 cfg.pyramid.coarse_max_shift};

    int cx = 0;
    int cy = 0;
    OffsetMatch match;
    for (const Level& level : levels) {
        cx *= 2;
        cy *= 2;
        if (level.ref.size() == 0 || level.tgt.size() == 0) {
            continue;
        }

        match = search_around(dispatcher, level.ref, level.tgt, cx, cy, level.radius);
        if (match.has_match()) {
            cx = match.dx;
            cy = match.dy;
        } else {
            std::cerr << "[REG] No usable score at " << level.ref.cols() << "x"
                      << level.ref.rows() << ", keeping estimate (" << cx << ", " << cy << ")"
                      << std::endl;
        }
    }

    match.dx = cx;
    match.dy = cy;
    return match;
}

AlignmentResult align_to_reference(compute::ComputeDispatcher& dispatcher,
                                   const Matrix2Df& ref, const Matrix2Df& tgt,
                                   const config::CorrelationConfig& cfg) {
    AlignmentResult result;
    result.offset = find_offset_pyramid(dispatcher, ref, tgt, cfg);
    result.aligned = shift_image(tgt, -result.offset.dx, -result.offset.dy);
    return result;
}

} // namespace astro_compute::registration
