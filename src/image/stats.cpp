#include "astro_compute/image/stats.hpp"

#include <algorithm>
#include <limits>
#include <vector>

namespace astro_compute::image {

namespace {

constexpr double kMadToSigma = 1.4826;

double exact_median(std::vector<double>& v) {
    if (v.empty()) return 0.0;
    const size_t n = v.size();
    const size_t mid = n / 2;
    std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid), v.end());
    const double hi = v[mid];
    if ((n % 2) == 1) return hi;
    const double lo = *std::max_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid));
    return 0.5 * (lo + hi);
}

} // namespace

ImageStats compute_image_stats(const Matrix2Df& data) {
    std::vector<double> valid;
    valid.reserve(static_cast<size_t>(data.size()));

    double vmin = std::numeric_limits<double>::max();
    double vmax = std::numeric_limits<double>::lowest();
    double sum = 0.0;
    for (Eigen::Index i = 0; i < data.size(); ++i) {
        const float v = data.data()[i];
        if (!is_valid_pixel(v)) continue;
        const double vd = static_cast<double>(v);
        valid.push_back(vd);
        vmin = std::min(vmin, vd);
        vmax = std::max(vmax, vd);
        sum += vd;
    }

    ImageStats st;
    if (valid.empty()) {
        return st;
    }

    st.valid_count = static_cast<uint64_t>(valid.size());
    st.min = vmin;
    st.max = vmax;
    st.mean = sum / static_cast<double>(valid.size());
    st.median = exact_median(valid);

    for (double& x : valid) x = std::fabs(x - st.median);
    st.mad = exact_median(valid);
    st.sigma = std::max(st.mad * kMadToSigma, 1e-30);

    return st;
}

} // namespace astro_compute::image
