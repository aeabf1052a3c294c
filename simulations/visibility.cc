/**
 * @file visibility.cc
 * @brief Hemisphere and detector bound masks over navigation positions
 */

#include "visibility.hpp"

Mask upper_hemisphere(const Eigen::MatrixXd &z) {
    return z.array() > HEMISPHERE_ATOL;
}

Mask upper_hemisphere(const std::vector<Vectors3d> &vectors) {
    Eigen::Index n = vectors.empty() ? 0 : vectors.front().rows();
    Mask upper(vectors.size(), n);
    for (size_t p = 0; p < vectors.size(); ++p) {
        upper.row(p) = vectors[p].col(2).transpose().array() > HEMISPHERE_ATOL;
    }
    return upper;
}

Mask within_gnomonic_bounds(const std::vector<Vectors3d> &vectors,
                            const EBSDDetector &detector) {
    Eigen::Index n = vectors.empty() ? 0 : vectors.front().rows();
    Mask inside(vectors.size(), n);
    for (size_t p = 0; p < vectors.size(); ++p) {
        size_t d = detector_position(detector, p);
        GnomonicBounds bounds = detector.gnomonic_bounds(d);
        double dx = detector.x_scale(d);
        double dy = detector.y_scale(d);
        for (Eigen::Index i = 0; i < n; ++i) {
            double z = vectors[p](i, 2);
            if (z <= HEMISPHERE_ATOL) {
                inside(p, i) = false;
                continue;
            }
            double x = vectors[p](i, 0) / z;
            double y = vectors[p](i, 1) / z;
            inside(p, i) = x >= bounds.x_min - dx && x <= bounds.x_max + dx
                           && y >= bounds.y_min - dy && y <= bounds.y_max + dy;
        }
    }
    return inside;
}

std::vector<bool> in_some_pattern(const Mask &in_pattern) {
    std::vector<bool> any(in_pattern.cols(), false);
    for (Eigen::Index i = 0; i < in_pattern.cols(); ++i) {
        any[i] = in_pattern.col(i).any();
    }
    return any;
}

Mask select_columns(const Mask &in_pattern, const std::vector<bool> &keep) {
    Eigen::Index n = 0;
    for (bool k : keep) n += k;
    Mask selected(in_pattern.rows(), n);
    Eigen::Index col = 0;
    for (Eigen::Index i = 0; i < in_pattern.cols(); ++i) {
        if (keep[i]) selected.col(col++) = in_pattern.col(i);
    }
    return selected;
}
