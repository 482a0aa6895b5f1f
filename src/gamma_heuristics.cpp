// C++ standard library
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// Project headers
#include "distances.hpp"
#include "errors.hpp"
#include "gamma_heuristics.hpp"
#include "log.hpp"

namespace rrf {

GammaSelector parse_gamma(std::string_view name) {
    if (name == "scale")
        return FixedScale{};
    if (name == "avg_ann")
        return ClassMedian{};
    if (name == "avg_ann_50")
        return NeighbourBased{DEFAULT_NEIGHBOUR_RANK};
    throw ConfigurationError("Unexpected value for gamma: '" + std::string(name) +
                             "' (expected 'scale', 'avg_ann', 'avg_ann_50' or a float)");
}

GammaSelector explicit_gamma(double value) {
    if (!std::isfinite(value) || !(value > 0.0)) {
        std::ostringstream msg;
        msg << "gamma must be a finite value > 0, got " << value;
        throw ConfigurationError(msg.str());
    }
    return Explicit{value};
}

std::string selector_name(const GammaSelector &selector) {
    if (std::holds_alternative<FixedScale>(selector))
        return "scale";
    if (std::holds_alternative<ClassMedian>(selector))
        return "avg_ann";
    if (const auto *nb = std::get_if<NeighbourBased>(&selector))
        return "avg_ann_" + std::to_string(nb->k_max);
    std::ostringstream out;
    out << std::get<Explicit>(selector).value;
    return out.str();
}

namespace heuristics {

// gamma must come out finite and > 0, whatever the heuristic
static double checked_gamma(double gamma, const char *heuristic) {
    if (!std::isfinite(gamma) || !(gamma > 0.0)) {
        std::ostringstream msg;
        msg << heuristic << ": degenerate gamma (" << gamma << ")";
        throw ConfigurationError(msg.str());
    }
    return gamma;
}

static double gamma_from_sigma(double sigma, const char *heuristic) {
    if (!(sigma > 0.0)) {
        std::ostringstream msg;
        msg << heuristic << ": sigma is " << sigma << ", gamma would be undefined";
        throw ConfigurationError(msg.str());
    }
    return checked_gamma(1.0 / (2.0 * sigma * sigma), heuristic);
}

// Median of v (reordered in place); mean of the two middle values when
// the count is even.
static double median_inplace(std::vector<double> &v) {
    const std::size_t m = v.size();
    const std::size_t mid = m / 2;
    std::nth_element(v.begin(), v.begin() + mid, v.end());
    const double upper = v[mid];
    if (m % 2 == 1)
        return upper;
    const double lower = *std::max_element(v.begin(), v.begin() + mid);
    return 0.5 * (lower + upper);
}

double gamma_scale(const double *X, std::size_t n, std::size_t d) {
    if (!X)
        throw std::invalid_argument("gamma_scale: null pointer");
    if (n == 0 || d == 0)
        throw std::invalid_argument("gamma_scale: zero dimension");

    const std::size_t total = n * d;

    // Serial sums, so gamma is bit-identical whatever OMP_NUM_THREADS is
    double sum = 0.0;
    for (std::size_t i = 0; i < total; ++i)
        sum += X[i];
    const double mean = sum / static_cast<double>(total);

    double ss = 0.0;
    for (std::size_t i = 0; i < total; ++i) {
        const double c = X[i] - mean;
        ss += c * c;
    }
    const double var = ss / static_cast<double>(total);

    if (!(var > 0.0))
        throw ConfigurationError("gamma_scale: variance of X is zero (constant data)");

    return checked_gamma(1.0 / (static_cast<double>(d) * var), "gamma_scale");
}

double gamma_class_median(const double *X, const int *Y, std::size_t n, std::size_t d) {
    if (!X)
        throw std::invalid_argument("gamma_class_median: null pointer");
    if (!Y)
        throw ConfigurationError("gamma_class_median: labels are required for gamma='avg_ann'");
    if (n == 0 || d == 0)
        throw std::invalid_argument("gamma_class_median: zero dimension");

    if (*std::min_element(Y, Y + n) < 0)
        throw PreconditionViolation("gamma_class_median: labels must be non-negative");
    // n samples hold at most n distinct labels, so a larger label leaves a gap
    const std::size_t max_label = static_cast<std::size_t>(*std::max_element(Y, Y + n));
    if (max_label >= n)
        throw PreconditionViolation("gamma_class_median: label " + std::to_string(max_label) +
                                    " exceeds the sample count; labels must be contiguous from 0");
    const std::size_t n_classes = max_label + 1;

    std::vector<std::size_t> class_sizes(n_classes, 0);
    for (std::size_t i = 0; i < n; ++i)
        ++class_sizes[static_cast<std::size_t>(Y[i])];
    for (std::size_t c = 0; c < n_classes; ++c) {
        if (class_sizes[c] == 0)
            throw PreconditionViolation("gamma_class_median: class " + std::to_string(c) +
                                        " has no samples (labels must be contiguous from 0)");
        if (class_sizes[c] == n)
            throw PreconditionViolation("gamma_class_median: class " + std::to_string(c) +
                                        " has no out-of-class points");
    }

    std::vector<double> class_medians(n_classes);
    std::vector<double> in_class, out_class;

    for (std::size_t c = 0; c < n_classes; ++c) {
        // Split rows into class c and everything else
        in_class.clear();
        out_class.clear();
        for (std::size_t i = 0; i < n; ++i) {
            std::vector<double> &dst = (Y[i] == static_cast<int>(c)) ? in_class : out_class;
            dst.insert(dst.end(), X + i * d, X + (i + 1) * d);
        }
        const std::size_t n_in = class_sizes[c];
        const std::size_t n_out = n - n_in;

        std::vector<double> min_dist(n_in);
        dist::min_cross_distances(in_class.data(), out_class.data(), n_in, n_out, d,
                                  min_dist.data());
        class_medians[c] = median_inplace(min_dist);
    }

    const double sigma = std::accumulate(class_medians.begin(), class_medians.end(), 0.0) /
                         static_cast<double>(n_classes);
    RRF_LOG("avg_ann: classes=%zu sigma=%g", n_classes, sigma);

    return gamma_from_sigma(sigma, "gamma_class_median");
}

std::size_t neighbour_count(std::size_t n, std::size_t k_max) {
    if (n < 3)
        throw PreconditionViolation("neighbour heuristic needs at least 3 samples, got " +
                                    std::to_string(n));
    return n >= k_max ? k_max : n - 2;
}

double gamma_nearest_neighbour(const double *X, std::size_t n, std::size_t d,
                               std::size_t k_max) {
    if (!X)
        throw std::invalid_argument("gamma_nearest_neighbour: null pointer");
    if (d == 0)
        throw std::invalid_argument("gamma_nearest_neighbour: zero dimension");
    if (k_max == 0)
        throw ConfigurationError("gamma_nearest_neighbour: neighbour rank must be > 0");

    const std::size_t k = neighbour_count(n, k_max);
    // k + 1 neighbours including the point itself
    if (k >= n)
        throw PreconditionViolation("gamma_nearest_neighbour: " + std::to_string(k + 1) +
                                    " neighbours requested but only " + std::to_string(n) +
                                    " samples");

    std::vector<double> kth(n);
    dist::kth_neighbour_distances(X, n, d, k, kth.data());

    const double sigma = std::accumulate(kth.begin(), kth.end(), 0.0) / static_cast<double>(n);
    RRF_LOG("avg_ann_%zu: n=%zu k=%zu sigma=%g", k_max, n, k, sigma);

    return gamma_from_sigma(sigma, "gamma_nearest_neighbour");
}

double estimate_gamma(const GammaSelector &selector, const double *X, const int *Y,
                      std::size_t n, std::size_t d) {
    double gamma;
    if (std::holds_alternative<FixedScale>(selector)) {
        gamma = gamma_scale(X, n, d);
    } else if (std::holds_alternative<ClassMedian>(selector)) {
        gamma = gamma_class_median(X, Y, n, d);
    } else if (const auto *nb = std::get_if<NeighbourBased>(&selector)) {
        gamma = gamma_nearest_neighbour(X, n, d, nb->k_max);
    } else {
        gamma = checked_gamma(std::get<Explicit>(selector).value, "explicit gamma");
    }
    RRF_LOG("gamma[%s] = %g", selector_name(selector).c_str(), gamma);
    return gamma;
}

}  // namespace heuristics
}  // namespace rrf
