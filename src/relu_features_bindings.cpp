// C++ standard library
#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>

// Third-party libraries
#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

// Project headers
#include "aligned_alloc64.hpp"
#include "errors.hpp"
#include "feature_map.hpp"
#include "gamma_heuristics.hpp"
#include "relu_features.hpp"
#include "relu_weights.hpp"

namespace py = pybind11;

using dense_array = py::array_t<double, py::array::c_style | py::array::forcecast>;
using label_array = py::array_t<int, py::array::c_style | py::array::forcecast>;

static void check_2d(const py::array &X, const char *name) {
    if (X.ndim() != 2)
        throw std::invalid_argument(std::string(name) + " must be 2D (n_samples, n_features)");
}

// Wrap a 64-byte aligned (rows, cols) buffer in a NumPy array that owns it
static py::array_t<double> owned_matrix(double *ptr, std::size_t rows, std::size_t cols) {
    auto capsule = py::capsule(ptr, [](void *p) { rrf::aligned_free_64(p); });
    return py::array_t<double>(
        {static_cast<py::ssize_t>(rows), static_cast<py::ssize_t>(cols)},
        {static_cast<py::ssize_t>(cols * sizeof(double)),
         static_cast<py::ssize_t>(sizeof(double))},
        ptr, capsule);
}

// 'scale' | 'avg_ann' | 'avg_ann_50' | float
static rrf::GammaSelector to_selector(const py::object &gamma) {
    if (py::isinstance<py::str>(gamma))
        return rrf::parse_gamma(gamma.cast<std::string>());
    // bool is an int subclass in Python
    if (py::isinstance<py::bool_>(gamma))
        throw rrf::ConfigurationError("gamma must be 'scale', 'avg_ann', 'avg_ann_50' or a float, not a bool");
    if (py::isinstance<py::float_>(gamma) || py::isinstance<py::int_>(gamma))
        return rrf::explicit_gamma(gamma.cast<double>());
    throw rrf::ConfigurationError("gamma must be 'scale', 'avg_ann', 'avg_ann_50' or a float");
}

static const int *labels_ptr(const py::object &Y, std::size_t n, label_array &holder) {
    if (Y.is_none())
        return nullptr;
    holder = Y.cast<label_array>();
    if (holder.ndim() != 1 || static_cast<std::size_t>(holder.shape(0)) != n)
        throw std::invalid_argument("Y must be 1D with one label per row of X");
    return holder.data();
}

// ---- RandomReLUFeatures -----------------------------------------------------
//
// Keeps the raw keyword arguments and resolves them on fit(), so a bad gamma
// surfaces from fit() and leaves the instance unfit.
class PyRandomReLUFeatures {
  public:
    PyRandomReLUFeatures(py::object gamma, std::size_t n_components,
                         std::optional<std::uint64_t> random_state, bool fit_intercept)
        : gamma_(std::move(gamma)), n_components_(n_components),
          random_state_(random_state), fit_intercept_(fit_intercept) {}

    void fit(const dense_array &X, const py::object &Y) {
        check_2d(X, "X");
        const auto n = static_cast<std::size_t>(X.shape(0));
        const auto d = static_cast<std::size_t>(X.shape(1));

        rrf::FeatureMapConfig config;
        config.gamma = to_selector(gamma_);
        config.n_components = n_components_;
        config.random_state = random_state_;
        config.fit_intercept = fit_intercept_;

        label_array labels;
        const int *Yp = labels_ptr(Y, n, labels);

        // Unseeded maps keep advancing one engine across fits
        auto next = std::make_unique<rrf::RandomReLUFeatures>(config);
        if (random_state_) {
            next->fit(X.data(), n, d, Yp);
        } else {
            next->fit(X.data(), n, d, Yp, rng_);
        }
        map_ = std::move(next);
    }

    py::array_t<double> transform(const dense_array &X) const {
        check_2d(X, "X");
        const auto n = static_cast<std::size_t>(X.shape(0));
        const auto d = static_cast<std::size_t>(X.shape(1));
        const std::size_t D = fitted_map().fitted().n_components;

        double *Zptr = rrf::aligned_alloc_64(n * D);
        auto Z = owned_matrix(Zptr, n, D);
        map_->transform(X.data(), n, d, Zptr);
        return Z;
    }

    py::array_t<double> eval_x(const dense_array &X) const {
        check_2d(X, "X");
        const auto n = static_cast<std::size_t>(X.shape(0));
        const auto d = static_cast<std::size_t>(X.shape(1));
        const std::size_t len = fitted_map().feature_length();

        double *ptr = rrf::aligned_alloc_64(n * len);
        auto out = owned_matrix(ptr, n, len);
        map_->eval_x(X.data(), n, d, ptr);
        return out;
    }

    double gamma_value() const { return fitted_map().gamma(); }

    py::array_t<double> random_weights() const {
        const rrf::FittedFeatureMap &fm = fitted_map().fitted();
        py::array_t<double> W({static_cast<py::ssize_t>(fm.n_features + 1),
                                static_cast<py::ssize_t>(fm.n_components)});
        std::copy(fm.weights.begin(), fm.weights.end(), W.mutable_data());
        return W;
    }

    bool is_fitted() const { return map_ && map_->is_fitted(); }

    std::size_t len() const { return fitted_map().feature_length(); }

    py::object gamma() const { return gamma_; }
    std::size_t n_components() const { return n_components_; }
    std::optional<std::uint64_t> random_state() const { return random_state_; }
    bool fit_intercept() const { return fit_intercept_; }

  private:
    const rrf::RandomReLUFeatures &fitted_map() const {
        if (!is_fitted())
            throw rrf::NotFittedError(
                "This RandomReLUFeatures instance is not fitted yet; call fit() first");
        return *map_;
    }

    py::object gamma_;
    std::size_t n_components_;
    std::optional<std::uint64_t> random_state_;
    bool fit_intercept_;
    std::mt19937_64 rng_{std::random_device{}()};
    std::unique_ptr<rrf::RandomReLUFeatures> map_;
};

// ---- free functions ---------------------------------------------------------

static py::array_t<double> py_relu_features(const dense_array &X_arr, const dense_array &W_arr,
                                            double gamma) {
    check_2d(X_arr, "X");
    if (W_arr.ndim() != 2)
        throw std::invalid_argument("W must be 2D (d+1, D)");

    const auto N = static_cast<std::size_t>(X_arr.shape(0));
    const auto d = static_cast<std::size_t>(X_arr.shape(1));
    const auto D = static_cast<std::size_t>(W_arr.shape(1));

    if (static_cast<std::size_t>(W_arr.shape(0)) != d + 1)
        throw rrf::DimensionMismatchError("W.shape[0] must equal X.shape[1] + 1");

    double *Zptr = rrf::aligned_alloc_64(N * D);
    auto Z = owned_matrix(Zptr, N, D);
    rrf::relu::relu_features(X_arr.data(), W_arr.data(), gamma, N, d, D, Zptr);
    return Z;
}

static py::array_t<double> py_sample_relu_weights(std::size_t d, std::size_t n_components,
                                                  std::uint64_t seed) {
    std::mt19937_64 rng(seed);
    double *Wptr = rrf::aligned_alloc_64((d + 1) * n_components);
    auto W = owned_matrix(Wptr, d + 1, n_components);
    rrf::relu::sample_relu_weights(d, n_components, rng, Wptr);
    return W;
}

static double py_estimate_gamma(const dense_array &X, const py::object &gamma,
                                const py::object &Y) {
    check_2d(X, "X");
    const auto n = static_cast<std::size_t>(X.shape(0));
    const auto d = static_cast<std::size_t>(X.shape(1));
    label_array labels;
    const int *Yp = labels_ptr(Y, n, labels);
    return rrf::heuristics::estimate_gamma(to_selector(gamma), X.data(), Yp, n, d);
}

// ---- Module definition ------------------------------------------------------

PYBIND11_MODULE(randrelu, m) {
    m.doc() = "Random ReLU features approximating a Gaussian-like kernel via BLAS (row-major)";

    auto value_error = py::handle(PyExc_ValueError);
    py::register_exception<rrf::ConfigurationError>(m, "ConfigurationError", value_error);
    py::register_exception<rrf::PreconditionViolation>(m, "PreconditionViolation", value_error);
    py::register_exception<rrf::DimensionMismatchError>(m, "DimensionMismatchError", value_error);
    py::register_exception<rrf::NotFittedError>(m, "NotFittedError", PyExc_RuntimeError);

    py::class_<PyRandomReLUFeatures>(m, "RandomReLUFeatures", R"doc(
ReLU features  max(w^T (1/gamma, x), 0)  with w uniform on the unit sphere.

Parameters
----------
gamma : {'scale', 'avg_ann', 'avg_ann_50'} or float, default='avg_ann_50'
    Heuristic (or value) for the kernel scale. 'avg_ann' needs Y in fit().
n_components : int, default=300
    Dimensionality of the mapped feature space.
random_state : int or None, default=None
    Seed for the random weights.
fit_intercept : bool, default=True
    Prepend a column of ones in eval_x().
)doc")
        .def(py::init<py::object, std::size_t, std::optional<std::uint64_t>, bool>(),
             py::arg("gamma") = py::str("avg_ann_50"),
             py::arg("n_components") = rrf::DEFAULT_N_COMPONENTS,
             py::arg("random_state") = py::none(), py::arg("fit_intercept") = true)
        .def(
            "fit",
            [](py::object self, const dense_array &X, const py::object &Y) {
                self.cast<PyRandomReLUFeatures &>().fit(X, Y);
                return self;
            },
            py::arg("X"), py::arg("Y") = py::none(),
            "Estimate gamma and draw the random weights. Returns self.")
        .def("transform", &PyRandomReLUFeatures::transform, py::arg("X"),
             "Map X (n, d) to the (n, n_components) ReLU features.")
        .def("eval_x", &PyRandomReLUFeatures::eval_x, py::arg("X"),
             "transform(X) with a leading column of ones when fit_intercept is set.")
        .def_property_readonly("gamma_", &PyRandomReLUFeatures::gamma_value)
        .def_property_readonly("random_weights_", &PyRandomReLUFeatures::random_weights)
        .def_property_readonly("is_fitted_", &PyRandomReLUFeatures::is_fitted)
        .def_property_readonly("len_", &PyRandomReLUFeatures::len)
        .def_property_readonly("gamma", &PyRandomReLUFeatures::gamma)
        .def_property_readonly("n_components", &PyRandomReLUFeatures::n_components)
        .def_property_readonly("random_state", &PyRandomReLUFeatures::random_state)
        .def_property_readonly("fit_intercept", &PyRandomReLUFeatures::fit_intercept);

    m.def("relu_features", &py_relu_features, py::arg("X"), py::arg("W"), py::arg("gamma"),
          R"doc(
Compute random ReLU features.

Z = max(0, [1/gamma, X] @ W)

Parameters
----------
X : ndarray, shape (N, d)
W : ndarray, shape (d+1, D)
gamma : float > 0

Returns
-------
Z : ndarray, shape (N, D)
)doc");
    m.def("sample_relu_weights", &py_sample_relu_weights, py::arg("d"),
          py::arg("n_components"), py::arg("seed"),
          "Draw a (d+1, n_components) matrix with unit-norm Gaussian columns.");
    m.def("estimate_gamma", &py_estimate_gamma, py::arg("X"),
          py::arg("gamma") = py::str("avg_ann_50"), py::arg("Y") = py::none(),
          "Evaluate one gamma heuristic on X (and Y for 'avg_ann').");
    m.def("neighbour_count", &rrf::heuristics::neighbour_count, py::arg("n"),
          py::arg("k_max") = rrf::DEFAULT_NEIGHBOUR_RANK,
          "Neighbour rank used by 'avg_ann_50' for n samples.");
}
