#include "tuning/least_squares.h"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace tuning {

PolynomialFit PolynomialFit::fit(std::span<double const> abscissa,
                                 std::span<double const> ordinate, int degree) {
    if (abscissa.size() != ordinate.size() || abscissa.empty()) {
        throw std::invalid_argument("PolynomialFit needs equally sized, non-empty samples");
    }
    if (degree < 0) {
        throw std::invalid_argument("PolynomialFit degree must be non-negative");
    }

    PolynomialFit result;
    auto const n = static_cast<Eigen::Index>(abscissa.size());

    result.center_ = std::accumulate(abscissa.begin(), abscissa.end(), 0.0) /
                     static_cast<double>(abscissa.size());
    double spread = 0.0;
    for (double a : abscissa) {
        spread = std::max(spread, std::abs(a - result.center_));
    }
    result.scale_ = spread > 0.0 ? spread : 1.0;

    // Vandermonde matrix in the normalized domain
    Eigen::MatrixXd vander(n, degree + 1);
    Eigen::VectorXd rhs(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        double t = (abscissa[i] - result.center_) / result.scale_;
        double power = 1.0;
        for (int k = 0; k <= degree; ++k) {
            vander(i, k) = power;
            power *= t;
        }
        rhs(i) = ordinate[i];
    }

    Eigen::VectorXd solution = vander.colPivHouseholderQr().solve(rhs);
    result.coeffs_.assign(solution.data(), solution.data() + solution.size());
    return result;
}

double PolynomialFit::operator()(double at) const {
    double t = (at - center_) / scale_;
    // Horner
    double value = 0.0;
    for (auto it = coeffs_.rbegin(); it != coeffs_.rend(); ++it) {
        value = value * t + *it;
    }
    return value;
}

void PolynomialFit::sample(double from, double to, int count, std::vector<double>& at,
                           std::vector<double>& values) const {
    at.clear();
    values.clear();
    if (count <= 0) {
        return;
    }
    at.reserve(count);
    values.reserve(count);
    for (int i = 0; i < count; ++i) {
        double t = count == 1 ? 0.0 : static_cast<double>(i) / (count - 1);
        double a = from + t * (to - from);
        at.push_back(a);
        values.push_back((*this)(a));
    }
}

} // namespace tuning
