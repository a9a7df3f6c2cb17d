#pragma once

#include <span>
#include <vector>

namespace tuning {

// Least-squares polynomial x = p(y).
// The abscissa is centered and scaled before fitting so that outputs in the
// GHz range do not blow up the Vandermonde matrix.
class PolynomialFit {
public:
    // Fit a polynomial of the given degree through (abscissa[i], ordinate[i]).
    // Requires equally sized, non-empty inputs and degree >= 0.
    static PolynomialFit fit(std::span<double const> abscissa, std::span<double const> ordinate,
                             int degree);

    double operator()(double at) const;

    // Coefficients in the scaled domain, lowest order first
    std::vector<double> const& coefficients() const { return coeffs_; }
    int degree() const { return static_cast<int>(coeffs_.size()) - 1; }

    // Evenly spaced samples of the fit across [from, to]
    void sample(double from, double to, int count, std::vector<double>& at,
                std::vector<double>& values) const;

private:
    std::vector<double> coeffs_;
    double center_ = 0.0;
    double scale_ = 1.0;
};

} // namespace tuning
