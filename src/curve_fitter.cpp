#include "curve_fitter.hpp"
#include "util.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <stdexcept>

namespace {

int find_span(const std::vector<double>& t, int n_basis, int k, double u){
    // last span is closed so that u == 1 evaluates the end point
    if (u >= t[n_basis]) return n_basis - 1;
    auto it = std::upper_bound(t.begin() + k, t.begin() + n_basis, u);
    int s = (int)(it - t.begin()) - 1;
    return std::max(k, std::min(s, n_basis - 1));
}

// non-zero basis values N[s-k..s] at u (Cox-de Boor)
void basis_functions(const std::vector<double>& t, int s, int k, double u, std::vector<double>& N){
    std::vector<double> left(k + 1), right(k + 1);
    N.assign(k + 1, 0.0);
    N[0] = 1.0;
    for (int j = 1; j <= k; ++j){
        left[j] = u - t[s + 1 - j];
        right[j] = t[s + j] - u;
        double saved = 0.0;
        for (int r = 0; r < j; ++r){
            double denom = right[r + 1] + left[j - r];
            double temp = denom == 0.0 ? 0.0 : N[r] / denom;
            N[r] = saved + right[r + 1] * temp;
            saved = left[j - r] * temp;
        }
        N[j] = saved;
    }
}

}

std::vector<double> chord_length_parameters(const PointList& points){
    std::vector<double> u(points.size(), 0.0);
    for (size_t i = 1; i < points.size(); ++i)
        u[i] = u[i-1] + distance_between(points[i].x, points[i].y, points[i-1].x, points[i-1].y);
    double total = u.empty() ? 0.0 : u.back();
    if (total <= 0.0) throw std::invalid_argument("curve points have zero total length");
    for (auto& v : u) v /= total;
    u.back() = 1.0;
    return u;
}

std::vector<double> interpolation_knots(const std::vector<double>& u, int k){
    int m = (int)u.size();
    std::vector<double> t(m + k + 1);
    for (int i = 0; i <= k; ++i){
        t[i] = u.front();
        t[m + i] = u.back();
    }
    for (int l = 0; l < m - k - 1; ++l){
        if (k % 2 == 0) t[k + 1 + l] = (u[l + k/2] + u[l + k/2 + 1]) / 2;
        else t[k + 1 + l] = u[l + (k + 1)/2];
    }
    return t;
}

BSplineFitter::BSplineFitter(int degree): degree_(degree) {
    if (degree_ < 1) throw std::invalid_argument("spline degree must be at least 1");
}

std::vector<CurveSample> BSplineFitter::fit(const PointList& points, int samples){
    const int k = degree_;
    const int m = (int)points.size();
    if (m <= k) throw std::invalid_argument("need more than " + std::to_string(k) + " points for this spline degree");
    if (samples < 2) throw std::invalid_argument("need at least 2 curve samples");

    std::vector<double> u = chord_length_parameters(points);
    std::vector<double> t = interpolation_knots(u, k);

    Eigen::MatrixXd A = Eigen::MatrixXd::Zero(m, m);
    Eigen::MatrixXd rhs(m, 2);
    std::vector<double> N;
    for (int i = 0; i < m; ++i){
        int s = find_span(t, m, k, u[i]);
        basis_functions(t, s, k, u[i], N);
        for (int r = 0; r <= k; ++r) A(i, s - k + r) = N[r];
        rhs(i, 0) = points[i].x;
        rhs(i, 1) = points[i].y;
    }
    Eigen::MatrixXd ctrl = A.colPivHouseholderQr().solve(rhs);
    if (!ctrl.allFinite()) throw std::runtime_error("spline collocation system is singular");

    std::vector<CurveSample> out; out.reserve(samples);
    for (int j = 0; j < samples; ++j){
        double v = (double)j / (samples - 1);
        int s = find_span(t, m, k, v);
        basis_functions(t, s, k, v, N);
        CurveSample c{0.0, 0.0};
        for (int r = 0; r <= k; ++r){
            c.x += N[r] * ctrl(s - k + r, 0);
            c.y += N[r] * ctrl(s - k + r, 1);
        }
        out.push_back(c);
    }
    return out;
}
