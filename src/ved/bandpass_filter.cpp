#include "ved/bandpass_filter.hpp"
#include <opencv2/core.hpp>
#include <algorithm>
#include <complex>
#include <cmath>
#include <cstdio>

namespace ved {

using cplx = std::complex<double>;

static std::vector<cplx> poly_from_roots(const std::vector<cplx>& roots) {
    std::vector<cplx> c(1, cplx(1.0, 0.0));
    for (const auto& r : roots) {
        c.push_back(cplx(0.0, 0.0));
        for (size_t i = c.size() - 1; i > 0; --i) c[i] -= r * c[i-1];
    }
    return c;
}

BandpassFilter::BandpassFilter(const FilterConfig& cfg) : cfg_(cfg) {
    valid_ = design() && compute_zi();
}

bool BandpassFilter::design() {
    const double nyq = 0.5 * cfg_.sample_rate_hz;
    if (cfg_.order < 1 || !(cfg_.sample_rate_hz > 0.0)) return false;
    if (!(cfg_.low_hz > 0.0) || cfg_.low_hz >= cfg_.high_hz || cfg_.high_hz >= nyq) return false;

    const int N = cfg_.order;

    // 1) Analog ön bükme (fs=2 normalize bilineer)
    const double fs2 = 4.0;
    const double w0  = fs2 * std::tan(M_PI * (cfg_.low_hz  / nyq) / 2.0);
    const double w1  = fs2 * std::tan(M_PI * (cfg_.high_hz / nyq) / 2.0);
    const double bw  = w1 - w0;
    const double wo  = std::sqrt(w0 * w1);

    // 2) Butterworth alçak geçiren prototip kutupları
    std::vector<cplx> p_lp;
    for (int m = -N + 1; m < N; m += 2)
        p_lp.push_back(-std::exp(cplx(0.0, M_PI * m / (2.0 * N))) * (bw / 2.0));

    // 3) lp -> bp: her kutup iki kutba ayrılır, N sıfır orijine gelir
    std::vector<cplx> p_bp;
    p_bp.reserve(2 * N);
    for (const auto& p : p_lp) p_bp.push_back(p + std::sqrt(p*p - wo*wo));
    for (const auto& p : p_lp) p_bp.push_back(p - std::sqrt(p*p - wo*wo));
    const double k_bp = std::pow(bw, N);

    // 4) Bilineer dönüşüm
    std::vector<cplx> z_d, p_d;
    cplx den(1.0, 0.0);
    for (const auto& p : p_bp) {
        p_d.push_back((fs2 + p) / (fs2 - p));
        den *= (fs2 - p);
    }
    for (int i = 0; i < N; ++i) z_d.push_back(cplx( 1.0, 0.0));   // s=0 sıfırları
    for (int i = 0; i < N; ++i) z_d.push_back(cplx(-1.0, 0.0));   // sonsuzdaki sıfırlar
    const double k_d = k_bp * std::real(cplx(std::pow(fs2, N), 0.0) / den);

    // 5) zpk -> tf
    const auto bc = poly_from_roots(z_d);
    const auto ac = poly_from_roots(p_d);
    b_.resize(bc.size());
    a_.resize(ac.size());
    for (size_t i = 0; i < bc.size(); ++i) b_[i] = k_d * bc[i].real();
    for (size_t i = 0; i < ac.size(); ++i) a_[i] = ac[i].real();
    return std::isfinite(k_d) && a_.size() == b_.size();
}

bool BandpassFilter::compute_zi() {
    if (a_.empty()) return false;
    const int m = static_cast<int>(a_.size()) - 1;
    if (m < 1) return false;

    // (I - companion(a)^T) zi = b[1:] - a[1:] * b[0]
    cv::Mat lhs = cv::Mat::eye(m, m, CV_64F);
    cv::Mat rhs(m, 1, CV_64F);
    for (int i = 0; i < m; ++i) {
        lhs.at<double>(i, 0) += a_[i+1];
        if (i + 1 < m) lhs.at<double>(i, i+1) -= 1.0;
        rhs.at<double>(i, 0) = b_[i+1] - a_[i+1] * b_[0];
    }
    cv::Mat zi;
    try {
        if (!cv::solve(lhs, rhs, zi, cv::DECOMP_LU)) {
            std::fprintf(stderr, "[BPF] initial condition system is singular\n");
            return false;
        }
    } catch (const cv::Exception& e) {
        std::fprintf(stderr, "[BPF] cv::solve failed: %s\n", e.what());
        return false;
    }
    zi_.resize(m);
    for (int i = 0; i < m; ++i) zi_[i] = zi.at<double>(i, 0);
    return true;
}

// Direct Form II Transposed
void BandpassFilter::lfilter(const std::vector<double>& x, double zi_scale,
                             std::vector<double>& y) const {
    const size_t n = a_.size();
    std::vector<double> z(n - 1);
    for (size_t i = 0; i + 1 < n; ++i) z[i] = zi_[i] * zi_scale;

    y.resize(x.size());
    for (size_t k = 0; k < x.size(); ++k) {
        const double xk = x[k];
        const double yk = b_[0] * xk + z[0];
        for (size_t i = 0; i + 2 < n; ++i)
            z[i] = b_[i+1] * xk + z[i+1] - a_[i+1] * yk;
        z[n-2] = b_[n-1] * xk - a_[n-1] * yk;
        y[k] = yk;
    }
}

Status BandpassFilter::apply(const Signal& in, Signal& out) const {
    if (!valid_) return Status::InvalidParameter;
    const size_t pad = padlen();
    const size_t n   = in.size();
    if (n <= pad) return Status::InvalidParameter;

    // Tek (odd) uzatma
    std::vector<double> ext(n + 2 * pad);
    for (size_t i = 0; i < pad; ++i) ext[i] = 2.0 * in[0] - in[pad - i];
    std::copy(in.begin(), in.end(), ext.begin() + pad);
    for (size_t j = 0; j < pad; ++j) ext[pad + n + j] = 2.0 * in[n-1] - in[n - 2 - j];

    // İleri
    std::vector<double> fwd;
    lfilter(ext, ext.front(), fwd);

    // Geri
    std::reverse(fwd.begin(), fwd.end());
    std::vector<double> bwd;
    lfilter(fwd, fwd.front(), bwd);
    std::reverse(bwd.begin(), bwd.end());

    out.assign(bwd.begin() + pad, bwd.begin() + pad + n);
    return Status::Ok;
}

Status preprocess(const BandpassFilter& bpf, const Signal& in, Signal& out) {
    const Status st = bpf.apply(in, out);
    if (st != Status::Ok) return st;
    for (auto& v : out) v = std::fabs(v);
    return Status::Ok;
}

} // namespace ved
