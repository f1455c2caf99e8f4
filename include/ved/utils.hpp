#pragma once
#include <vector>
#include <algorithm>
#include <cmath>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <system_error>
#include <thread>
#include <utility>

namespace ved {

using Signal   = std::vector<double>;
using Envelope = std::vector<double>;
using Corpus   = std::vector<Signal>;

inline double mean_of(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    double acc = 0.0;
    for (double x : v) acc += x;
    return acc / static_cast<double>(v.size());
}

// Standart normal dağılımın ters CDF'i (Acklam yaklaşımı + bir Halley adımı).
// p (0,1) dışında ise NaN döner.
inline double normal_quantile(double p) {
    if (!(p > 0.0 && p < 1.0)) return std::nan("");

    static const double a[] = {-3.969683028665376e+01,  2.209460984245205e+02,
                               -2.759285104469687e+02,  1.383577518672690e+02,
                               -3.066479806614716e+01,  2.506628277459239e+00};
    static const double b[] = {-5.447609879822406e+01,  1.615858368580409e+02,
                               -1.556989798598866e+02,  6.680131188771972e+01,
                               -1.328068155288572e+01};
    static const double c[] = {-7.784894002430293e-03, -3.223964580411365e-01,
                               -2.400758277161838e+00, -2.549732539343734e+00,
                                4.374664141464968e+00,  2.938163982698783e+00};
    static const double d[] = { 7.784695709041462e-03,  3.224671290700398e-01,
                                2.445134137142996e+00,  3.754408661907416e+00};
    const double p_low  = 0.02425;
    const double p_high = 1.0 - p_low;

    double x;
    if (p < p_low) {
        const double q = std::sqrt(-2.0 * std::log(p));
        x = (((((c[0]*q + c[1])*q + c[2])*q + c[3])*q + c[4])*q + c[5]) /
            ((((d[0]*q + d[1])*q + d[2])*q + d[3])*q + 1.0);
    } else if (p <= p_high) {
        const double q = p - 0.5;
        const double r = q * q;
        x = (((((a[0]*r + a[1])*r + a[2])*r + a[3])*r + a[4])*r + a[5]) * q /
            (((((b[0]*r + b[1])*r + b[2])*r + b[3])*r + b[4])*r + 1.0);
    } else {
        const double q = std::sqrt(-2.0 * std::log(1.0 - p));
        x = -(((((c[0]*q + c[1])*q + c[2])*q + c[3])*q + c[4])*q + c[5]) /
             ((((d[0]*q + d[1])*q + d[2])*q + d[3])*q + 1.0);
    }

    // Hassasiyet için tek Halley düzeltmesi
    const double e = 0.5 * std::erfc(-x / std::sqrt(2.0)) - p;
    const double u = e * std::sqrt(2.0 * M_PI) * std::exp(x * x / 2.0);
    x = x - u / (1.0 + x * u / 2.0);
    return x;
}

namespace detail {

// launch(body) bir std::thread döndürür. Thread başlatılamazsa kalan parçalar
// çağıran thread'de çalışır; başlatılmış thread'ler her durumda join edilir.
template <typename Fn, typename Launch>
void run_chunked(std::size_t n, int workers, Fn& fn, Launch launch) {
    const std::size_t nw    = std::min<std::size_t>(static_cast<std::size_t>(workers), n);
    const std::size_t chunk = (n + nw - 1) / nw;
    std::vector<std::thread> pool;
    pool.reserve(nw);
    std::size_t inline_from = n;
    for (std::size_t w = 0; w < nw; ++w) {
        const std::size_t lo = w * chunk;
        const std::size_t hi = std::min(n, lo + chunk);
        if (lo >= hi) break;
        try {
            pool.push_back(launch([lo, hi, &fn] {
                for (std::size_t i = lo; i < hi; ++i) fn(i);
            }));
        } catch (const std::system_error& e) {
            std::fprintf(stderr, "[PAR] thread start failed (%s); %zu items run inline\n",
                         e.what(), n - lo);
            inline_from = lo;
            break;
        }
    }
    for (std::size_t i = inline_from; i < n; ++i) fn(i);
    for (auto& t : pool) t.join();
}

} // namespace detail

// [0,n) aralığını workers parçaya böler; fn(i) her indeks için bir kez çağrılır.
// workers<=1 ise çağıran thread'de sırayla çalışır.
template <typename Fn>
void parallel_for(std::size_t n, int workers, Fn fn) {
    if (workers <= 1 || n < 2) {
        for (std::size_t i = 0; i < n; ++i) fn(i);
        return;
    }
    detail::run_chunked(n, workers, fn, [](auto body) { return std::thread(std::move(body)); });
}

struct TicToc {
    using clock = std::chrono::steady_clock;
    clock::time_point t0;
    void tic() { t0 = clock::now(); }
    double toc_ms() const {
        using namespace std::chrono;
        return duration_cast<duration<double, std::milli>>(clock::now() - t0).count();
    }
};

} // namespace ved
