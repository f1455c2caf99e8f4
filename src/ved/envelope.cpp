#include "ved/envelope.hpp"
#include <opencv2/core.hpp>
#include <cmath>
#include <cstdio>

namespace ved {

Status EnvelopeExtractor::extract(const Signal& in, Envelope& out) const {
    out.clear();
    const int n = static_cast<int>(in.size());
    if (n == 0) return Status::Ok;

    try {
        // 1) Tam karmaşık spektrum
        cv::Mat x(1, n, CV_64F, const_cast<double*>(in.data()));
        cv::Mat spectrum;
        cv::dft(x, spectrum, cv::DFT_COMPLEX_OUTPUT);

        // 2) Negatif frekansları sıfırla, pozitifleri iki katına çıkar
        auto* f = spectrum.ptr<cv::Vec2d>(0);
        const int half = n / 2;
        if (n % 2 == 0) {
            for (int i = 1; i < half; ++i) f[i] *= 2.0;
            for (int i = half + 1; i < n; ++i) f[i] = cv::Vec2d(0.0, 0.0);
        } else {
            for (int i = 1; i <= half; ++i) f[i] *= 2.0;
            for (int i = half + 1; i < n; ++i) f[i] = cv::Vec2d(0.0, 0.0);
        }

        // 3) Ters DFT -> analitik sinyal
        cv::Mat analytic;
        cv::dft(spectrum, analytic, cv::DFT_INVERSE | cv::DFT_SCALE | cv::DFT_COMPLEX_OUTPUT);

        // 4) Genlik
        const auto* s = analytic.ptr<cv::Vec2d>(0);
        out.resize(n);
        for (int i = 0; i < n; ++i) out[i] = std::hypot(s[i][0], s[i][1]);
    } catch (const cv::Exception& e) {
        std::fprintf(stderr, "[ENV] cv::dft failed: %s\n", e.what());
        out.clear();
        return Status::InvalidParameter;
    }
    return Status::Ok;
}

} // namespace ved
