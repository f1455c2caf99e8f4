#include "ved/classifier.hpp"
#include <opencv2/core.hpp>
#include <cstdio>

namespace ved {

Status ThresholdClassifier::derive(const Envelope& reference, double confidence, Threshold& out) {
    out = Threshold{};
    if (reference.empty()) return Status::EmptyReference;
    if (!(confidence > 0.0 && confidence < 1.0)) return Status::InvalidParameter;

    try {
        cv::Mat ref(1, static_cast<int>(reference.size()), CV_64F,
                    const_cast<double*>(reference.data()));
        cv::Scalar mu, sigma;
        cv::meanStdDev(ref, mu, sigma);   // popülasyon std
        out.mean = mu[0];
        out.sdev = sigma[0];
    } catch (const cv::Exception& e) {
        std::fprintf(stderr, "[CLS] cv::meanStdDev failed: %s\n", e.what());
        return Status::InvalidParameter;
    }

    out.z     = normal_quantile((1.0 + confidence) / 2.0);
    out.value = out.mean + out.z * out.sdev;
    return Status::Ok;
}

Status ThresholdClassifier::classify(const Envelope& reference, const Corpus& preprocessed,
                                     ClassificationResult& out) const {
    out = ClassificationResult{};
    const Status st = derive(reference, cfg_.confidence, out.threshold);
    if (st != Status::Ok) {
        if (cfg_.verbose) std::printf("[CLS] Threshold not available: %s\n", to_string(st));
        return st;
    }
    const Threshold& th = out.threshold;
    if (cfg_.verbose)
        std::printf("[CLS] mean=%.6f  std=%.6f  z=%.4f  threshold=%.6f  (confidence=%.3f)\n",
                    th.mean, th.sdev, th.z, th.value, cfg_.confidence);

    // Skorlar bağımsız; paralel hesaplanıp giriş sırasıyla toplanır
    out.scores.resize(preprocessed.size());
    parallel_for(preprocessed.size(), cfg_.workers, [&](std::size_t i) {
        out.scores[i] = mean_of(preprocessed[i]);
    });

    for (std::size_t i = 0; i < preprocessed.size(); ++i) {
        const double s = out.scores[i];
        if (s > th.value) {
            out.indices.push_back(i);
            out.flagged.push_back(preprocessed[i]);
            if (cfg_.verbose) std::printf("Signal %zu - DEGRADED (mean=%.6f)\n", i, s);
        } else if (cfg_.verbose) {
            std::printf("Signal %zu - Normal (mean=%.6f)\n", i, s);
        }
    }
    if (cfg_.verbose)
        std::printf("[CLS] %zu of %zu signals flagged.\n", out.count(), preprocessed.size());
    return Status::Ok;
}

} // namespace ved
