#include "ved/envelope_detector.hpp"
#include <cmath>
#include <cstdio>
#include <utility>

namespace ved {

EnvelopeDetector::EnvelopeDetector(const Params& p)
    : p_(p), bpf_(filter_config()) {
    if (!bpf_.valid())
        std::fprintf(stderr, "[ERR] Invalid band %.1f-%.1f Hz (order %d, fs %.1f Hz).\n",
                     p_.band_low_hz, p_.band_high_hz, p_.filter_order, p_.sample_rate_hz);
}

FilterConfig EnvelopeDetector::filter_config() const {
    return FilterConfig{ p_.band_low_hz, p_.band_high_hz, p_.sample_rate_hz, p_.filter_order };
}

std::optional<TrainSummary> EnvelopeDetector::train(const Corpus& training) {
    // Trainer
    EnvelopeTrainer trainer(
        bpf_,
        { p_.train_count, p_.workers, p_.verbose, p_.log_every }
    );
    TrainResult res;
    const Status st = trainer.run(training, res);
    if (st != Status::Ok) {
        std::fprintf(stderr, "[ERR] Training failed: %s\n", to_string(st));
        return std::nullopt;
    }

    // Eşik yalnız referansa bağlı; burada bir kez hesaplanır
    Threshold th;
    const Status ts = ThresholdClassifier::derive(res.reference, p_.confidence, th);
    if (ts != Status::Ok) {
        std::fprintf(stderr, "[ERR] Threshold failed: %s\n", to_string(ts));
        return std::nullopt;
    }
    reference_ = std::move(res.reference);
    threshold_ = th;

    TrainSummary s;
    s.reference_len  = reference_.size();
    s.signals_used   = res.signals_used;
    s.clamped        = res.clamped;
    s.mean_signal_ms = res.mean_signal_ms;
    s.threshold      = th;
    return s;
}

Status EnvelopeDetector::set_reference(Envelope ref) {
    for (double v : ref) {
        if (!std::isfinite(v) || v < 0.0) {
            std::fprintf(stderr, "[ERR] Reference envelope has invalid value %g\n", v);
            return Status::InvalidParameter;
        }
    }
    Threshold th;
    const Status st = ThresholdClassifier::derive(ref, p_.confidence, th);
    if (st != Status::Ok) return st;
    reference_ = std::move(ref);
    threshold_ = th;
    return Status::Ok;
}

Status EnvelopeDetector::classify(const Corpus& raw_test, ClassificationResult& out) const {
    // Ön işleme (sinyaller bağımsız)
    Corpus pre(raw_test.size());
    std::vector<Status> sts(raw_test.size(), Status::Ok);
    parallel_for(raw_test.size(), p_.workers, [&](std::size_t i) {
        sts[i] = preprocess(bpf_, raw_test[i], pre[i]);
    });
    for (std::size_t i = 0; i < sts.size(); ++i) {
        if (sts[i] != Status::Ok) {
            std::fprintf(stderr, "[ERR] Test signal %zu: %s\n", i, to_string(sts[i]));
            return sts[i];
        }
    }

    ThresholdClassifier cls({ p_.confidence, p_.workers, p_.verbose });
    return cls.classify(reference_, pre, out);
}

Status EnvelopeDetector::classify_one(const Signal& raw, double& score, bool& flagged) const {
    flagged = false;
    score   = 0.0;
    if (reference_.empty()) return Status::EmptyReference;
    Signal pre;
    const Status st = preprocess(bpf_, raw, pre);
    if (st != Status::Ok) return st;
    score   = mean_of(pre);
    flagged = score > threshold_.value;
    return Status::Ok;
}

} // namespace ved
