#pragma once
#include "ved/config.hpp"
#include "ved/status.hpp"
#include "ved/utils.hpp"
#include "ved/bandpass_filter.hpp"
#include "ved/trainer.hpp"
#include "ved/classifier.hpp"
#include <optional>

namespace ved {

struct TrainSummary {
    std::size_t reference_len  = 0;
    std::size_t signals_used   = 0;
    bool        clamped        = false;
    double      mean_signal_ms = 0.0;   // TrainResult ile aynı: duvar saati / n
    Threshold   threshold;
};

class EnvelopeDetector {
public:
    explicit EnvelopeDetector(const Params& p);

    // Referans zarfı eğitim kümesinden kurar
    std::optional<TrainSummary> train(const Corpus& training);

    // Kaydedilmiş referans zarfı kullan
    Status set_reference(Envelope ref);

    // Ham test sinyalleri -> ön işleme -> eşik karşılaştırması
    Status classify(const Corpus& raw_test, ClassificationResult& out) const;

    // Canlı döngü için tek sinyal; score: ön işlenmiş sinyal ortalaması
    Status classify_one(const Signal& raw, double& score, bool& flagged) const;

    const Envelope&  reference() const { return reference_; }
    const Threshold& threshold() const { return threshold_; }
    bool trained() const { return !reference_.empty(); }

private:
    FilterConfig filter_config() const;

    Params         p_;
    BandpassFilter bpf_;
    Envelope       reference_;
    Threshold      threshold_;
};

} // namespace ved
