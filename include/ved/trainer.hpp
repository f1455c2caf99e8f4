#pragma once
#include "ved/status.hpp"
#include "ved/utils.hpp"
#include "ved/bandpass_filter.hpp"
#include "ved/envelope.hpp"
#include <cstddef>
#include <utility>

namespace ved {

struct TrainConfig {
    std::size_t count     = 400;   // istenen eğitim sinyali sayısı
    int         workers   = 1;
    bool        verbose   = true;
    int         log_every = 100;
};

struct TrainResult {
    Envelope    reference;
    std::size_t signals_used   = 0;
    bool        clamped        = false;  // kümede istenenden az sinyal vardı
    double      mean_signal_ms = 0.0;    // toplam duvar saati / n; workers>1 iken sinyal başına işlem süresi değil
};

class EnvelopeTrainer {
public:
    EnvelopeTrainer(BandpassFilter bpf, TrainConfig cfg)
      : bpf_(std::move(bpf)), cfg_(cfg) {}

    // İlk n sinyal (saklanan sırayla) -> ön işleme -> zarf -> eleman bazlı ortalama
    Status run(const Corpus& training, TrainResult& out) const;

private:
    BandpassFilter    bpf_;
    EnvelopeExtractor env_;
    TrainConfig       cfg_;
};

} // namespace ved
