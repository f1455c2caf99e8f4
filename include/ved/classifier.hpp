#pragma once
#include "ved/status.hpp"
#include "ved/utils.hpp"
#include <vector>
#include <cstddef>

namespace ved {

struct ClassifyConfig {
    double confidence = 0.95;   // (0,1)
    int    workers    = 1;
    bool   verbose    = true;
};

struct Threshold {
    double mean  = 0.0;   // referans zarf ortalaması
    double sdev  = 0.0;   // popülasyon standart sapması (N'e bölünür)
    double z     = 0.0;   // Φ⁻¹((1+confidence)/2)
    double value = 0.0;   // mean + z*sdev
};

struct ClassificationResult {
    Threshold                threshold;
    std::vector<double>      scores;    // her test sinyalinin ortalaması, giriş sırasıyla
    std::vector<std::size_t> indices;   // işaretlenen sinyallerin özgün indeksleri (artan)
    std::vector<Signal>      flagged;   // işaretlenen sinyaller, indices ile aynı sırada
    std::size_t count() const { return indices.size(); }
};

class ThresholdClassifier {
public:
    explicit ThresholdClassifier(const ClassifyConfig& cfg = {}) : cfg_(cfg) {}

    // Eşik yalnız referans zarf ve güven düzeyine bağlıdır
    static Status derive(const Envelope& reference, double confidence, Threshold& out);

    // Test sinyalleri önceden işlenmiş (|bandpass|) olmalı
    Status classify(const Envelope& reference, const Corpus& preprocessed,
                    ClassificationResult& out) const;

private:
    ClassifyConfig cfg_;
};

} // namespace ved
