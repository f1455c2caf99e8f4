#pragma once
#include "ved/source.hpp"
#include <random>
#include <set>
#include <cmath>

namespace ved {

struct DummyConfig {
    std::size_t count          = 400;      // üretilecek sinyal sayısı
    std::size_t length         = 2560;     // sinyal başına örnek (0.1 s @ 25.6 kHz)
    double      sample_rate_hz = 25600.0;
    double      tone_hz        = 5000.0;
    double      amplitude      = 1.0;
    double      noise_std      = 0.05;
    double      degraded_amp   = 5.0;      // bozulmuş sinyallerin genliği
    std::set<std::size_t> degraded;        // bozulmuş sinyal konumları
    unsigned    seed           = 12345;
};

// Sinüs + Gauss gürültü; seçilen konumlarda genlik büyütülür (yatak bozulması)
class DummySource : public ISource {
public:
    explicit DummySource(const DummyConfig& cfg)
      : cfg_(cfg), rng_(cfg.seed),
        noise_(0.0, cfg.noise_std > 0.0 ? cfg.noise_std : 1.0) {}

    bool get_signal(Signal& out) override {
        if (idx_ >= cfg_.count) return false;
        const double amp = cfg_.degraded.count(idx_) ? cfg_.degraded_amp : cfg_.amplitude;
        const double w = 2.0 * M_PI * cfg_.tone_hz / cfg_.sample_rate_hz;
        out.resize(cfg_.length);
        for (std::size_t i = 0; i < cfg_.length; ++i)
            out[i] = amp * std::sin(w * static_cast<double>(i))
                   + (cfg_.noise_std > 0.0 ? noise_(rng_) : 0.0);
        ++idx_;
        return true;
    }

private:
    DummyConfig cfg_;
    std::size_t idx_ = 0;
    std::mt19937 rng_;
    std::normal_distribution<double> noise_;
};

} // namespace ved
