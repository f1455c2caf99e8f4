#pragma once
#include <cstddef>

namespace ved {

// Sensör ekseni seçimi (PRONOSTIA düzeni: yatay / dikey ivmeölçer)
enum class Channel { Horizontal, Vertical };

inline const char* to_string(Channel c) {
    return c == Channel::Horizontal ? "horizontal" : "vertical";
}

struct Params {
    // Örnekleme
    double      sample_rate_hz  = 25600.0;
    Channel     channel         = Channel::Horizontal;

    // Bant geçiren filtre
    double      band_low_hz     = 1000.0;
    double      band_high_hz    = 10000.0;
    int         filter_order    = 4;

    // Eğitim (referans zarf)
    std::size_t train_count     = 400;

    // Sınıflandırma
    double      confidence      = 0.95;

    // Çalışma
    int         workers         = 1;      // >1: sinyaller paralel işlenir
    bool        verbose         = true;   // ayrıntılı log
    int         log_every       = 100;    // her N sinyalde bir log
};

} // namespace ved
