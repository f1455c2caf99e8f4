#pragma once
#include "ved/utils.hpp"
#include <cstddef>

namespace ved {

// Sinyal sağlayıcı arayüzü (CSV dizini/IIO ivmeölçer/simülasyon)
class ISource {
public:
    virtual ~ISource() = default;
    // true: sinyal üretildi; false: kaynak bitti/hata
    virtual bool get_signal(Signal& out) = 0;
    virtual void release() {} // opsiyonel kaynak bırakma
};

// Kaynağı en fazla max_signals sinyale kadar boşaltır (0: sınırsız)
inline std::size_t load_corpus(ISource& src, std::size_t max_signals, Corpus& out) {
    Signal s;
    std::size_t n = 0;
    while ((max_signals == 0 || n < max_signals) && src.get_signal(s)) {
        out.push_back(s);
        ++n;
    }
    return n;
}

} // namespace ved
