#pragma once
#include "ved/status.hpp"
#include "ved/utils.hpp"
#include <vector>
#include <cstddef>

namespace ved {

struct FilterConfig {
    double low_hz         = 1000.0;
    double high_hz        = 10000.0;
    double sample_rate_hz = 25600.0;
    int    order          = 4;
};

// Butterworth bant geçiren, ileri-geri (sıfır faz) uygulanır.
class BandpassFilter {
public:
    explicit BandpassFilter(const FilterConfig& cfg = {});

    // Parametreler geçersizse tasarım yapılmaz, apply() InvalidParameter döner
    bool valid() const { return valid_; }

    // Sıfır faz filtreleme; out.size() == in.size()
    Status apply(const Signal& in, Signal& out) const;

    // filtfilt kenar uzatması: 3 * max(len(a), len(b))
    std::size_t padlen() const { return 3 * std::max(a_.size(), b_.size()); }

    const std::vector<double>& b() const { return b_; }
    const std::vector<double>& a() const { return a_; }

private:
    bool design();
    bool compute_zi();
    void lfilter(const std::vector<double>& x, double zi_scale,
                 std::vector<double>& y) const;

    FilterConfig        cfg_;
    bool                valid_ = false;
    std::vector<double> b_, a_;   // a_[0] == 1
    std::vector<double> zi_;      // adım yanıtı kararlı durum başlangıcı
};

// |bandpass(x)|
Status preprocess(const BandpassFilter& bpf, const Signal& in, Signal& out);

} // namespace ved
