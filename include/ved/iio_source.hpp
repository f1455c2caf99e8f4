// ved/iio_source.hpp
#pragma once

#include "ved/source.hpp"
#include "ved/config.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <mutex>

extern "C" {
#include <iio.h>
}

namespace ved {

struct IioConfig {
    std::string uri;                          // "local:" | "ip:192.168.1.10" | "" (default)
    std::string device        = "adxl355";    // IIO ivmeölçer cihaz adı
    std::string horiz_channel = "accel_x";
    std::string vert_channel  = "accel_y";
    Channel     channel       = Channel::Horizontal;
    uint64_t    samp_hz       = 25600;
    int         frame_len     = 2560;         // sinyal başına örnek
    int         timeout_ms    = 1000;
};

// Linux IIO ivmeölçerden canlı okuma; her buffer dolumu bir sinyal
class IioSource : public ISource {
public:
    explicit IioSource(const IioConfig& cfg);
    ~IioSource() override;

    bool ok() const { return buf_ != nullptr; }

    // ISource
    bool get_signal(Signal& out) override;
    void release() override;

    // Teşhis/entegrasyon
    iio_context* raw_ctx() const { return ctx_; }

private:
    IioConfig    cfg_{};
    iio_context* ctx_   = nullptr;
    iio_device*  dev_   = nullptr;
    iio_channel* ch_    = nullptr;
    iio_buffer*  buf_   = nullptr;
    double       scale_ = 1.0;    // ham -> m/s^2

    std::mutex          m_;
    std::vector<uint8_t> raw_;

    // Kurulum adımları
    bool init_context();
    bool apply_static_config();
    bool alloc_buffer();
};

} // namespace ved
