// ved/iio_source.cpp
#include "ved/iio_source.hpp"
#include <cstdio>
#include <cstring>
#include <string>

namespace ved {

static void log_err(const char* msg) { std::fprintf(stderr, "[IIO] %s\n", msg); }

IioSource::IioSource(const IioConfig& cfg) : cfg_(cfg) {
    if (!init_context())        { log_err("Context could not be created."); release(); return; }
    if (!apply_static_config()) { log_err("Settings could not be applied."); release(); return; }
    if (!alloc_buffer())        { log_err("Capture buffer could not be allocated."); release(); return; }
}

IioSource::~IioSource() { release(); }

bool IioSource::init_context() {
    // 1) Context
    ctx_ = cfg_.uri.empty() ? iio_create_default_context()
                            : iio_create_context_from_uri(cfg_.uri.c_str());
    if (!ctx_) { log_err("iio context null"); return false; }
    iio_context_set_timeout(ctx_, cfg_.timeout_ms);

    // 2) Cihazları yaz (teşhis)
    const unsigned ndev = iio_context_get_devices_count(ctx_);
    std::fprintf(stderr, "[IIO] context devices (%u):\n", ndev);
    for (unsigned i = 0; i < ndev; ++i) {
        auto* d = iio_context_get_device(ctx_, i);
        const char* name = iio_device_get_name(d);
        std::fprintf(stderr, "  - %s\n", name ? name : "(null)");
    }

    // 3) İvmeölçer: tam ad, yoksa ad içinde arama
    dev_ = iio_context_find_device(ctx_, cfg_.device.c_str());
    if (!dev_) {
        for (unsigned i = 0; i < ndev; ++i) {
            auto* d = iio_context_get_device(ctx_, i);
            const char* nm = iio_device_get_name(d);
            if (nm && std::string(nm).find(cfg_.device) != std::string::npos) { dev_ = d; break; }
        }
    }
    if (!dev_) {
        std::fprintf(stderr, "[IIO] device '%s' not found.\n", cfg_.device.c_str());
        return false;
    }

    // 4) Eksen kanalı (input)
    const std::string& chname = (cfg_.channel == Channel::Horizontal) ? cfg_.horiz_channel
                                                                      : cfg_.vert_channel;
    ch_ = iio_device_find_channel(dev_, chname.c_str(), false);
    if (!ch_ || !iio_channel_is_scan_element(ch_)) {
        std::fprintf(stderr, "[IIO] channel '%s' missing or not bufferable.\n", chname.c_str());
        ch_ = nullptr;
        return false;
    }
    iio_channel_enable(ch_);
    return true;
}

bool IioSource::apply_static_config() {
    // 1) Örnekleme hızı: kanal, yoksa cihaz özniteliği
    const long long hz = static_cast<long long>(cfg_.samp_hz);
    if (iio_channel_attr_write_longlong(ch_, "sampling_frequency", hz) < 0 &&
        iio_device_attr_write_longlong(dev_, "sampling_frequency", hz) < 0) {
        std::fprintf(stderr, "[IIO] sampling_frequency could not be written.\n");
        return false;
    }

    // 2) Ölçek (yoksa ham değerler kullanılır)
    double scale = 0.0;
    if (iio_channel_attr_read_double(ch_, "scale", &scale) >= 0 && scale > 0.0) {
        scale_ = scale;
    } else {
        std::fprintf(stderr, "[IIO] no scale attribute; using raw counts.\n");
        scale_ = 1.0;
    }
    return true;
}

bool IioSource::alloc_buffer() {
    if (cfg_.frame_len <= 0) { log_err("frame length must be positive"); return false; }
    buf_ = iio_device_create_buffer(dev_, static_cast<size_t>(cfg_.frame_len), false);
    if (!buf_) { log_err("iio_device_create_buffer() failed."); return false; }
    return true;
}

bool IioSource::get_signal(Signal& out) {
    std::lock_guard<std::mutex> lk(m_);
    if (!buf_) return false;
    const ssize_t nbytes = iio_buffer_refill(buf_);
    if (nbytes <= 0) {
        std::fprintf(stderr, "[IIO] refill failed (%zd)\n", nbytes);
        return false;
    }

    // Kanalı ayıkla + dönüştür (işaret genişletme, kaydırma)
    const iio_data_format* fmt = iio_channel_get_data_format(ch_);
    const size_t width = fmt->length / 8;
    if (width == 0) { log_err("unsupported sample width"); return false; }
    raw_.resize(static_cast<size_t>(cfg_.frame_len) * width);
    const size_t got = iio_channel_read(ch_, buf_, raw_.data(), raw_.size()) / width;

    out.resize(got);
    for (size_t i = 0; i < got; ++i) {
        const uint8_t* p = raw_.data() + i * width;
        double v = 0.0;
        if (width == 2) {
            int16_t s16; uint16_t u16;
            std::memcpy(&s16, p, 2); std::memcpy(&u16, p, 2);
            v = fmt->is_signed ? static_cast<double>(s16) : static_cast<double>(u16);
        } else if (width == 4) {
            int32_t s32; uint32_t u32;
            std::memcpy(&s32, p, 4); std::memcpy(&u32, p, 4);
            v = fmt->is_signed ? static_cast<double>(s32) : static_cast<double>(u32);
        } else if (width == 8) {
            int64_t s64; uint64_t u64;
            std::memcpy(&s64, p, 8); std::memcpy(&u64, p, 8);
            v = fmt->is_signed ? static_cast<double>(s64) : static_cast<double>(u64);
        } else {
            int8_t s8 = static_cast<int8_t>(p[0]);
            v = fmt->is_signed ? s8 : p[0];
        }
        out[i] = v * scale_;
    }
    return got > 0;
}

void IioSource::release() {
    std::lock_guard<std::mutex> lk(m_);
    if (buf_) {
        iio_buffer_cancel(buf_);      // refill varsa kes
        iio_buffer_destroy(buf_);
        buf_ = nullptr;
    }
    if (ch_) {
        iio_channel_disable(ch_);
        ch_ = nullptr;
    }
    dev_ = nullptr;
    // En sonda context'i kapat
    if (ctx_) {
        iio_context_destroy(ctx_);
        ctx_ = nullptr;
    }
}

} // namespace ved
