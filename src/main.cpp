// main.cpp: ved_detect (referans zarf eğitimi + eşik sınıflandırma)
#include "ved/config.hpp"
#include "ved/envelope_detector.hpp"
#include "ved/envelope_store.hpp"
#include "ved/dummy_source.hpp"
#include "ved/csv_source.hpp"
#include "ved/iio_source.hpp"
#include <string>
#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <iostream>
#include <atomic>
#include <csignal>
#include <utility>

// ------------------------------------------------------------
// Basit CLI
struct CliRun {
    bool        demo            = false;
    std::string train_dir;
    std::string test_dir;
    std::string save_envelope;
    std::string load_envelope;
    int         h_col           = 4;
    int         v_col           = 5;
    bool        fail_on_anomaly = false;

    // Canlı (IIO)
    std::string iio_uri;
    std::string iio_device      = "adxl355";
    bool        live            = false;
    size_t      max_signals     = 0;     // 0: Ctrl+C'ye kadar
};

static void print_help() {
    std::puts(
"Usage: ved_detect [options]\n"
"\n"
" Input:\n"
"       --demo                synthetic run (400 healthy training, 10+2 test)\n"
"       --train-dir <dir>     training CSV directory (one file per signal)\n"
"       --test-dir <dir>      test CSV directory\n"
"       --h-col <int>         horizontal column index (default 4)\n"
"       --v-col <int>         vertical column index (default 5)\n"
"   -c, --channel <h|v>       sensor axis (default h)\n"
"\n"
" Live (IIO accelerometer):\n"
"       --iio-uri <str>       iio uri (local: | ip:<addr>); enables live mode\n"
"       --iio-device <str>    device name (default adxl355)\n"
"       --max-signals <int>   stop after N live signals (default: until Ctrl+C)\n"
"\n"
" Filter:\n"
"   -s, --fs <Hz>             sample rate (default 25600)\n"
"       --low <Hz>            band low edge (default 1000)\n"
"       --high <Hz>           band high edge (default 10000)\n"
"   -o, --order <int>         Butterworth order (default 4)\n"
"\n"
" Training / threshold:\n"
"   -n, --train-count <int>   training signals to average (default 400)\n"
"   -p, --confidence <dbl>    confidence level in (0,1) (default 0.95)\n"
"       --save-envelope <f>   write reference envelope after training\n"
"       --load-envelope <f>   skip training, use stored envelope (not with --save-envelope)\n"
"\n"
" Control:\n"
"   -j, --workers <int>       worker threads (default 1)\n"
"   -q, --quiet               only print the summary\n"
"       --fail-on-anomaly     exit code 2 when a signal is flagged\n"
    );
}

static bool parse_cli(int argc, char** argv, CliRun& r, ved::Params& p) {
    for (int i=1; i<argc; ++i) {
        std::string a = argv[i];
        auto need = [&](const char* what){
            if (i+1 >= argc) { std::fprintf(stderr,"missing value for %s\n", what); return false; }
            return true;
        };
        if (a=="-h" || a=="--help") { print_help(); std::exit(0); }
        else if (a=="--demo")                { r.demo = true; }
        else if (a=="--train-dir")           { if(!need(a.c_str())) return false; r.train_dir = argv[++i]; }
        else if (a=="--test-dir")            { if(!need(a.c_str())) return false; r.test_dir  = argv[++i]; }
        else if (a=="--h-col")               { if(!need(a.c_str())) return false; r.h_col     = std::atoi(argv[++i]); }
        else if (a=="--v-col")               { if(!need(a.c_str())) return false; r.v_col     = std::atoi(argv[++i]); }
        else if (a=="-c"||a=="--channel")    {
            if(!need(a.c_str())) return false;
            const std::string v = argv[++i];
            if      (v=="h" || v=="horizontal") p.channel = ved::Channel::Horizontal;
            else if (v=="v" || v=="vertical")   p.channel = ved::Channel::Vertical;
            else { std::fprintf(stderr, "unknown channel: %s\n", v.c_str()); return false; }
        }
        else if (a=="--iio-uri")             { if(!need(a.c_str())) return false; r.iio_uri = argv[++i]; r.live = true; }
        else if (a=="--iio-device")          { if(!need(a.c_str())) return false; r.iio_device = argv[++i]; }
        else if (a=="--max-signals")         { if(!need(a.c_str())) return false; r.max_signals = std::strtoul(argv[++i], nullptr, 10); }
        else if (a=="-s"||a=="--fs")         { if(!need(a.c_str())) return false; p.sample_rate_hz = std::strtod(argv[++i], nullptr); }
        else if (a=="--low")                 { if(!need(a.c_str())) return false; p.band_low_hz    = std::strtod(argv[++i], nullptr); }
        else if (a=="--high")                { if(!need(a.c_str())) return false; p.band_high_hz   = std::strtod(argv[++i], nullptr); }
        else if (a=="-o"||a=="--order")      { if(!need(a.c_str())) return false; p.filter_order   = std::atoi(argv[++i]); }
        else if (a=="-n"||a=="--train-count"){ if(!need(a.c_str())) return false; p.train_count    = std::strtoul(argv[++i], nullptr, 10); }
        else if (a=="-p"||a=="--confidence") { if(!need(a.c_str())) return false; p.confidence     = std::strtod(argv[++i], nullptr); }
        else if (a=="--save-envelope")       { if(!need(a.c_str())) return false; r.save_envelope  = argv[++i]; }
        else if (a=="--load-envelope")       { if(!need(a.c_str())) return false; r.load_envelope  = argv[++i]; }
        else if (a=="-j"||a=="--workers")    { if(!need(a.c_str())) return false; p.workers        = std::atoi(argv[++i]); }
        else if (a=="-q"||a=="--quiet")      { p.verbose = false; }
        else if (a=="--fail-on-anomaly")     { r.fail_on_anomaly = true; }
        else { std::fprintf(stderr, "unknown option: %s\n", a.c_str()); print_help(); return false; }
    }
    if (!r.demo && !r.live && r.test_dir.empty()) {
        std::fprintf(stderr, "nothing to do: give --demo, --test-dir or --iio-uri\n");
        print_help();
        return false;
    }
    if (!r.load_envelope.empty() && !r.save_envelope.empty()) {
        std::fprintf(stderr, "--save-envelope needs a trained reference; drop --load-envelope\n");
        return false;
    }
    if (r.load_envelope.empty() && !r.demo && r.train_dir.empty()) {
        std::fprintf(stderr, "--train-dir or --load-envelope is required\n");
        return false;
    }
    if (!(p.confidence > 0.0 && p.confidence < 1.0)) {
        std::fprintf(stderr, "confidence must be in (0,1)\n");
        return false;
    }
    return true;
}

// Ctrl+C -> stop_flag
static std::atomic<bool> g_stop{false};
static void on_sigint(int){ g_stop.store(true, std::memory_order_release); }

static ved::CsvConfig csv_config(const std::string& dir, const CliRun& r, const ved::Params& p) {
    ved::CsvConfig c;
    c.dir            = dir;
    c.channel        = p.channel;
    c.horizontal_col = r.h_col;
    c.vertical_col   = r.v_col;
    c.verbose        = p.verbose;
    return c;
}

// ------------------------------------------------------------
int main(int argc, char** argv) {
    std::signal(SIGINT,  on_sigint);
#ifdef SIGTERM
    std::signal(SIGTERM, on_sigint);
#endif

    ved::Params p;
    CliRun r;
    if (!parse_cli(argc, argv, r, p)) {
        return 1;
    }

    std::cout << "[INFO] fs=" << p.sample_rate_hz
              << " | band=" << p.band_low_hz << "-" << p.band_high_hz
              << " | order=" << p.filter_order
              << " | channel=" << ved::to_string(p.channel)
              << " | confidence=" << p.confidence
              << " | train_count=" << p.train_count
              << "\n";

    ved::EnvelopeDetector det(p);

    // 1) Referans zarf: dosyadan ya da eğitimden
    if (!r.load_envelope.empty()) {
        auto env = ved::load_envelope(r.load_envelope);
        if (!env) return 1;
        const ved::Status st = det.set_reference(std::move(*env));
        if (st != ved::Status::Ok) {
            std::cerr << "[ERR] Stored envelope unusable: " << ved::to_string(st) << "\n";
            return 1;
        }
        std::cout << "[INFO] Loaded reference envelope (" << det.reference().size() << " samples)\n";
    } else {
        ved::Corpus training;
        if (r.demo) {
            ved::DummyConfig dc;
            dc.count          = 400;
            dc.sample_rate_hz = p.sample_rate_hz;
            ved::DummySource src(dc);
            ved::load_corpus(src, 0, training);
        } else {
            ved::CsvDirSource src(csv_config(r.train_dir, r, p));
            if (!src.ok()) return 1;
            const size_t got = ved::load_corpus(src, 0, training);
            if (got != src.size()) {
                std::cerr << "[ERR] Read " << got << " of " << src.size()
                          << " training files (" << src.failed_files() << " unreadable)\n";
                return 1;
            }
            if (src.skipped_rows() > 0)
                std::cout << "[WARN] " << src.skipped_rows() << " malformed training rows skipped\n";
        }

        auto sum = det.train(training);
        if (!sum) return 1;
        std::cout << "[INFO] Reference: " << sum->reference_len << " samples from "
                  << sum->signals_used << " signals" << (sum->clamped ? " (clamped)" : "")
                  << " | " << sum->mean_signal_ms << " ms/signal (wall)\n";

        if (!r.save_envelope.empty()) {
            if (!ved::save_envelope(r.save_envelope, det.reference())) return 1;
            std::cout << "[INFO] Reference envelope written to " << r.save_envelope << "\n";
        }
    }
    const ved::Threshold& th = det.threshold();
    std::cout << "[INFO] Threshold=" << th.value
              << " | mean=" << th.mean << " | std=" << th.sdev << " | z=" << th.z << "\n";

    // 2a) Canlı mod: Ctrl+C veya max-signals'a kadar
    if (r.live) {
        ved::IioConfig icfg;
        icfg.uri       = r.iio_uri;
        icfg.device    = r.iio_device;
        icfg.channel   = p.channel;
        icfg.samp_hz   = static_cast<uint64_t>(p.sample_rate_hz);
        ved::IioSource src(icfg);
        if (!src.ok()) return 1;

        size_t seen = 0, flagged_total = 0;
        ved::Signal sig;
        while (!g_stop.load(std::memory_order_acquire) &&
               (r.max_signals == 0 || seen < r.max_signals)) {
            if (!src.get_signal(sig)) {
                std::cout << "[WARN] Source ended/error.\n";
                break;
            }
            double score = 0.0;
            bool flagged = false;
            const ved::Status st = det.classify_one(sig, score, flagged);
            if (st != ved::Status::Ok) {
                std::cerr << "[ERR] Signal " << seen << ": " << ved::to_string(st) << "\n";
                src.release();
                return 1;
            }
            if (flagged) ++flagged_total;
            std::printf("Signal %zu - %s (mean=%.6f)\n", seen, flagged ? "DEGRADED" : "Normal", score);
            ++seen;
        }
        src.release();
        std::cout << "[INFO] " << flagged_total << " of " << seen << " live signals flagged.\n";
        return (r.fail_on_anomaly && flagged_total > 0) ? 2 : 0;
    }

    // 2b) Toplu test kümesi
    ved::Corpus test;
    if (r.demo && r.test_dir.empty()) {
        ved::DummyConfig dc;
        dc.count          = 12;
        dc.sample_rate_hz = p.sample_rate_hz;
        dc.degraded       = {10, 11};
        dc.seed           = 777;
        ved::DummySource src(dc);
        ved::load_corpus(src, 0, test);
    } else {
        ved::CsvDirSource src(csv_config(r.test_dir, r, p));
        if (!src.ok()) return 1;
        const size_t got = ved::load_corpus(src, 0, test);
        if (got != src.size()) {
            std::cerr << "[ERR] Read " << got << " of " << src.size()
                      << " test files (" << src.failed_files() << " unreadable)\n";
            return 1;
        }
    }

    ved::ClassificationResult res;
    const ved::Status st = det.classify(test, res);
    if (st != ved::Status::Ok) {
        std::cerr << "[ERR] Classification failed: " << ved::to_string(st) << "\n";
        return 1;
    }

    std::cout << "[INFO] Flagged " << res.count() << " of " << test.size() << " signals:";
    for (size_t idx : res.indices) std::cout << " " << idx;
    std::cout << "\n";
    return (r.fail_on_anomaly && res.count() > 0) ? 2 : 0;
}
