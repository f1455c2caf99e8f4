// ved/trainer.cpp
#include "ved/trainer.hpp"
#include <cstdio>
#include <vector>
#include <atomic>

namespace ved {

Status EnvelopeTrainer::run(const Corpus& training, TrainResult& out) const {
    out = TrainResult{};
    if (training.empty()) {
        if (cfg_.verbose) std::printf("[TRAIN] Training corpus is empty. Cancelled.\n");
        return Status::EmptyCorpus;
    }
    if (cfg_.count == 0) {
        if (cfg_.verbose) std::printf("[TRAIN] Requested 0 training signals. Cancelled.\n");
        return Status::InvalidParameter;
    }

    // 1) n'yi küme boyutuna kırp (ölümcül değil)
    std::size_t n = cfg_.count;
    if (n > training.size()) {
        std::printf("[TRAIN] Only %zu training signals available (%zu requested); using %zu.\n",
                    training.size(), cfg_.count, training.size());
        n = training.size();
        out.clamped = true;
    }
    if (cfg_.verbose)
        std::printf("[TRAIN] Building reference envelope from %zu signals (workers=%d)...\n",
                    n, cfg_.workers);

    // 2) Sinyal başına zarf; her indeks kendi yuvasına yazar, sıra korunur
    std::vector<Envelope> envs(n);
    std::vector<Status>   sts(n, Status::Ok);
    std::atomic<std::size_t> done{0};
    TicToc ttot;
    ttot.tic();
    parallel_for(n, cfg_.workers, [&](std::size_t i) {
        Signal pre;
        sts[i] = preprocess(bpf_, training[i], pre);
        if (sts[i] == Status::Ok) sts[i] = env_.extract(pre, envs[i]);
        const std::size_t k = ++done;
        if (cfg_.verbose && cfg_.log_every > 0 && (k % static_cast<std::size_t>(cfg_.log_every) == 0))
            std::printf("[TRAIN] progress: %zu/%zu envelopes\n", k, n);
    });
    const double elapsed_ms = ttot.toc_ms();

    for (std::size_t i = 0; i < n; ++i) {
        if (sts[i] != Status::Ok) {
            if (cfg_.verbose)
                std::printf("[TRAIN] Signal %zu failed: %s. Cancelled.\n", i, to_string(sts[i]));
            return sts[i];
        }
    }

    // 3) Uzunluk kontrolü, ortalamadan önce
    const std::size_t len = envs.front().size();
    for (std::size_t i = 1; i < n; ++i) {
        if (envs[i].size() != len) {
            if (cfg_.verbose)
                std::printf("[TRAIN] Envelope %zu has %zu samples, expected %zu. Cancelled.\n",
                            i, envs[i].size(), len);
            return Status::LengthMismatch;
        }
    }

    // 4) Eleman bazlı aritmetik ortalama
    Envelope ref(len, 0.0);
    for (const auto& e : envs)
        for (std::size_t j = 0; j < len; ++j) ref[j] += e[j];
    for (auto& v : ref) v /= static_cast<double>(n);

    out.reference      = std::move(ref);
    out.signals_used   = n;
    out.mean_signal_ms = elapsed_ms / static_cast<double>(n);
    if (cfg_.verbose)
        std::printf("[TRAIN] Reference envelope ready: %zu samples, %zu signals, %.3f ms/signal (wall)\n",
                    len, n, out.mean_signal_ms);
    return Status::Ok;
}

} // namespace ved
