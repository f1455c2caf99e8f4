/**
 * Unit tests for the reference-envelope trainer:
 * - empty corpus / n == 0
 * - n == 1 equals the single preprocessed envelope
 * - clamp when more signals are requested than available
 * - first-n selection, aggregation is order independent
 * - length mismatch
 * - parallel run equals sequential run
 * - all-zero corpus
 */

#include <iostream>
#include <cstdlib>
#include <vector>
#include <cmath>

#include "ved/trainer.hpp"
#include "ved/dummy_source.hpp"

using namespace std;
using namespace ved;

// Test utilities (NDEBUG'den bağımsız)
#define CHECK(cond) do { if (!(cond)) { \
    cerr << "  ✗ FAILED: " #cond " (" __FILE__ ":" << __LINE__ << ")" << endl; \
    exit(1); } } while (0)
#define ASSERT_EQ(a, b) CHECK((a) == (b))
#define ASSERT_TRUE(x) CHECK(x)
#define ASSERT_NEAR(a, b, tol) CHECK(std::abs((a) - (b)) < (tol))
#define TEST(name) cout << "\n[TEST] " << name << "..." << endl

static BandpassFilter default_filter() {
    return BandpassFilter({1000.0, 10000.0, 25600.0, 4});
}

static Corpus healthy_corpus(size_t count, unsigned seed = 1) {
    DummyConfig dc;
    dc.count = count;
    dc.seed  = seed;
    DummySource src(dc);
    Corpus c;
    load_corpus(src, 0, c);
    return c;
}

static TrainConfig quiet(size_t n, int workers = 1) {
    TrainConfig cfg;
    cfg.count   = n;
    cfg.workers = workers;
    cfg.verbose = false;
    return cfg;
}

void test_empty_and_zero_count() {
    TEST("Empty corpus and n == 0");

    TrainResult res;
    EnvelopeTrainer t(default_filter(), quiet(10));
    ASSERT_EQ(t.run(Corpus{}, res), Status::EmptyCorpus);
    ASSERT_TRUE(res.reference.empty());
    cout << "  ✓ empty corpus -> EmptyCorpus" << endl;

    EnvelopeTrainer t0(default_filter(), quiet(0));
    ASSERT_EQ(t0.run(healthy_corpus(3), res), Status::InvalidParameter);
    cout << "  ✓ n == 0 -> InvalidParameter" << endl;
}

void test_single_signal() {
    TEST("n == 1 equals the single preprocessed envelope");

    Corpus c = healthy_corpus(5);
    BandpassFilter bpf = default_filter();
    EnvelopeExtractor ext;
    Signal pre;
    Envelope expected;
    ASSERT_EQ(preprocess(bpf, c[0], pre), Status::Ok);
    ASSERT_EQ(ext.extract(pre, expected), Status::Ok);

    TrainResult res;
    EnvelopeTrainer t(bpf, quiet(1));
    ASSERT_EQ(t.run(c, res), Status::Ok);
    ASSERT_EQ(res.signals_used, 1u);
    ASSERT_TRUE(!res.clamped);
    ASSERT_EQ(res.reference.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i)
        ASSERT_NEAR(res.reference[i], expected[i], 1e-12);
    cout << "  ✓ reference matches envelope(preprocess(signal 0))" << endl;
}

void test_clamp() {
    TEST("Requested count larger than corpus is clamped");

    Corpus c = healthy_corpus(400);
    TrainResult res;
    EnvelopeTrainer t(default_filter(), quiet(10000));
    ASSERT_EQ(t.run(c, res), Status::Ok);
    ASSERT_TRUE(res.clamped);
    ASSERT_EQ(res.signals_used, 400u);
    ASSERT_EQ(res.reference.size(), c[0].size());
    cout << "  ✓ n=10000 on 400 signals -> 400 used, clamped flag set" << endl;
}

void test_first_n_and_order() {
    TEST("First n signals in stored order; mean is order independent");

    Corpus base = healthy_corpus(3, 11);
    Signal big(base[0].size());
    for (size_t i = 0; i < big.size(); ++i) big[i] = 10.0 * base[0][i];

    // n=3: dördüncü (büyük) sinyal kullanılmamalı
    Corpus with_tail = base;
    with_tail.push_back(big);

    TrainResult a, b, c;
    EnvelopeTrainer t3(default_filter(), quiet(3));
    ASSERT_EQ(t3.run(base, a), Status::Ok);
    ASSERT_EQ(t3.run(with_tail, b), Status::Ok);
    ASSERT_EQ(b.signals_used, 3u);
    for (size_t i = 0; i < a.reference.size(); ++i) ASSERT_EQ(a.reference[i], b.reference[i]);
    cout << "  ✓ signals after the first n are ignored" << endl;

    Corpus permuted = { base[2], base[0], base[1] };
    ASSERT_EQ(t3.run(permuted, c), Status::Ok);
    for (size_t i = 0; i < a.reference.size(); ++i)
        ASSERT_NEAR(a.reference[i], c.reference[i], 1e-12);
    cout << "  ✓ permuting the same set gives the same reference" << endl;
}

void test_length_mismatch() {
    TEST("Envelopes of different length");

    Corpus c = healthy_corpus(3);
    c[1].resize(c[1].size() - 100);
    TrainResult res;
    EnvelopeTrainer t(default_filter(), quiet(3));
    ASSERT_EQ(t.run(c, res), Status::LengthMismatch);
    ASSERT_TRUE(res.reference.empty());

    // Uyumsuz sinyal ilk n'in dışındaysa sorun yok
    EnvelopeTrainer t1(default_filter(), quiet(1));
    ASSERT_EQ(t1.run(c, res), Status::Ok);
    cout << "  ✓ LengthMismatch only when a mismatched signal is used" << endl;

    Corpus shortc = healthy_corpus(2);
    shortc[1].resize(5);
    ASSERT_EQ(t.run(shortc, res), Status::InvalidParameter);
    cout << "  ✓ too-short signal -> InvalidParameter" << endl;
}

void test_parallel_matches_sequential() {
    TEST("Parallel training equals sequential training");

    Corpus c = healthy_corpus(37, 5);
    TrainResult seq, par;
    EnvelopeTrainer ts(default_filter(), quiet(37, 1));
    EnvelopeTrainer tp(default_filter(), quiet(37, 4));
    ASSERT_EQ(ts.run(c, seq), Status::Ok);
    ASSERT_EQ(tp.run(c, par), Status::Ok);
    ASSERT_EQ(seq.reference.size(), par.reference.size());
    for (size_t i = 0; i < seq.reference.size(); ++i) ASSERT_EQ(seq.reference[i], par.reference[i]);
    cout << "  ✓ identical reference with 4 workers" << endl;

    // Duvar saati / n: paralelde de sonlu ve negatif değil
    ASSERT_TRUE(std::isfinite(par.mean_signal_ms) && par.mean_signal_ms >= 0.0);
    ASSERT_TRUE(std::isfinite(seq.mean_signal_ms) && seq.mean_signal_ms >= 0.0);
    cout << "  ✓ wall time per signal: " << seq.mean_signal_ms << " ms (1 worker), "
         << par.mean_signal_ms << " ms (4 workers)" << endl;
}

void test_all_zero_corpus() {
    TEST("All-zero corpus");

    Corpus c(20, Signal(2560, 0.0));
    TrainResult res;
    EnvelopeTrainer t(default_filter(), quiet(20));
    ASSERT_EQ(t.run(c, res), Status::Ok);
    for (double v : res.reference) ASSERT_EQ(v, 0.0);
    cout << "  ✓ zero reference envelope" << endl;
}

int main() {
    cout << "========================================" << endl;
    cout << "Envelope trainer tests" << endl;
    cout << "========================================" << endl;

    test_empty_and_zero_count();
    test_single_signal();
    test_clamp();
    test_first_n_and_order();
    test_length_mismatch();
    test_parallel_matches_sequential();
    test_all_zero_corpus();

    cout << "\n✓ All trainer tests passed" << endl;
    return 0;
}
