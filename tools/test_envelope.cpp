/**
 * Unit tests for the analytic-signal envelope:
 * - non-negativity and length
 * - zero / empty input
 * - pure tone and amplitude-modulated tone demodulation
 */

#include <iostream>
#include <cstdlib>
#include <vector>
#include <cmath>
#include <random>

#include "ved/envelope.hpp"

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

static const double FS = 25600.0;

void test_non_negative() {
    TEST("Envelope is non-negative and length-preserving");

    EnvelopeExtractor ext;
    mt19937 rng(42);
    normal_distribution<double> nd(0.0, 1.0);
    for (size_t n : {1u, 2u, 7u, 256u, 2560u, 2561u}) {
        Signal x(n);
        for (auto& v : x) v = nd(rng);
        Envelope e;
        ASSERT_EQ(ext.extract(x, e), Status::Ok);
        ASSERT_EQ(e.size(), n);
        for (double v : e) ASSERT_TRUE(v >= 0.0);
    }
    cout << "  ✓ random signals of even and odd length" << endl;
}

void test_zero_and_empty() {
    TEST("Zero and empty input");

    EnvelopeExtractor ext;
    Signal zeros(1000, 0.0);
    Envelope e;
    ASSERT_EQ(ext.extract(zeros, e), Status::Ok);
    ASSERT_EQ(e.size(), zeros.size());
    for (double v : e) ASSERT_EQ(v, 0.0);
    cout << "  ✓ zero input -> zero envelope" << endl;

    Signal empty;
    ASSERT_EQ(ext.extract(empty, e), Status::Ok);
    ASSERT_TRUE(e.empty());
    cout << "  ✓ empty input -> empty envelope" << endl;
}

void test_pure_tone() {
    TEST("Pure tone envelope equals its amplitude");

    EnvelopeExtractor ext;
    // 5 kHz, 0.1 s: tam sayıda periyot
    const double amp = 3.5;
    Signal x(2560);
    for (size_t i = 0; i < x.size(); ++i) x[i] = amp * cos(2.0 * M_PI * 5000.0 * i / FS + 0.3);
    Envelope e;
    ASSERT_EQ(ext.extract(x, e), Status::Ok);
    for (double v : e) ASSERT_NEAR(v, amp, 1e-9);
    cout << "  ✓ envelope == " << amp << " at every sample" << endl;
}

void test_am_demodulation() {
    TEST("Amplitude modulation is recovered");

    EnvelopeExtractor ext;
    // 5 kHz taşıyıcı, 100 Hz modülasyon, derinlik 0.5
    Signal x(2560);
    Signal expected(2560);
    for (size_t i = 0; i < x.size(); ++i) {
        const double t = i / FS;
        expected[i] = 1.0 + 0.5 * cos(2.0 * M_PI * 100.0 * t);
        x[i] = expected[i] * sin(2.0 * M_PI * 5000.0 * t);
    }
    Envelope e;
    ASSERT_EQ(ext.extract(x, e), Status::Ok);
    double max_err = 0.0;
    for (size_t i = 0; i < e.size(); ++i) max_err = max(max_err, abs(e[i] - expected[i]));
    ASSERT_TRUE(max_err < 1e-9);
    cout << "  ✓ max error vs. modulation: " << max_err << endl;
}

int main() {
    cout << "========================================" << endl;
    cout << "Envelope extractor tests" << endl;
    cout << "========================================" << endl;

    test_non_negative();
    test_zero_and_empty();
    test_pure_tone();
    test_am_demodulation();

    cout << "\n✓ All envelope tests passed" << endl;
    return 0;
}
