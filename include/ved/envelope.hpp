#pragma once
#include "ved/status.hpp"
#include "ved/utils.hpp"

namespace ved {

// Analitik sinyal (Hilbert) genliği: |x + j*H{x}|
class EnvelopeExtractor {
public:
    Status extract(const Signal& in, Envelope& out) const;
};

} // namespace ved
