#include "ved/envelope_store.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <limits>

namespace ved {

bool save_envelope(const std::string& path, const Envelope& env) {
    std::ofstream out(path);
    if (!out) {
        std::fprintf(stderr, "[STORE] cannot write %s\n", path.c_str());
        return false;
    }
    out << std::setprecision(std::numeric_limits<double>::max_digits10);
    for (double v : env) out << v << '\n';
    out.flush();
    if (!out) {
        std::fprintf(stderr, "[STORE] write error on %s\n", path.c_str());
        return false;
    }
    return true;
}

std::optional<Envelope> load_envelope(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        std::fprintf(stderr, "[STORE] cannot open %s\n", path.c_str());
        return std::nullopt;
    }
    Envelope env;
    std::string line;
    size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (line.empty() || line == "\r") continue;
        char* end = nullptr;
        const double v = std::strtod(line.c_str(), &end);
        while (end != line.c_str() && std::isspace(static_cast<unsigned char>(*end))) ++end;
        if (end == line.c_str() || *end != '\0') {
            std::fprintf(stderr, "[STORE] %s:%zu: not a number\n", path.c_str(), lineno);
            return std::nullopt;
        }
        // Zarf genliği: sonlu ve negatif olmayan
        if (!std::isfinite(v) || v < 0.0) {
            std::fprintf(stderr, "[STORE] %s:%zu: invalid envelope value %s\n",
                         path.c_str(), lineno, line.c_str());
            return std::nullopt;
        }
        env.push_back(v);
    }
    return env;
}

} // namespace ved
