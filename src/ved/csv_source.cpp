// ved/csv_source.cpp
#include "ved/csv_source.hpp"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace ved {

namespace fs = std::filesystem;

CsvDirSource::CsvDirSource(const CsvConfig& cfg) : cfg_(cfg) {
    std::error_code ec;
    if (!fs::is_directory(cfg_.dir, ec)) {
        std::fprintf(stderr, "[CSV] not a directory: %s\n", cfg_.dir.c_str());
        return;
    }
    for (const auto& ent : fs::directory_iterator(cfg_.dir, ec)) {
        std::error_code fec;
        if (ent.is_regular_file(fec) && ent.path().extension() == ".csv")
            files_.push_back(ent.path().string());
    }
    if (ec) {
        std::fprintf(stderr, "[CSV] cannot list %s: %s\n", cfg_.dir.c_str(), ec.message().c_str());
        files_.clear();
        return;
    }
    // acc_00001.csv, acc_00002.csv ... kayıt sırası
    std::sort(files_.begin(), files_.end());
    if (cfg_.verbose)
        std::printf("[CSV] %s: %zu files, channel=%s\n",
                    cfg_.dir.c_str(), files_.size(), to_string(cfg_.channel));
    ok_ = true;
}

bool CsvDirSource::read_file(const std::string& path, Signal& out) {
    std::ifstream in(path);
    if (!in) {
        std::fprintf(stderr, "[CSV] cannot open %s\n", path.c_str());
        return false;
    }
    const int col = (cfg_.channel == Channel::Horizontal) ? cfg_.horizontal_col
                                                          : cfg_.vertical_col;
    out.clear();
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty() || line == "\r") continue;
        // ',' ya da ';' ayırıcı
        int field = 0;
        size_t start = 0;
        bool found = false;
        for (size_t i = 0; i <= line.size(); ++i) {
            if (i == line.size() || line[i] == ',' || line[i] == ';') {
                if (field == col) {
                    const std::string tok = line.substr(start, i - start);
                    char* end = nullptr;
                    const double v = std::strtod(tok.c_str(), &end);
                    if (end != tok.c_str()) { out.push_back(v); found = true; }
                    break;
                }
                ++field;
                start = i + 1;
            }
        }
        if (!found) ++skipped_;
    }
    return true;
}

bool CsvDirSource::get_signal(Signal& out) {
    if (!ok_) return false;
    // Açılamayan dosya atlanır ve sayılır; kaynak bitmiş sayılmaz
    while (next_ < files_.size()) {
        const std::string& path = files_[next_++];
        if (!read_file(path, out)) {
            ++failed_;
            continue;
        }
        if (cfg_.verbose && next_ % 100 == 0)
            std::printf("[CSV] read %zu/%zu files\n", next_, files_.size());
        return true;
    }
    return false;
}

} // namespace ved
