// ved/csv_source.hpp
#pragma once

#include "ved/source.hpp"
#include "ved/config.hpp"
#include <string>
#include <vector>
#include <cstddef>

namespace ved {

struct CsvConfig {
    std::string dir;                    // *.csv dosyaları (bir dosya = bir sinyal)
    Channel     channel        = Channel::Horizontal;
    int         horizontal_col = 4;     // PRONOSTIA: hour,min,sec,usec,horiz,vert
    int         vertical_col   = 5;
    bool        verbose        = false;
};

class CsvDirSource : public ISource {
public:
    explicit CsvDirSource(const CsvConfig& cfg);

    bool ok() const { return ok_; }
    std::size_t size() const { return files_.size(); }

    // ISource
    bool get_signal(Signal& out) override;

    // Atlanan (okunamayan) satır sayısı, tüm dosyalar için toplam
    std::size_t skipped_rows() const { return skipped_; }

    // Listelenip açılamayan dosya sayısı
    std::size_t failed_files() const { return failed_; }

private:
    bool read_file(const std::string& path, Signal& out);

    CsvConfig                cfg_;
    std::vector<std::string> files_;
    std::size_t              next_    = 0;
    std::size_t              skipped_ = 0;
    std::size_t              failed_  = 0;
    bool                     ok_      = false;
};

} // namespace ved
