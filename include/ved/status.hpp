#pragma once

namespace ved {

enum class Status {
    Ok,
    InvalidParameter,   // filtre kesimleri/derece, güven düzeyi, n==0, kısa sinyal
    EmptyCorpus,        // eğitim kümesi boş
    EmptyReference,     // referans zarf boş (ortalama/std tanımsız)
    LengthMismatch,     // zarf uzunlukları farklı, eleman bazlı ortalama alınamaz
    SourceError         // kaynak açılamadı / okunamadı
};

inline const char* to_string(Status s) {
    switch (s) {
        case Status::Ok:               return "ok";
        case Status::InvalidParameter: return "invalid parameter";
        case Status::EmptyCorpus:      return "empty corpus";
        case Status::EmptyReference:   return "empty reference";
        case Status::LengthMismatch:   return "length mismatch";
        case Status::SourceError:      return "source error";
    }
    return "unknown";
}

} // namespace ved
