#pragma once
#include "ved/utils.hpp"
#include <optional>
#include <string>

namespace ved {

// Satır başına bir değer, düz metin
bool save_envelope(const std::string& path, const Envelope& env);
std::optional<Envelope> load_envelope(const std::string& path);

} // namespace ved
