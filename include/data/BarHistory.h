#pragma once

#include <string>
#include <vector>

#include "common/Types.h"

namespace stockcast {
namespace data {

class BarHistory {
public:
    // timestamp,open,high,low,close,volume (header, BOM and quoted cells tolerated)
    // Throws DataUnavailableError if the file cannot be opened.
    static std::vector<Bar> loadCSV(const std::string& file_path);

    // Array of {timestamp|t, open|o, high|h, low|l, close|c, volume|v}
    // Throws DataUnavailableError if the file cannot be opened or parsed.
    static std::vector<Bar> loadJSON(const std::string& file_path);

    // Sort ascending and keep the newest bar for a duplicated timestamp.
    static void normalize(std::vector<Bar>& bars);

    static std::vector<Bar> tail(const std::vector<Bar>& bars, size_t count);
};

} // namespace data
} // namespace stockcast
