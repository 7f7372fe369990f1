#include "data/FileBarSource.h"
#include "data/BarHistory.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace stockcast {
namespace data {

FileBarSource::FileBarSource(std::filesystem::path data_dir)
    : data_dir_(std::move(data_dir)) {}

std::optional<std::filesystem::path> FileBarSource::locate(const std::string& symbol) const {
    // 파일명에는 '/'를 쓸 수 없으므로 "BTC/USD" -> "BTC-USD"
    std::string stem = symbol;
    std::replace(stem.begin(), stem.end(), '/', '-');

    std::string upper = stem;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    for (const auto& name : {stem, upper}) {
        for (const char* ext : {".csv", ".json"}) {
            const auto candidate = data_dir_ / (name + ext);
            std::error_code ec;
            if (std::filesystem::is_regular_file(candidate, ec)) {
                return candidate;
            }
        }
    }
    return std::nullopt;
}

std::vector<Bar> FileBarSource::fetchBars(const std::string& symbol, int lookback) {
    if (symbol.empty()) {
        throw DataUnavailableError("empty symbol");
    }
    if (lookback <= 0) {
        throw DataUnavailableError("lookback must be positive");
    }

    const auto file = locate(symbol);
    if (!file) {
        throw DataUnavailableError("no bar file for " + symbol + " in " + data_dir_.string());
    }

    auto bars = file->extension() == ".json"
        ? BarHistory::loadJSON(file->string())
        : BarHistory::loadCSV(file->string());

    if (bars.empty()) {
        throw DataUnavailableError("no usable bars in " + file->string());
    }

    LOG_DEBUG("{}: {} bars available, keeping last {}", symbol, bars.size(), lookback);
    return BarHistory::tail(bars, static_cast<size_t>(lookback));
}

} // namespace data
} // namespace stockcast
