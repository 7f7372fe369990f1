#pragma once

#include <filesystem>
#include <optional>

#include "data/IBarSource.h"

namespace stockcast {
namespace data {

// <data_dir>/<SYMBOL>.csv 또는 <SYMBOL>.json 을 읽는다.
class FileBarSource : public IBarSource {
public:
    explicit FileBarSource(std::filesystem::path data_dir);

    std::vector<Bar> fetchBars(const std::string& symbol, int lookback) override;

    std::optional<std::filesystem::path> locate(const std::string& symbol) const;

private:
    std::filesystem::path data_dir_;
};

} // namespace data
} // namespace stockcast
