#pragma once

#include <string>
#include <vector>

#include "common/Types.h"

namespace stockcast {
namespace data {

// 시세 공급자. 오래된 것 -> 최신 순서의 일봉을 돌려준다.
class IBarSource {
public:
    virtual ~IBarSource() = default;

    // At most lookback bars, ascending by timestamp.
    // Throws DataUnavailableError when the symbol has no usable data.
    virtual std::vector<Bar> fetchBars(const std::string& symbol, int lookback) = 0;
};

} // namespace data
} // namespace stockcast
