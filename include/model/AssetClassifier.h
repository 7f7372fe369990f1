#pragma once

#include <set>
#include <string>
#include <vector>

#include "common/Types.h"

namespace stockcast {
namespace model {

// "BASE-QUOTE" / "BASE/QUOTE" 형태이고 QUOTE가 알려진 통화면 CRYPTO, 그 외 EQUITY.
// "BRK-B" 같은 주식 클래스 표기는 QUOTE가 목록에 없으므로 EQUITY로 남는다.
class AssetClassifier {
public:
    AssetClassifier();
    explicit AssetClassifier(const std::vector<std::string>& quote_currencies);

    AssetClass classify(const std::string& symbol) const;

    static std::vector<std::string> defaultQuoteCurrencies();

private:
    std::set<std::string> quotes_;
};

} // namespace model
} // namespace stockcast
