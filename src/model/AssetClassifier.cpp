#include "model/AssetClassifier.h"

#include <algorithm>
#include <cctype>

namespace stockcast {
namespace model {

namespace {
std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}
} // namespace

AssetClassifier::AssetClassifier()
    : AssetClassifier(defaultQuoteCurrencies()) {}

AssetClassifier::AssetClassifier(const std::vector<std::string>& quote_currencies) {
    for (const auto& quote : quote_currencies) {
        quotes_.insert(toUpper(quote));
    }
}

std::vector<std::string> AssetClassifier::defaultQuoteCurrencies() {
    return {"USD", "USDT", "USDC", "EUR", "KRW", "BTC"};
}

AssetClass AssetClassifier::classify(const std::string& symbol) const {
    const auto sep = symbol.find_last_of("-/");
    if (sep == std::string::npos || sep == 0 || sep + 1 >= symbol.size()) {
        return AssetClass::EQUITY;
    }
    const std::string quote = toUpper(symbol.substr(sep + 1));
    return quotes_.count(quote) ? AssetClass::CRYPTO : AssetClass::EQUITY;
}

} // namespace model
} // namespace stockcast
