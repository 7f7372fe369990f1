#include "model/AssetClassifier.h"
#include "model/ModelCandidate.h"

#include <cassert>
#include <iostream>

using namespace stockcast;
using model::AssetClassifier;
using model::CandidateTable;

int main() {
    AssetClassifier classifier;

    assert(classifier.classify("BTC-USD") == AssetClass::CRYPTO);
    assert(classifier.classify("eth-usdt") == AssetClass::CRYPTO);
    assert(classifier.classify("SOL/USDC") == AssetClass::CRYPTO);
    assert(classifier.classify("KRW-BTC") == AssetClass::CRYPTO);
    assert(classifier.classify("SPY") == AssetClass::EQUITY);
    assert(classifier.classify("AAPL") == AssetClass::EQUITY);
    // 주식 클래스 표기
    assert(classifier.classify("BRK-B") == AssetClass::EQUITY);
    assert(classifier.classify("-USD") == AssetClass::EQUITY);
    assert(classifier.classify("BTC-") == AssetClass::EQUITY);

    // 설정으로 quote 통화를 바꾸면 분류도 바뀐다
    AssetClassifier custom({"jpy"});
    assert(custom.classify("BTC-JPY") == AssetClass::CRYPTO);
    assert(custom.classify("BTC-USD") == AssetClass::EQUITY);

    assert(CandidateTable::symbolToken("BTC-USD") == "btc_usd");
    assert(CandidateTable::symbolToken("SOL/USDC") == "sol_usdc");
    assert(CandidateTable::symbolToken("SPY") == "spy");

    // 기본 후보 순서
    {
        auto table = CandidateTable::defaults();
        auto crypto = table.expand("BTC-USD", AssetClass::CRYPTO, "/models");
        assert(crypto.size() == 2);
        assert(crypto[0].name == "crypto_specific");
        assert(crypto[0].file_name == "btc_usd_model.json");
        assert(crypto[0].location == std::filesystem::path("/models/btc_usd_model.json"));
        assert(crypto[0].priority == 0);
        assert(crypto[1].file_name == "spy_model.json");
        assert(crypto[1].generation == FeatureGeneration::ORIGINAL);

        auto equity = table.expand("AAPL", AssetClass::EQUITY, "/models");
        assert(equity.size() == 2);
        assert(equity[0].file_name == "enhanced_spy_model.json");
        assert(equity[0].generation == FeatureGeneration::EXTENDED);
        assert(equity[1].file_name == "spy_model.json");
        assert(equity[1].generation == FeatureGeneration::ORIGINAL);
        assert(equity[1].asset_class == AssetClass::EQUITY);
    }

    assert(parseFeatureGeneration("Extended") == FeatureGeneration::EXTENDED);
    assert(parseFeatureGeneration("original") == FeatureGeneration::ORIGINAL);
    assert(!parseFeatureGeneration("v3"));

    std::cout << "[TEST] AssetClassifier PASSED\n";
    return 0;
}
