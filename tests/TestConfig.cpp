#include "common/Config.h"
#include "TestSupport.h"

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

using namespace stockcast;

int main() {
    Config& config = Config::getInstance();
    config.reset();

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    // 1. Defaults
    assert(config.getModelDir() == "models");
    assert(config.getLookbackBars() == 90);
    assert(config.getRemoteBaseUrl().empty());
    assert(config.getFetchTimeoutSeconds() == 60);
    assert(config.getCryptoQuoteCurrencies().size() == 6);
    {
        auto table = config.getCandidateTable();
        assert(table.specsFor(AssetClass::EQUITY).size() == 2);
        assert(table.specsFor(AssetClass::EQUITY)[0].generation == FeatureGeneration::EXTENDED);
    }

    // 2. Missing file keeps defaults
    config.load("/nonexistent/stockcast/config.json");
    assert(config.getLookbackBars() == 90);

    // 3. Overrides
    config.apply({
        {"paths", {{"model_dir", "/srv/models"}, {"data_dir", "/srv/data"}}},
        {"model_fetch", {{"remote_base_url", " https://example.invalid/models/ "}, {"timeout_seconds", 5}}},
        {"prediction", {{"lookback_bars", 120}}},
        {"routing", {{"crypto_quote_currencies", {"USD", "JPY"}}}},
        {"models", {{"crypto", {
            {{"name", "generic"}, {"file", "spy_model.json"}, {"generation", "original"}, {"input_dimension", 30}}
        }}}},
        {"logging", {{"level", "debug"}}}
    });
    assert(config.getModelDir() == "/srv/models");
    assert(config.getDataDir() == "/srv/data");
    assert(config.getLogDir() == "logs");
    assert(config.getRemoteBaseUrl() == "https://example.invalid/models/");
    assert(config.getFetchTimeoutSeconds() == 5);
    assert(config.getFetchConnectTimeoutSeconds() == 10);
    assert(config.getLookbackBars() == 120);
    assert(config.getCryptoQuoteCurrencies().size() == 2);
    assert(config.getLogLevel() == "debug");
    {
        auto table = config.getCandidateTable();
        const auto& crypto = table.specsFor(AssetClass::CRYPTO);
        assert(crypto.size() == 1);
        assert(crypto[0].name == "generic");
        assert(crypto[0].input_dimension && *crypto[0].input_dimension == 30);
        // equity 목록은 그대로
        assert(table.specsFor(AssetClass::EQUITY).size() == 2);
    }

    // 4. Invalid values fail closed
    {
        auto expectThrow = [&](const nlohmann::json& j) {
            bool thrown = false;
            try {
                config.apply(j);
            } catch (const std::exception&) {
                thrown = true;
            }
            assert(thrown);
        };
        expectThrow({{"prediction", {{"lookback_bars", 0}}}});
        expectThrow({{"models", {{"equity", {{{"name", "x"}}}}}}});
        expectThrow({{"models", {{"equity", {{{"file", "x.json"}, {"generation", "v9"}}}}}}});
        expectThrow({{"models", {{"equity", "spy_model.json"}}}});
    }

    // 5. File on disk + environment override
    {
        testing::TempDir dir("config");
        testing::writeText(dir / "config.json", R"({"prediction": {"lookback_bars": 75}})");
        testing::writeText(dir / "broken.json", R"({"prediction": )");

        setenv("STOCKCAST_MODEL_BASE_URL", "https://mirror.invalid/", 1);
        config.reset();
        config.load((dir / "config.json").string());
        assert(config.getLookbackBars() == 75);
        assert(config.getRemoteBaseUrl() == "https://mirror.invalid/");
        unsetenv("STOCKCAST_MODEL_BASE_URL");

        bool thrown = false;
        try {
            config.load((dir / "broken.json").string());
        } catch (const std::runtime_error&) {
            thrown = true;
        }
        assert(thrown);
    }

    config.reset();
    std::cout << "[TEST] Config Test PASSED!" << std::endl;
    return 0;
}
