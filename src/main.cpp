#include "common/Config.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "data/FileBarSource.h"
#include "model/AssetClassifier.h"
#include "model/HttpArtifactFetcher.h"
#include "model/ModelRegistry.h"
#include "model/TreeEnsembleModel.h"
#include "prediction/PredictionJson.h"
#include "prediction/PredictionService.h"
#include "prediction/Predictor.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace stockcast;

namespace {

constexpr int EXIT_ALL_OK = 0;
constexpr int EXIT_PREDICTION_FAILED = 1;
constexpr int EXIT_USAGE = 2;
constexpr int DISPLAY_DECIMALS = 2;

struct CliOptions {
    std::string config_path;
    std::string data_dir;
    std::string model_dir;
    bool info = false;
    std::vector<std::string> symbols;
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--config PATH] [--data-dir DIR] [--model-dir DIR] [--info] SYMBOL [SYMBOL...]\n"
              << "  --config PATH    설정 파일 (기본값: <exe>/config/config.json)\n"
              << "  --data-dir DIR   <SYMBOL>.csv / <SYMBOL>.json 위치\n"
              << "  --model-dir DIR  모델 아티팩트 위치\n"
              << "  --info           예측 대신 사용될 모델 정보 출력\n";
}

// false on usage error
bool parseArgs(int argc, char* argv[], CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            return false;
        }
        if (arg == "--info") {
            options.info = true;
            continue;
        }
        if (arg == "--config" || arg == "--data-dir" || arg == "--model-dir") {
            if (i + 1 >= argc) {
                std::cerr << arg << " requires a value\n";
                return false;
            }
            const std::string value = argv[++i];
            if (arg == "--config") options.config_path = value;
            else if (arg == "--data-dir") options.data_dir = value;
            else options.model_dir = value;
            continue;
        }
        if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
        options.symbols.push_back(arg);
    }
    return !options.symbols.empty();
}

std::filesystem::path cliPath(const std::string& value) {
    return std::filesystem::absolute(value).lexically_normal();
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    if (!parseArgs(argc, argv, options)) {
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    // 설정/구성 단계: 실패는 사용법 오류와 같은 종료 코드
    std::unique_ptr<prediction::PredictionService> service;
    try {
        auto& config = Config::getInstance();
        config.load(options.config_path.empty()
            ? (utils::PathUtils::getConfigDir() / "config.json").string()
            : cliPath(options.config_path).string());

        if (!options.data_dir.empty()) config.setDataDir(cliPath(options.data_dir).string());
        if (!options.model_dir.empty()) config.setModelDir(cliPath(options.model_dir).string());

        Logger::getInstance().initialize(utils::PathUtils::resolve(config.getLogDir()).string(),
                                         config.getLogLevel());

        std::shared_ptr<model::IArtifactFetcher> fetcher;
        if (!config.getRemoteBaseUrl().empty()) {
            fetcher = std::make_shared<model::HttpArtifactFetcher>(
                config.getRemoteBaseUrl(),
                config.getFetchTimeoutSeconds(),
                config.getFetchConnectTimeoutSeconds());
        } else {
            LOG_INFO("원격 모델 경로 미설정: placeholder 아티팩트는 건너뜀");
        }

        auto registry = std::make_shared<model::ModelRegistry>(
            config.getCandidateTable(),
            utils::PathUtils::resolve(config.getModelDir()),
            model::AssetClassifier(config.getCryptoQuoteCurrencies()),
            std::make_shared<model::TreeEnsembleLoader>(),
            fetcher);

        service = std::make_unique<prediction::PredictionService>(
            std::make_shared<data::FileBarSource>(utils::PathUtils::resolve(config.getDataDir())),
            std::make_shared<prediction::Predictor>(registry),
            config.getLookbackBars());

    } catch (const std::exception& e) {
        LOG_ERROR("설정 오류: {}", e.what());
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return EXIT_USAGE;
    }

    try {
        if (options.info) {
            bool all_ok = true;
            nlohmann::json docs = nlohmann::json::array();
            for (const auto& symbol : options.symbols) {
                auto doc = service->modelInfo(symbol);
                if (doc.contains("success") && !doc["success"].get<bool>()) all_ok = false;
                docs.push_back(std::move(doc));
            }
            std::cout << (docs.size() == 1 ? docs[0] : docs).dump(2) << std::endl;
            return all_ok ? EXIT_ALL_OK : EXIT_PREDICTION_FAILED;
        }

        const auto outcomes = service->predictBatch(options.symbols);
        bool all_ok = true;
        for (const auto& outcome : outcomes) {
            all_ok = all_ok && outcome.ok();
        }

        const auto doc = outcomes.size() == 1
            ? prediction::PredictionJson::outcome(outcomes.front(), DISPLAY_DECIMALS)
            : prediction::PredictionJson::batch(outcomes, DISPLAY_DECIMALS);
        std::cout << doc.dump(2) << std::endl;

        return all_ok ? EXIT_ALL_OK : EXIT_PREDICTION_FAILED;

    } catch (const std::exception& e) {
        LOG_ERROR("치명적 오류: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return EXIT_PREDICTION_FAILED;
    }
}
