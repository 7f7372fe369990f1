#include "common/Config.h"
#include "common/PathUtils.h"
#include "model/AssetClassifier.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace stockcast {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

std::vector<model::CandidateSpec> parseCandidateList(const nlohmann::json& list, const std::string& label) {
    if (!list.is_array()) {
        throw std::runtime_error("models." + label + " must be an array");
    }

    std::vector<model::CandidateSpec> specs;
    for (const auto& item : list) {
        model::CandidateSpec spec;
        spec.file_pattern = trimCopy(item.value("file", ""));
        if (spec.file_pattern.empty()) {
            throw std::runtime_error("models." + label + ": candidate without 'file'");
        }
        spec.name = item.value("name", spec.file_pattern);

        const std::string generation = item.value("generation", "original");
        auto parsed = parseFeatureGeneration(generation);
        if (!parsed) {
            throw std::runtime_error("models." + label + ": unknown generation '" + generation + "'");
        }
        spec.generation = *parsed;

        if (item.contains("input_dimension")) {
            spec.input_dimension = item["input_dimension"].get<std::size_t>();
        }
        specs.push_back(std::move(spec));
    }
    return specs;
}
}

Config::Config() {
    reset();
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    model_dir_ = "models";
    data_dir_ = "data";
    log_dir_ = "logs";
    log_level_ = "info";
    remote_base_url_.clear();
    fetch_timeout_seconds_ = 60;
    fetch_connect_timeout_seconds_ = 10;
    lookback_bars_ = 90;
    crypto_quote_currencies_ = model::AssetClassifier::defaultQuoteCurrencies();
    candidate_table_ = model::CandidateTable::defaults();
}

void Config::load(const std::string& path) {
    const std::filesystem::path config_path = utils::PathUtils::resolve(path);

    std::cerr << "설정 파일 경로: " << config_path << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cerr << "경고: 설정 파일을 찾을 수 없습니다: " << config_path << std::endl;
        std::cerr << "기본값을 사용합니다." << std::endl;
    } else {
        std::ifstream file(config_path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open config file: " + config_path.string());
        }

        nlohmann::json j;
        try {
            file >> j;
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Malformed config file " + config_path.string() + ": " + e.what());
        }
        apply(j);
    }

    const std::string env_url = readEnvVar("STOCKCAST_MODEL_BASE_URL");
    if (!env_url.empty()) {
        remote_base_url_ = env_url;
    }
}

void Config::apply(const nlohmann::json& j) {
    if (j.contains("paths")) {
        auto& p = j["paths"];
        model_dir_ = p.value("model_dir", model_dir_);
        data_dir_ = p.value("data_dir", data_dir_);
        log_dir_ = p.value("log_dir", log_dir_);
    }

    if (j.contains("model_fetch")) {
        auto& f = j["model_fetch"];
        remote_base_url_ = trimCopy(f.value("remote_base_url", remote_base_url_));
        fetch_timeout_seconds_ = f.value("timeout_seconds", fetch_timeout_seconds_);
        fetch_connect_timeout_seconds_ = f.value("connect_timeout_seconds", fetch_connect_timeout_seconds_);
    }

    if (j.contains("prediction")) {
        lookback_bars_ = j["prediction"].value("lookback_bars", lookback_bars_);
        if (lookback_bars_ <= 0) {
            throw std::runtime_error("prediction.lookback_bars must be positive");
        }
    }

    if (j.contains("routing") && j["routing"].contains("crypto_quote_currencies")) {
        crypto_quote_currencies_ = j["routing"]["crypto_quote_currencies"].get<std::vector<std::string>>();
    }

    if (j.contains("models")) {
        auto& m = j["models"];
        if (m.contains("equity")) {
            candidate_table_.setCandidates(AssetClass::EQUITY, parseCandidateList(m["equity"], "equity"));
        }
        if (m.contains("crypto")) {
            candidate_table_.setCandidates(AssetClass::CRYPTO, parseCandidateList(m["crypto"], "crypto"));
        }
    }

    if (j.contains("logging")) {
        log_level_ = j["logging"].value("level", log_level_);
    }
}

} // namespace stockcast
