#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "model/ModelCandidate.h"

namespace stockcast {

class Config {
public:
    static Config& getInstance();

    // 파일이 없으면 기본값 유지, JSON이 깨져 있으면 예외 (fail closed)
    void load(const std::string& config_path);

    // 테스트/CLI용: 이미 파싱된 JSON 적용
    void apply(const nlohmann::json& j);

    // 기본값으로 되돌림
    void reset();

    std::string getModelDir() const { return model_dir_; }
    std::string getDataDir() const { return data_dir_; }
    std::string getLogDir() const { return log_dir_; }
    std::string getLogLevel() const { return log_level_; }
    void setModelDir(const std::string& v) { model_dir_ = v; }
    void setDataDir(const std::string& v) { data_dir_ = v; }

    // Remote artifact resolution (empty base URL disables it)
    std::string getRemoteBaseUrl() const { return remote_base_url_; }
    long getFetchTimeoutSeconds() const { return fetch_timeout_seconds_; }
    long getFetchConnectTimeoutSeconds() const { return fetch_connect_timeout_seconds_; }

    int getLookbackBars() const { return lookback_bars_; }
    std::vector<std::string> getCryptoQuoteCurrencies() const { return crypto_quote_currencies_; }

    model::CandidateTable getCandidateTable() const { return candidate_table_; }

private:
    Config();

    std::string model_dir_;
    std::string data_dir_;
    std::string log_dir_;
    std::string log_level_;

    std::string remote_base_url_;
    long fetch_timeout_seconds_;
    long fetch_connect_timeout_seconds_;

    int lookback_bars_;
    std::vector<std::string> crypto_quote_currencies_;

    model::CandidateTable candidate_table_;
};

} // namespace stockcast
