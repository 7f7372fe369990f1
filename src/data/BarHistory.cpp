#include "data/BarHistory.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace stockcast {
namespace data {

namespace {
std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // UTF-8 BOM (첫 셀)
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

// 긴 키("close")가 우선, 없으면 약어("c")
const nlohmann::json& field(const nlohmann::json& item, const char* name, const char* short_name) {
    if (item.contains(name)) return item.at(name);
    return item.at(short_name);
}
} // namespace

std::vector<Bar> BarHistory::loadCSV(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw DataUnavailableError("failed to open CSV file: " + file_path);
    }

    std::vector<Bar> bars;
    std::string line;
    size_t skipped = 0;

    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 6) continue;
        if (row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0])) && row[0][0] != '-') {
            // header
            continue;
        }

        try {
            bars.emplace_back(std::stoll(row[0]),
                              std::stod(row[1]),
                              std::stod(row[2]),
                              std::stod(row[3]),
                              std::stod(row[4]),
                              std::llround(std::stod(row[5])));
        } catch (const std::exception& e) {
            ++skipped;
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    normalize(bars);
    LOG_DEBUG("Loaded {} bars from {} ({} rows skipped)", bars.size(), file_path, skipped);
    return bars;
}

std::vector<Bar> BarHistory::loadJSON(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw DataUnavailableError("failed to open JSON file: " + file_path);
    }

    std::vector<Bar> bars;
    try {
        nlohmann::json j;
        file >> j;
        if (!j.is_array()) {
            throw DataUnavailableError(file_path + " is not a JSON array of bars");
        }
        for (const auto& item : j) {
            bars.emplace_back(field(item, "timestamp", "t").get<long long>(),
                              field(item, "open", "o").get<double>(),
                              field(item, "high", "h").get<double>(),
                              field(item, "low", "l").get<double>(),
                              field(item, "close", "c").get<double>(),
                              std::llround(field(item, "volume", "v").get<double>()));
        }
    } catch (const nlohmann::json::exception& e) {
        throw DataUnavailableError("error parsing JSON file " + file_path + ": " + e.what());
    }

    normalize(bars);
    LOG_DEBUG("Loaded {} bars from {}", bars.size(), file_path);
    return bars;
}

void BarHistory::normalize(std::vector<Bar>& bars) {
    std::stable_sort(bars.begin(), bars.end(), [](const Bar& a, const Bar& b) {
        return a.timestamp < b.timestamp;
    });

    std::vector<Bar> unique;
    unique.reserve(bars.size());
    for (const auto& bar : bars) {
        if (!unique.empty() && unique.back().timestamp == bar.timestamp) {
            unique.back() = bar;
        } else {
            unique.push_back(bar);
        }
    }
    bars.swap(unique);
}

std::vector<Bar> BarHistory::tail(const std::vector<Bar>& bars, size_t count) {
    if (bars.size() <= count) return bars;
    return std::vector<Bar>(bars.end() - static_cast<std::ptrdiff_t>(count), bars.end());
}

} // namespace data
} // namespace stockcast
