#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace stockcast {
namespace model {

// 학습이 끝난 분류기. 로드 이후에는 불변이며 여러 스레드가 동시에 읽어도 안전해야 함.
class IModelArtifact {
public:
    virtual ~IModelArtifact() = default;

    // One probability per class label, in classLabels() order.
    virtual std::vector<double> predictProba(const std::vector<double>& features) const = 0;

    virtual std::size_t inputDimension() const = 0;
    virtual const std::vector<int>& classLabels() const = 0;

    // Training-order feature names; empty when the artifact does not record them.
    virtual const std::vector<std::string>& featureNames() const = 0;

    virtual std::string describe() const = 0;
};

// Deserialization hook used by the registry.
class IArtifactLoader {
public:
    virtual ~IArtifactLoader() = default;

    // Throws on unreadable or malformed artifacts.
    virtual std::shared_ptr<const IModelArtifact> load(const std::filesystem::path& location) = 0;
};

} // namespace model
} // namespace stockcast
