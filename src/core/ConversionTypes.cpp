#include "ConversionTypes.hpp"
#include <thread>

namespace LazyWebp
{
    int ConversionConfig::defaultConcurrency() {
        int cpus = static_cast<int>(std::thread::hardware_concurrency());
        return std::clamp(cpus - 1, 1, 4);
    }

    ConversionConfig ConversionConfig::make(int quality, std::optional<int> maxConcurrency) {
        ConversionConfig config;
        config.quality = std::clamp(quality, 1, 100);
        config.maxConcurrency = maxConcurrency ? std::max(*maxConcurrency, 1) : defaultConcurrency();
        return config;
    }

} // namespace LazyWebp
