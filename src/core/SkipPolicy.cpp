#include "SkipPolicy.hpp"
#include <system_error>

namespace LazyWebp
{
    bool SkipPolicy::shouldConvert(const fs::path& inputPath, const fs::path& outputPath) {
        std::error_code ec;

        if (!fs::exists(outputPath, ec) || ec) return true;

        std::uintmax_t outSize = fs::file_size(outputPath, ec);
        if (ec || outSize == 0) return true;

        auto inTime = fs::last_write_time(inputPath, ec);
        if (ec) return true;
        auto outTime = fs::last_write_time(outputPath, ec);
        if (ec) return true;

        return inTime > outTime;
    }

} // namespace LazyWebp
