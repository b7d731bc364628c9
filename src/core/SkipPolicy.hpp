#pragma once

#include "Common.h"

namespace LazyWebp
{
    /**
     * @brief mtime/existence based decision whether a task needs converting.
     */
    class SkipPolicy {
    public:
        /**
         * @brief True (convert) when the output is missing, empty, or older
         * than the input. False only for a non-empty output at least as new as
         * the input. Any stat error yields true.
         */
        static bool shouldConvert(const fs::path& inputPath, const fs::path& outputPath);
    };

} // namespace LazyWebp
