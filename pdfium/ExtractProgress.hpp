#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <string>

namespace cjkreflow::pdf {
    // Pages per progress report:
    //   <= 20 pages  → every page
    //   <= 100 pages → every 3
    //   <= 300 pages → every 5
    //   otherwise    → ~5% steps
    [[nodiscard]] constexpr int ProgressBlockSize(const int pageCount) noexcept {
        if (pageCount <= 20)
            return 1;
        if (pageCount <= 100)
            return 3;
        if (pageCount <= 300)
            return 5;
        return std::max(1, pageCount / 20);
    }

    // First and last page are always reported.
    [[nodiscard]] constexpr bool ShouldReportProgress(const int pageIndex, const int pageCount) noexcept {
        if (pageCount <= 0)
            return false;
        if (pageIndex == 0 || pageIndex == pageCount - 1)
            return true;
        return pageIndex % ProgressBlockSize(pageCount) == 0;
    }

    [[nodiscard]] constexpr int ProgressPercent(const int pageIndex, const int pageCount) noexcept {
        if (pageCount <= 0)
            return 0;
        return static_cast<int>((static_cast<long long>(pageIndex) + 1) * 100 / pageCount);
    }

    // Emoji progress bar:
    // 🟩 = U+1F7E9 = F0 9F 9F A9
    // ⬜ = U+2B1C  = E2 AC 9C
    inline std::string BuildProgressBar(int percent, const int width = 10) {
        percent = std::clamp(percent, 0, 100);

        const int filled = (percent * width) / 100;

        static constexpr auto GREEN = "\xF0\x9F\x9F\xA9";
        static constexpr auto WHITE = "\xE2\xAC\x9C";

        std::string bar;
        bar.reserve(static_cast<std::size_t>(width) * 4);

        for (int i = 0; i < filled; ++i)
            bar += GREEN;
        for (int i = filled; i < width; ++i)
            bar += WHITE;

        return bar;
    }

    struct PageLoopResult {
        int pagesDone = 0;
        bool cancelled = false;
    };

    // Drives a per-page extraction. The cancel flag is polled before every
    // page; onReport(pageIndex, percent, bar) runs on reporting pages only.
    template<typename PageFn, typename ReportFn>
    PageLoopResult RunPageLoop(const int pageCount,
                               const std::atomic<bool> *cancelFlag,
                               PageFn &&onPage,
                               ReportFn &&onReport) {
        PageLoopResult result;

        for (int i = 0; i < pageCount; ++i) {
            if (cancelFlag && cancelFlag->load(std::memory_order_relaxed)) {
                result.cancelled = true;
                break;
            }

            onPage(i);
            ++result.pagesDone;

            if (ShouldReportProgress(i, pageCount)) {
                const int percent = ProgressPercent(i, pageCount);
                onReport(i, percent, BuildProgressBar(percent));
            }
        }

        return result;
    }
} // namespace cjkreflow::pdf
