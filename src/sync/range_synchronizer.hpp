#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>

#include <etl/vector.h>

#include "packets.hpp"

namespace stream_sync {

    static constexpr size_t kMaxStreams = 8;

    // One report per anchor stream, ordered by anchor index, all sharing trigger_txts
    using Batch = etl::vector<proto::RangeReport, kMaxStreams>;

    struct SyncStats {
        uint32_t batches = 0;
        uint32_t discarded = 0;         // Entries that could never be correlated
        uint32_t overflow_drops = 0;    // Entries dropped by the queue depth bound
    };

    /**
     * @brief Joins the per-anchor range report streams on trigger_txts
     *
     * A batch is emitted once some trigger_txts value is present in every FIFO. When more
     * than one value qualifies, the smallest one wins. Entries in front of the matched value
     * are discarded for good.
     *
     * An anchor that stops reporting stalls every batch. With maxQueueDepth > 0 the other
     * FIFOs keep only their newest maxQueueDepth entries meanwhile, the stalled anchors are
     * reported once per stall.
     */
    class RangeSynchronizer {
    public:
        /**
         * @param streams Number of anchor FIFOs, 1..kMaxStreams
         * @param maxQueueDepth Per FIFO bound, 0 disables it
         * @throws std::invalid_argument if streams is out of range
         */
        explicit RangeSynchronizer(size_t streams, size_t maxQueueDepth = 0);

        /**
         * @brief Append a report to the FIFO of the given anchor
         * @return false if the anchor index is out of range
         */
        bool Push(size_t anchor, const proto::RangeReport& report);

        /**
         * @brief Produce at most one batch, call again until it returns std::nullopt
         */
        std::optional<Batch> TrySynchronize();

        size_t GetStreamCount() const { return m_Queues.size(); }
        size_t GetQueueDepth(size_t anchor) const;
        const SyncStats& GetStats() const { return m_Stats; }

    private:
        bool AnyQueueEmpty() const;
        std::optional<uint64_t> FindCommonTrigger() const;
        void ReportStall(size_t anchor);

        etl::vector<std::deque<proto::RangeReport>, kMaxStreams> m_Queues;
        size_t m_MaxQueueDepth;
        bool m_StallReported = false;
        SyncStats m_Stats;
    };

}
