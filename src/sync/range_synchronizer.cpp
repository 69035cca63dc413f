#include "range_synchronizer.hpp"

#include <map>
#include <set>
#include <stdexcept>

#include <etl/string.h>
#include <etl/to_string.h>

#include "logging/logging.hpp"

namespace stream_sync {

    RangeSynchronizer::RangeSynchronizer(size_t streams, size_t maxQueueDepth)
        : m_MaxQueueDepth(maxQueueDepth)
    {
        if (streams == 0 || streams > kMaxStreams) {
            throw std::invalid_argument("RangeSynchronizer: stream count must be 1..8");
        }
        m_Queues.resize(streams);
    }

    bool RangeSynchronizer::Push(size_t anchor, const proto::RangeReport& report)
    {
        if (anchor >= m_Queues.size()) {
            LOG_ERROR("Range report for unknown anchor %u dropped", static_cast<unsigned>(anchor));
            return false;
        }

        std::deque<proto::RangeReport>& queue = m_Queues[anchor];
        queue.push_back(report);

        if (m_MaxQueueDepth > 0 && queue.size() > m_MaxQueueDepth) {
            queue.pop_front();
            m_Stats.overflow_drops++;
            ReportStall(anchor);
        }
        return true;
    }

    size_t RangeSynchronizer::GetQueueDepth(size_t anchor) const
    {
        return anchor < m_Queues.size() ? m_Queues[anchor].size() : 0;
    }

    bool RangeSynchronizer::AnyQueueEmpty() const
    {
        for (const auto& queue : m_Queues) {
            if (queue.empty()) {
                return true;
            }
        }
        return false;
    }

    std::optional<uint64_t> RangeSynchronizer::FindCommonTrigger() const
    {
        // Ordered so the smallest qualifying value is found first
        std::map<uint64_t, size_t> presence;

        for (const auto& queue : m_Queues) {
            std::set<uint64_t> seen;
            for (const auto& report : queue) {
                // A value repeated inside one FIFO counts once
                if (seen.insert(report.trigger_txts).second) {
                    presence[report.trigger_txts]++;
                }
            }
        }

        for (const auto& entry : presence) {
            if (entry.second == m_Queues.size()) {
                return entry.first;
            }
        }
        return std::nullopt;
    }

    std::optional<Batch> RangeSynchronizer::TrySynchronize()
    {
        if (AnyQueueEmpty()) {
            return std::nullopt;
        }

        std::optional<uint64_t> trigger = FindCommonTrigger();
        if (!trigger) {
            return std::nullopt;
        }

        for (size_t i = 0; i < m_Queues.size(); i++) {
            auto& queue = m_Queues[i];
            uint32_t dropped = 0;
            while (!queue.empty() && queue.front().trigger_txts != *trigger) {
                queue.pop_front();
                dropped++;
            }
            if (dropped > 0) {
                m_Stats.discarded += dropped;
                LOG_DEBUG("Anchor %u: %u uncorrelated reports discarded", static_cast<unsigned>(i), dropped);
            }
        }

        if (AnyQueueEmpty()) {
            return std::nullopt;
        }

        Batch batch;
        for (auto& queue : m_Queues) {
            batch.push_back(queue.front());
            queue.pop_front();
        }

        m_Stats.batches++;
        m_StallReported = false;

        for (size_t i = 0; i < m_Queues.size(); i++) {
            LOG_VERBOSE("Anchor %u queue depth %u", static_cast<unsigned>(i), static_cast<unsigned>(m_Queues[i].size()));
        }

        return batch;
    }

    void RangeSynchronizer::ReportStall(size_t anchor)
    {
        if (m_StallReported) {
            return;
        }
        m_StallReported = true;

        etl::string<64> stalled;
        for (size_t i = 0; i < m_Queues.size(); i++) {
            if (m_Queues[i].empty()) {
                if (!stalled.empty()) {
                    stalled += ",";
                }
                etl::to_string(static_cast<uint32_t>(i), stalled, true);
            }
        }

        LOG_WARN("Anchor %u queue exceeded %u entries, oldest dropped. Silent anchors: [%s]",
                 static_cast<unsigned>(anchor), static_cast<unsigned>(m_MaxQueueDepth),
                 stalled.empty() ? "none" : stalled.c_str());
    }

}
