/*
 * StreamRegistry.h - Process-wide table of active and recent streams
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef STREAMREGISTRY_H
#define STREAMREGISTRY_H

// No direct includes - all includes should be in tgstream.h

namespace TGStream {
namespace Stream {

/**
 * @brief Tracks every stream for the stats endpoints
 *
 * Records live in the active table until they reach a terminal status and
 * have not been updated for the grace period; prune() then moves them into
 * a bounded list of recent streams, dropping the oldest when it is full.
 * Every registration prunes first, so the active table stays bounded even
 * when nobody asks for stats.
 *
 * The table lock only covers lookups; each record has its own lock so an
 * engine updating its record never blocks other streams.
 */
class StreamRegistry {
public:
    using Clock = std::function<double()>;

    /**
     * @param grace Idle time before a terminal record retires
     * @param recent_capacity Size of the recent list
     * @param clock Unix time source used when registering
     */
    StreamRegistry(std::chrono::milliseconds grace, size_t recent_capacity,
                   Clock clock = &Core::System::unixTime);

    /**
     * @brief Add a record to the active table
     *
     * A fresh random id is assigned when record.stream_id is empty.
     * @return The record's stream id
     * @throws std::invalid_argument if the id is already registered
     */
    std::string registerStream(StreamRecord record);

    /**
     * @brief Apply fn to an active record under its lock
     * @return false if no active record has this id
     */
    bool update(const std::string& id, const std::function<void(StreamRecord&)>& fn);

    /**
     * @brief Copy of an active or recent record
     */
    std::optional<StreamRecord> get(const std::string& id) const;

    /**
     * @brief Active records, oldest first
     */
    std::vector<StreamRecord> listActive() const;

    /**
     * @brief Recently retired records, oldest first
     */
    std::vector<StreamRecord> listRecent() const;

    /**
     * @brief Retire terminal records idle for longer than the grace period
     * @param now Unix time in seconds
     * @return Number of records moved
     */
    size_t prune(double now);

    size_t activeCount() const;

    static std::string generateId();

private:
    struct Entry {
        mutable std::mutex mutex;
        StreamRecord record;
    };

    std::shared_ptr<Entry> find_unlocked(const std::string& id) const;
    size_t prune_unlocked(double now);

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::shared_ptr<Entry>> m_active;
    std::deque<StreamRecord> m_recent;
    double m_grace_seconds;
    size_t m_recent_capacity;
    Clock m_clock;
};

} // namespace Stream
} // namespace TGStream

#endif // STREAMREGISTRY_H
