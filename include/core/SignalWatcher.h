/*
 * SignalWatcher.h - Synchronous handling of termination signals
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef SIGNALWATCHER_H
#define SIGNALWATCHER_H

// No direct includes - all includes should be in tgstream.h

namespace TGStream {
namespace Core {

/**
 * @brief Waits for signals on a dedicated thread with sigwait()
 *
 * The constructor blocks the signals in the calling thread, so it must run
 * before any other thread is started; every thread created afterwards
 * inherits the mask and only the watcher ever sees them.
 */
class SignalWatcher {
public:
    explicit SignalWatcher(const std::vector<int>& signals);

    /**
     * @brief Releases the watcher and joins its thread
     */
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    /**
     * @brief Start waiting; handler runs on the watcher thread, at most once
     * @throws std::logic_error if already started
     */
    void start(std::function<void(int)> handler);

    /**
     * @brief Stop waiting without running the handler and join the thread
     *
     * Returns once the handler, if it is running, has completed. Safe to
     * call repeatedly and before start().
     */
    void release();

    /**
     * @return The signal that was handled, 0 if none
     */
    int caught() const { return m_caught.load(); }

private:
    void waitLoop();

    sigset_t m_set;
    int m_wake_signal;
    std::function<void(int)> m_handler;
    std::thread m_thread;
    std::mutex m_mutex;
    bool m_waiting = false;
    std::atomic<bool> m_released{false};
    std::atomic<int> m_caught{0};
};

} // namespace Core
} // namespace TGStream

#endif // SIGNALWATCHER_H
