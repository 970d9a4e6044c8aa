/*
 * SignalWatcher.cpp - Synchronous handling of termination signals
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tgstream.h"

namespace TGStream {
namespace Core {

SignalWatcher::SignalWatcher(const std::vector<int>& signals)
    : m_wake_signal(0)
{
    if (signals.empty()) {
        throw std::invalid_argument("SignalWatcher needs at least one signal");
    }
    sigemptyset(&m_set);
    for (int sig : signals) {
        sigaddset(&m_set, sig);
    }
    m_wake_signal = signals.front();

    int result = pthread_sigmask(SIG_BLOCK, &m_set, nullptr);
    if (result != 0) {
        throw std::runtime_error(std::string("pthread_sigmask failed: ") + std::strerror(result));
    }
}

SignalWatcher::~SignalWatcher()
{
    release();
}

void SignalWatcher::start(std::function<void(int)> handler)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_thread.joinable() || m_released) {
        throw std::logic_error("SignalWatcher::start called twice");
    }
    m_handler = std::move(handler);
    m_waiting = true;
    m_thread = std::thread(&SignalWatcher::waitLoop, this);
}

void SignalWatcher::waitLoop()
{
    System::setThisThreadName("tgs-signals");

    int sig = 0;
    int result = sigwait(&m_set, &sig);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_waiting = false;
    }
    if (result != 0) {
        Debug::error("server", "sigwait failed: ", std::strerror(result));
        return;
    }
    if (m_released) {
        return;
    }

    m_caught = sig;
    Debug::log("server", "Caught signal ", sig);
    m_handler(sig);
}

void SignalWatcher::release()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_released = true;
        // A thread already past sigwait keeps the wake signal pending
        // until it exits, where it is discarded
        if (m_waiting) {
            pthread_kill(m_thread.native_handle(), m_wake_signal);
        }
    }
    if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
        m_thread.join();
    }
}

} // namespace Core
} // namespace TGStream
