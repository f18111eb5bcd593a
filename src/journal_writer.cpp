#include "journal_writer.hpp"

#include <utility>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
JournalWriter::JournalWriter(AppendFn append, EventBus &bus,
                             std::chrono::milliseconds retryEvery)
    : m_Append(std::move(append)), m_Bus(bus), m_RetryEvery(retryEvery) {
    m_Thread = std::thread([this] { Loop(); });
}

// ─────────────────────────────────────
JournalWriter::~JournalWriter() {
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_StopRequested.store(true);
    }
    m_Cv.notify_all();
    if (m_Thread.joinable()) {
        m_Thread.join();
    }

    // Last attempt for anything still queued
    std::deque<SessionRecord> rest;
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        rest.swap(m_Queue);
    }
    for (const auto &record : rest) {
        try {
            m_Append(record);
        } catch (const std::exception &e) {
            spdlog::error("JournalWriter: dropping {} record at shutdown: {}",
                          PhaseName(record.phase), e.what());
        }
    }
}

// ─────────────────────────────────────
void JournalWriter::Submit(const SessionRecord &record) {
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Queue.push_back(record);
        m_SubmitSeq++;
    }
    m_Cv.notify_all();
}

// ─────────────────────────────────────
size_t JournalWriter::Pending() const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return m_Queue.size() + (m_Busy ? 1 : 0);
}

// ─────────────────────────────────────
bool JournalWriter::Flush(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_Mutex);
    return m_DrainedCv.wait_for(lock, timeout, [&] { return m_Queue.empty() && !m_Busy; });
}

// ─────────────────────────────────────
bool JournalWriter::WriteOne(const SessionRecord &record) {
    try {
        const int64_t id = m_Append(record);
        spdlog::debug("JournalWriter: stored {} record as id={}", PhaseName(record.phase), id);
        return true;
    } catch (const ValidationError &e) {
        // Retrying cannot fix an inconsistent record
        spdlog::error("JournalWriter: rejected {} record: {}", PhaseName(record.phase), e.what());
        return true;
    } catch (const PersistenceError &e) {
        spdlog::warn("JournalWriter: append failed, will retry: {}", e.what());
        m_Bus.Publish(PersistenceWarningEvent{e.what(), record});
        return false;
    } catch (const std::exception &e) {
        spdlog::error("JournalWriter: unexpected append failure, will retry: {}", e.what());
        m_Bus.Publish(PersistenceWarningEvent{e.what(), record});
        return false;
    }
}

// ─────────────────────────────────────
void JournalWriter::Loop() {
    std::unique_lock<std::mutex> lock(m_Mutex);
    while (!m_StopRequested.load()) {
        if (m_Queue.empty()) {
            m_DrainedCv.notify_all();
            m_Cv.wait(lock, [&] { return m_StopRequested.load() || !m_Queue.empty(); });
            continue;
        }

        SessionRecord record = m_Queue.front();
        m_Queue.pop_front();
        m_Busy = true;
        const uint64_t seq = m_SubmitSeq;

        lock.unlock();
        const bool ok = WriteOne(record);
        lock.lock();

        m_Busy = false;
        if (ok) {
            continue;
        }

        // Keep journal order: the failed record goes back to the head
        m_Queue.push_front(record);
        m_Cv.wait_for(lock, m_RetryEvery,
                      [&] { return m_StopRequested.load() || m_SubmitSeq != seq; });
    }
    m_DrainedCv.notify_all();
}
