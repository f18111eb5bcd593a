#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

#include "event_bus.hpp"
#include "journal_store.hpp"

// Performs journal appends on its own thread so the tick path never blocks on disk.
// A record whose append fails stays at the head of the queue and is retried.
class JournalWriter {
  public:
    // Stores one record and returns its id (the daemon passes JournalStore::Append).
    using AppendFn = std::function<int64_t(const SessionRecord &)>;

    JournalWriter(AppendFn append, EventBus &bus,
                  std::chrono::milliseconds retryEvery = std::chrono::seconds(30));
    ~JournalWriter();

    JournalWriter(const JournalWriter &) = delete;
    JournalWriter &operator=(const JournalWriter &) = delete;

    void Submit(const SessionRecord &record);

    // Waits until the queue is empty. False on timeout (e.g. storage still failing).
    bool Flush(std::chrono::milliseconds timeout);
    size_t Pending() const;

  private:
    void Loop();
    bool WriteOne(const SessionRecord &record);

  private:
    AppendFn m_Append;
    EventBus &m_Bus;
    const std::chrono::milliseconds m_RetryEvery;

    mutable std::mutex m_Mutex;
    std::condition_variable m_Cv;
    std::condition_variable m_DrainedCv;
    std::deque<SessionRecord> m_Queue;
    bool m_Busy = false;
    uint64_t m_SubmitSeq = 0;
    std::atomic<bool> m_StopRequested{false};
    std::thread m_Thread;
};
