#ifndef BOOKPAGED_READINGPOSITIONTRACKER_H
#define BOOKPAGED_READINGPOSITIONTRACKER_H

#include <string>

// one progress write, as sent to POST /progress
struct ProgressSnapshot {
    std::string bookId;
    std::string location;           // empty = not known yet (left out of the request)
    double percentage = 0;
    long long readTimeDelta = 0;    // whole seconds since the previous save
};

// where saves go.  Both calls must return without waiting for the network.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void save(const ProgressSnapshot& snap) = 0;
    virtual void saveBeacon(const ProgressSnapshot& snap) = 0;     // page is going away
};

//
// ReadingPositionTracker: turns a stream of navigation events into a few
// progress saves.
//   navigate() only touches memory.  Saves happen from tick(): 2 s after the
//   last navigation, and every 30 s while the reader has moved past 0%.
//   hide() sends a last beacon.  Once the reader has navigated, server
//   progress that arrives late is ignored.
//   Single threaded; all times are epoch ms supplied by the caller.
//
class ReadingPositionTracker {
public:
    static constexpr long long DISPLAY_INTERVAL_MS = 1000;
    static constexpr long long DEBOUNCE_MS         = 2000;
    static constexpr long long PERIODIC_MS         = 30000;

    ReadingPositionTracker(std::string bookId, ProgressSink& sink, long long nowMs);

    void navigate(double percentage, const std::string& location, long long nowMs);
    void tick(long long nowMs);
    void hide(long long nowMs);

    // RETURNS: false (and changes nothing) once local progress exists
    bool applyServerProgress(double percentage, const std::string& location);

    double percentage() const { return percentage_; }
    double displayPercentage() const { return displayPercentage_; }
    const std::string& location() const { return location_; }
    long long totalReadTime() const { return totalReadTime_; }
    bool hasLocalProgress() const { return hasLocalProgress_; }
    bool savePending() const { return debounceDue_ >= 0; }

private:
    std::string bookId_;
    ProgressSink& sink_;

    double percentage_        = 0;
    double displayPercentage_ = 0;
    std::string location_;
    bool hasLocalProgress_    = false;

    long long lastSave_;
    long long totalReadTime_  = 0;

    long long displayDue_     = -1;     // -1 = timer not armed
    long long debounceDue_    = -1;
    long long nextPeriodic_;

    ProgressSnapshot snapshot(long long nowMs);
};

#endif // BOOKPAGED_READINGPOSITIONTRACKER_H
