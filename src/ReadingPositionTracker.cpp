#include "ReadingPositionTracker.h"

ReadingPositionTracker::ReadingPositionTracker(std::string bookId, ProgressSink& sink, long long nowMs)
    : bookId_(std::move(bookId)), sink_(sink), lastSave_(nowMs), nextPeriodic_(nowMs + PERIODIC_MS) {}

// builds the next save and starts a new read-time interval
ProgressSnapshot ReadingPositionTracker::snapshot(long long nowMs) {
    ProgressSnapshot snap;
    snap.bookId        = bookId_;
    snap.location      = location_;
    snap.percentage    = percentage_;
    snap.readTimeDelta = nowMs > lastSave_ ? (nowMs - lastSave_) / 1000 : 0;

    lastSave_ = nowMs;
    totalReadTime_ += snap.readTimeDelta;
    return snap;
}

void ReadingPositionTracker::navigate(double percentage, const std::string& location, long long nowMs) {
    hasLocalProgress_ = true;
    percentage_ = percentage;
    if (!location.empty())
        location_ = location;

    // progress bar refresh at most once a second
    if (displayDue_ < 0)
        displayDue_ = nowMs + DISPLAY_INTERVAL_MS;

    // every navigation pushes the save back
    debounceDue_ = nowMs + DEBOUNCE_MS;
}

void ReadingPositionTracker::tick(long long nowMs) {
    if (displayDue_ >= 0 && nowMs >= displayDue_) {
        displayDue_ = -1;
        displayPercentage_ = percentage_;
    }

    if (debounceDue_ >= 0 && nowMs >= debounceDue_) {
        debounceDue_ = -1;
        sink_.save(snapshot(nowMs));
    }

    if (nowMs >= nextPeriodic_) {
        // missed intervals collapse into one save
        while (nextPeriodic_ <= nowMs)
            nextPeriodic_ += PERIODIC_MS;
        if (percentage_ > 0)
            sink_.save(snapshot(nowMs));
    }
}

void ReadingPositionTracker::hide(long long nowMs) {
    if (location_.empty() && percentage_ <= 0)
        return;     // nothing worth keeping

    debounceDue_ = -1;
    sink_.saveBeacon(snapshot(nowMs));
}

bool ReadingPositionTracker::applyServerProgress(double percentage, const std::string& location) {
    if (hasLocalProgress_)
        return false;

    percentage_ = percentage;
    displayPercentage_ = percentage;
    location_ = location;
    return true;
}
