#pragma once

#include <QObject>
#include <atomic>

namespace rlk {

/// Fixed-interval sleep that keeps the calling thread's event loop running
/// (so long-polling continues) and can be interrupted by cancel().
///
/// cancel() may be called from any thread. Once cancelled, every sleep()
/// returns false immediately until reset().
class CancellableWait : public QObject {
    Q_OBJECT
public:
    explicit CancellableWait(QObject* parent = nullptr);

    /// Returns false if cancelled before or during the wait.
    bool sleep(int ms);

    void cancel();
    void reset() { cancelled_ = false; }
    bool isCancelled() const { return cancelled_; }

signals:
    void cancelled();

private:
    std::atomic_bool cancelled_{false};
};

} // namespace rlk
