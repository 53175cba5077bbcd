#include "CancellableWait.hpp"
#include <QEventLoop>
#include <QTimer>

namespace rlk {

CancellableWait::CancellableWait(QObject* parent) : QObject(parent) {}

bool CancellableWait::sleep(int ms)
{
    if (cancelled_)
        return false;

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    connect(this, &CancellableWait::cancelled, &loop, &QEventLoop::quit);
    timer.start(ms);
    // cancel() may have landed between the check above and the connect.
    if (cancelled_)
        return false;
    loop.exec();
    return !cancelled_;
}

void CancellableWait::cancel()
{
    cancelled_ = true;
    emit cancelled();
}

} // namespace rlk
