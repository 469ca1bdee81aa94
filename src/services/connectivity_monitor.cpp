module;
#include <QDebug>
#include <QNetworkInformation>
#include <QObject>
#include <utility>

module porter.services.connectivity_monitor;

ConnectivityMonitor::ConnectivityMonitor(QObject* parent)
    : QObject(parent)
{
}

void ConnectivityMonitor::setSystemOnline(bool online)
{
    applyState(online, m_forcedOffline);
}

void ConnectivityMonitor::setForcedOffline(bool offline)
{
    applyState(m_systemOnline, offline);
}

bool ConnectivityMonitor::attachSystemBackend()
{
    if (!QNetworkInformation::loadBackendByFeatures(QNetworkInformation::Feature::Reachability)) {
        qWarning() << "[Connectivity] no reachability backend available, assuming online";
        return false;
    }

    QNetworkInformation* info = QNetworkInformation::instance();
    const auto toOnline = [](QNetworkInformation::Reachability r) {
        // Unknown is treated as online; transfers will report their own failures.
        return r == QNetworkInformation::Reachability::Online
            || r == QNetworkInformation::Reachability::Unknown;
    };
    connect(info, &QNetworkInformation::reachabilityChanged, this,
            [this, toOnline](QNetworkInformation::Reachability r) { setSystemOnline(toOnline(r)); });
    setSystemOnline(toOnline(info->reachability()));
    qInfo() << "[Connectivity] using backend" << info->backendName();
    return true;
}

void ConnectivityMonitor::whenOnline(QObject* context, std::function<void()> continuation)
{
    if (!continuation) return;
    if (isOnline()) {
        continuation();
        return;
    }
    m_pending.append(Pending{ QPointer<QObject>(context), std::move(continuation) });
}

void ConnectivityMonitor::applyState(bool systemOnline, bool forcedOffline)
{
    const bool wasOnline = isOnline();
    const bool forcedChanged = m_forcedOffline != forcedOffline;
    m_systemOnline = systemOnline;
    m_forcedOffline = forcedOffline;
    const bool nowOnline = isOnline();

    if (wasOnline == nowOnline) {
        if (forcedChanged) emit onlineChanged(nowOnline);
        return;
    }

    qInfo() << "[Connectivity]" << (nowOnline ? "online" : "offline");
    emit onlineChanged(nowOnline);
    if (!nowOnline) return;

    emit connectivityRestored();
    const QList<Pending> pending = std::exchange(m_pending, {});
    for (const Pending& p : pending) {
        if (p.context) p.continuation();
    }
}
