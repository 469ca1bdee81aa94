/*!
 * @file        connectivity_monitor.cppm
 * @brief       Event-driven network reachability monitoring.
 * @details     Provides a lightweight, platform-agnostic view of whether the
 *              device can currently reach the network. The reachability comes
 *              from Qt's QNetworkInformation backend when one is available and
 *              can also be driven explicitly, for example by a host that owns
 *              its own reachability source or by tests.
 *
 *              Typical use cases include:
 *              - Resuming transfers once connectivity is restored
 *              - Holding back retries while the device is offline
 *              - Honoring a user controlled offline switch
 *
 *              Waiting is event-driven: callers register a continuation with
 *              whenOnline() instead of polling.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QList>
#include <QObject>
#include <QPointer>
#include <functional>

#ifndef Q_MOC_RUN
export module porter.services.connectivity_monitor;
#endif

#ifdef Q_MOC_RUN
#define PORTER_MODULE_EXPORT
#else
#define PORTER_MODULE_EXPORT export
#endif

/**
 * @brief Online/offline state with restore notifications.
 *
 * The effective state is online when the system reports reachability and the
 * offline switch is off. A monitor without a system backend assumes the
 * system is online until told otherwise.
 */
PORTER_MODULE_EXPORT class ConnectivityMonitor : public QObject {

    Q_OBJECT

    //!< @brief Effective online state.
    Q_PROPERTY(bool online READ isOnline NOTIFY onlineChanged)

    //!< @brief User controlled offline switch.
    Q_PROPERTY(bool forcedOffline READ isForcedOffline WRITE setForcedOffline NOTIFY onlineChanged)

public:
    /**
     * @brief Construct a monitor.
     * @param parent Optional parent QObject.
     */
    explicit ConnectivityMonitor(QObject* parent = nullptr);

    //!< @brief Effective online state.
    bool isOnline() const { return m_systemOnline && !m_forcedOffline; }

    //!< @brief Reachability reported by the system or set explicitly.
    bool isSystemOnline() const { return m_systemOnline; }

    /**
     * @brief Sets the system reachability.
     *
     * Called by the system backend; hosts and tests may call it directly.
     *
     * @param online New reachability.
     */
    void setSystemOnline(bool online);

    bool isForcedOffline() const { return m_forcedOffline; }
    void setForcedOffline(bool offline);

    /**
     * @brief Attaches Qt's reachability backend.
     *
     * Loads a QNetworkInformation backend supporting reachability and
     * follows its updates.
     *
     * @return true if a backend was loaded.
     */
    bool attachSystemBackend();

    /**
     * @brief Runs a continuation once the device is online.
     *
     * Runs immediately when already online. Otherwise the continuation runs
     * once, on the next transition to online, provided the context object
     * still exists.
     *
     * @param context Lifetime guard of the continuation.
     * @param continuation Code to run.
     */
    void whenOnline(QObject* context, std::function<void()> continuation);

    //!< @brief Number of continuations waiting for connectivity.
    int pendingCount() const { return m_pending.size(); }

signals:
    void onlineChanged(bool online);

    //!< @brief Emitted on every offline to online transition.
    void connectivityRestored();

private:
    struct Pending {
        QPointer<QObject> context;
        std::function<void()> continuation;
    };

    void applyState(bool systemOnline, bool forcedOffline);

    bool m_systemOnline = true;
    bool m_forcedOffline = false;
    QList<Pending> m_pending;
};

#include "connectivity_monitor.moc"
