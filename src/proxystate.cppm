/*!
 * @file        proxystate.cppm
 * @brief       Running/stopped state of the active proxy session.
 *
 * @details
 * Tracks which profile the session started the engine with. Front ends
 * register observers to follow changes instead of polling.
 *
 * @author      Kambiz Asadzadeh
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QString>

#include <functional>

export module boxlink.core.proxystate;
import boxlink.core.observerlist;
import boxlink.core.systemlog;

/**
 * @class ProxyState
 * @brief Session-level proxy state with change observers.
 */
export class ProxyState
{
public:
    //! Observer receiving `(running, profileId)`; profileId is -1 when stopped.
    using Observer = std::function<void(bool running, int profileId)>;

    explicit ProxyState(SystemLog *log = nullptr);

    /**
     * @brief Mark the proxy as running a profile.
     * @param profileId Profile the engine was started with.
     */
    void setRunning(int profileId);

    //! Mark the proxy as stopped.
    void setStopped();

    bool isRunning() const;

    /**
     * @brief Profile the running engine was started with.
     * @return Profile id, -1 when stopped.
     */
    int startedProfileId() const;

    int addObserver(Observer observer);
    bool removeObserver(int handle);

private:
    void update(bool running, int profileId);

    SystemLog *m_log = nullptr;          //!< Optional diagnostics sink.
    bool m_running = false;              //!< Running flag.
    int m_profileId = -1;                //!< Started profile.
    ObserverList<bool, int> m_observers {QStringLiteral("ProxyState")};
};
