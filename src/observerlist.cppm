/*!
 * @file        observerlist.cppm
 * @brief       Observer list with isolated dispatch.
 *
 * @details
 * Holds callbacks registered by front ends (proxy state, monitor status,
 * engine stop). Dispatch is an explicit step that walks a snapshot of the
 * registered callbacks; a callback that throws is logged and skipped so the
 * remaining observers are still notified.
 *
 * @author      Kambiz Asadzadeh
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QString>

#include <exception>
#include <functional>
#include <utility>
#include <vector>

export module boxlink.core.observerlist;
import boxlink.core.systemlog;

/**
 * @class ObserverList
 * @brief Ordered set of callbacks sharing one signature.
 * @tparam Args Arguments passed to each observer on dispatch.
 */
export template <typename... Args>
class ObserverList
{
public:
    using Callback = std::function<void(Args...)>;

    /**
     * @brief Construct a list.
     * @param tag Log tag used when an observer fails.
     */
    explicit ObserverList(QString tag = QStringLiteral("Observer"))
        : m_tag(std::move(tag))
    {
    }

    /**
     * @brief Register a callback.
     * @param callback Callback invoked on every dispatch.
     * @return Handle accepted by remove().
     */
    int add(Callback callback)
    {
        const int handle = m_nextHandle++;
        m_entries.push_back({handle, std::move(callback)});
        return handle;
    }

    /**
     * @brief Unregister a callback.
     * @param handle Value returned by add().
     * @return True when a callback was removed.
     */
    bool remove(int handle)
    {
        for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
            if (it->handle == handle) {
                m_entries.erase(it);
                return true;
            }
        }
        return false;
    }

    void clear()
    {
        m_entries.clear();
    }

    int size() const
    {
        return static_cast<int>(m_entries.size());
    }

    /**
     * @brief Invoke every registered callback in registration order.
     * @param log Optional sink for observer failures.
     * @param args Arguments forwarded to each callback.
     * @return Number of observers that completed without throwing.
     */
    int notify(SystemLog *log, Args... args) const
    {
        // Observers may add or remove entries while being notified.
        const std::vector<Entry> snapshot = m_entries;

        int delivered = 0;
        for (const Entry& entry : snapshot) {
            if (!entry.callback) {
                continue;
            }
            try {
                entry.callback(args...);
                ++delivered;
            } catch (const std::exception& error) {
                appendSystemLog(log, QStringLiteral("[%1] Observer %2 failed: %3")
                    .arg(m_tag)
                    .arg(entry.handle)
                    .arg(QString::fromUtf8(error.what())));
            } catch (...) {
                appendSystemLog(log, QStringLiteral("[%1] Observer %2 failed with an unknown exception")
                    .arg(m_tag)
                    .arg(entry.handle));
            }
        }
        return delivered;
    }

private:
    struct Entry {
        int handle = 0;
        Callback callback;
    };

    QString m_tag;                //!< Log tag for failures.
    std::vector<Entry> m_entries; //!< Registered callbacks.
    int m_nextHandle = 1;         //!< Next handle value.
};
