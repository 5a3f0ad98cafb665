/*!
 * @file        systemlog.cppm
 * @brief       Bounded in-memory log sink for BoxLink components.
 *
 * @details
 * Collects `[Tag] message` lines produced by the codec, assembler,
 * supervisor and monitor. Lines are kept in a bounded ring so a long
 * running session never grows without limit, and each append is announced
 * through Qt signals so front ends can mirror the log.
 *
 * @author      Kambiz Asadzadeh
 * @since       09 Feb 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QObject>
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module boxlink.core.systemlog;
#endif

#ifdef Q_MOC_RUN
#define BOXLINK_MODULE_EXPORT
#else
#define BOXLINK_MODULE_EXPORT export
#endif

/**
 * @class SystemLog
 * @brief Ring buffer of tagged log lines shared by one core instance.
 *
 * @details
 * Instances are owned explicitly by the caller and passed to components as
 * a nullable pointer. Consecutive duplicate lines are collapsed.
 */
BOXLINK_MODULE_EXPORT class SystemLog : public QObject
{
    Q_OBJECT
    Q_PROPERTY(QStringList lines READ lines NOTIFY logsChanged)
    Q_PROPERTY(bool enabled READ isEnabled WRITE setEnabled NOTIFY enabledChanged)

public:
    /**
     * @brief Construct an empty log.
     * @param maxLines Ring capacity.
     * @param parent Optional QObject parent.
     */
    explicit SystemLog(int maxLines = 500, QObject *parent = nullptr);

    /**
     * @brief Append one line unless logging is disabled or it repeats the last line.
     * @param message Line text, conventionally prefixed with a `[Tag]`.
     */
    void append(const QString& message);

    /**
     * @brief Snapshot of retained lines, oldest first.
     * @return Retained lines.
     */
    QStringList lines() const;

    //! Drop every retained line.
    void clear();

    bool isEnabled() const;
    void setEnabled(bool enabled);

    int maxLines() const;

signals:
    //! Emitted once per accepted line.
    void lineAppended(const QString& line);
    //! Emitted when the retained set changes.
    void logsChanged();
    //! Emitted when logging is switched on or off.
    void enabledChanged();

private:
    QStringList m_lines;   //!< Retained lines.
    int m_maxLines = 500;  //!< Ring capacity.
    bool m_enabled = true; //!< Master switch.
};

/**
 * @brief Append to an optional log.
 * @param log Target log or nullptr.
 * @param message Line text.
 */
BOXLINK_MODULE_EXPORT void appendSystemLog(SystemLog *log, const QString& message);

#include "systemlog.moc"
