/**
 * Notepad - A classic plain-text editor for the desktop
 *
 * preferences.h - Persisted user preferences
 *
 * Copyright (c) 2026 tobsai
 * Licensed under MIT License
 */

#ifndef PREFERENCES_H
#define PREFERENCES_H

#include <QObject>
#include <QString>
#include <QFont>

class QSettings;

/**
 * @brief The Preferences class holds the settings shared by all windows.
 *
 * Font, word wrap and status bar visibility are kept in the platform settings
 * store and written through on every change. Windows read them when they are
 * created.
 */
class Preferences : public QObject
{
    Q_OBJECT
    Q_PROPERTY(QString fontFamily READ fontFamily NOTIFY fontChanged)
    Q_PROPERTY(qreal fontSize READ fontSize NOTIFY fontChanged)
    Q_PROPERTY(bool wordWrap READ wordWrap WRITE setWordWrap NOTIFY wordWrapChanged)
    Q_PROPERTY(bool statusBarVisible READ statusBarVisible WRITE setStatusBarVisible NOTIFY statusBarVisibleChanged)

public:
    explicit Preferences(QObject *parent = nullptr);
    explicit Preferences(const QString &fileName, QObject *parent = nullptr);

    // Property getters
    QString fontFamily() const;
    qreal fontSize() const;
    QFont font() const;
    bool wordWrap() const;
    bool statusBarVisible() const;

    // Property setters
    void setFont(const QString &family, qreal pointSize);
    void setFont(const QFont &font);
    void setWordWrap(bool enabled);
    void setStatusBarVisible(bool visible);

    QString fileName() const;
    void sync();

    // Zoom steps
    static qreal zoomedIn(qreal pointSize);
    static qreal zoomedOut(qreal pointSize);
    static QString defaultFontFamily();

    static const qreal DEFAULT_FONT_SIZE;
    static const qreal MIN_FONT_SIZE;
    static const qreal ZOOM_STEP;

signals:
    void fontChanged();
    void wordWrapChanged();
    void statusBarVisibleChanged();

private:
    QSettings *m_settings;

    static const QString KEY_FONT_NAME;
    static const QString KEY_FONT_SIZE;
    static const QString KEY_WORD_WRAP;
    static const QString KEY_SHOW_STATUS;
};

#endif // PREFERENCES_H
