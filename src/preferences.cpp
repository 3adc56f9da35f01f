/**
 * Notepad - A classic plain-text editor for the desktop
 *
 * preferences.cpp - Persisted user preferences implementation
 *
 * Copyright (c) 2026 tobsai
 * Licensed under MIT License
 */

#include "preferences.h"
#include <QSettings>
#include <QFontDatabase>
#include <QDebug>

const qreal Preferences::DEFAULT_FONT_SIZE = 12.0;
const qreal Preferences::MIN_FONT_SIZE = 4.0;
const qreal Preferences::ZOOM_STEP = 2.0;

const QString Preferences::KEY_FONT_NAME = "Notepad/FontName";
const QString Preferences::KEY_FONT_SIZE = "Notepad/FontSize";
const QString Preferences::KEY_WORD_WRAP = "Notepad/WordWrap";
const QString Preferences::KEY_SHOW_STATUS = "Notepad/ShowStatus";

Preferences::Preferences(QObject *parent)
    : QObject(parent)
    , m_settings(new QSettings(this))
{
    qDebug() << "Preferences stored in" << m_settings->fileName();
}

Preferences::Preferences(const QString &fileName, QObject *parent)
    : QObject(parent)
    , m_settings(new QSettings(fileName, QSettings::IniFormat, this))
{
}

QString Preferences::fontFamily() const
{
    const QString family = m_settings->value(KEY_FONT_NAME).toString();
    return family.isEmpty() ? defaultFontFamily() : family;
}

qreal Preferences::fontSize() const
{
    bool ok = false;
    const qreal size = m_settings->value(KEY_FONT_SIZE).toReal(&ok);
    if (!ok || size < MIN_FONT_SIZE) {
        return DEFAULT_FONT_SIZE;
    }
    return size;
}

QFont Preferences::font() const
{
    QFont font(fontFamily());
    font.setPointSizeF(fontSize());
    font.setStyleHint(QFont::Monospace);
    return font;
}

bool Preferences::wordWrap() const
{
    return m_settings->value(KEY_WORD_WRAP, false).toBool();
}

bool Preferences::statusBarVisible() const
{
    // Absent key means visible
    return m_settings->value(KEY_SHOW_STATUS, true).toBool();
}

void Preferences::setFont(const QString &family, qreal pointSize)
{
    pointSize = qMax(MIN_FONT_SIZE, pointSize);
    if (family == fontFamily() && qFuzzyCompare(pointSize, fontSize())) {
        return;
    }

    m_settings->setValue(KEY_FONT_NAME, family);
    m_settings->setValue(KEY_FONT_SIZE, pointSize);
    emit fontChanged();
}

void Preferences::setFont(const QFont &font)
{
    setFont(font.family(), font.pointSizeF());
}

void Preferences::setWordWrap(bool enabled)
{
    if (wordWrap() != enabled) {
        m_settings->setValue(KEY_WORD_WRAP, enabled);
        emit wordWrapChanged();
    }
}

void Preferences::setStatusBarVisible(bool visible)
{
    if (statusBarVisible() != visible) {
        m_settings->setValue(KEY_SHOW_STATUS, visible);
        emit statusBarVisibleChanged();
    }
}

QString Preferences::fileName() const
{
    return m_settings->fileName();
}

void Preferences::sync()
{
    m_settings->sync();
    if (m_settings->status() != QSettings::NoError) {
        qWarning() << "Could not write preferences to" << m_settings->fileName();
    }
}

qreal Preferences::zoomedIn(qreal pointSize)
{
    return pointSize + ZOOM_STEP;
}

qreal Preferences::zoomedOut(qreal pointSize)
{
    return qMax(MIN_FONT_SIZE, pointSize - ZOOM_STEP);
}

QString Preferences::defaultFontFamily()
{
    return QFontDatabase::systemFont(QFontDatabase::FixedFont).family();
}
