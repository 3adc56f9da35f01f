/**
 * Notepad - A classic plain-text editor for the desktop
 *
 * document.cpp - Backing file of an editor window
 *
 * Copyright (c) 2026 tobsai
 * Licensed under MIT License
 */

#include "document.h"
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextCodec>
#include <QDebug>

const QString Document::UNTITLED_NAME = "Untitled";
const QString Document::DEFAULT_FILE_NAME = "Untitled.txt";

namespace {

const char UTF8_BOM[] = "\xEF\xBB\xBF";

} // namespace

Document::Document(QObject *parent)
    : QObject(parent)
    , m_modified(false)
    , m_lineEnding(LineEnding::Unix)
    , m_byteOrderMark(false)
{
}

QString Document::currentFile() const
{
    return m_currentFile;
}

QString Document::displayName() const
{
    if (m_currentFile.isEmpty()) {
        return UNTITLED_NAME;
    }
    return QFileInfo(m_currentFile).fileName();
}

QString Document::suggestedFileName() const
{
    if (m_currentFile.isEmpty()) {
        return DEFAULT_FILE_NAME;
    }
    return QFileInfo(m_currentFile).fileName();
}

bool Document::isModified() const
{
    return m_modified;
}

bool Document::isUntitled() const
{
    return m_currentFile.isEmpty();
}

Document::LineEnding Document::lineEnding() const
{
    return m_lineEnding;
}

bool Document::hasByteOrderMark() const
{
    return m_byteOrderMark;
}

QString Document::errorString() const
{
    return m_errorString;
}

void Document::setModified(bool modified)
{
    if (m_modified != modified) {
        m_modified = modified;
        emit modifiedChanged();
    }
}

void Document::newDocument()
{
    setCurrentFile(QString());
    m_lineEnding = LineEnding::Unix;
    m_byteOrderMark = false;
    m_errorString.clear();
    setModified(false);
}

bool Document::loadDocument(const QString &filePath, QString *content)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        reportError(tr("Unable to open file: %1").arg(file.errorString()));
        return false;
    }

    QByteArray data = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        reportError(tr("Unable to open file: %1").arg(file.errorString()));
        return false;
    }
    file.close();

    const bool byteOrderMark = data.startsWith(UTF8_BOM);
    if (byteOrderMark) {
        data.remove(0, 3);
    }

    QTextCodec *codec = QTextCodec::codecForName("UTF-8");
    QTextCodec::ConverterState state;
    QString text = codec->toUnicode(data.constData(), data.size(), &state);
    if (state.invalidChars > 0 || state.remainingChars > 0) {
        reportError(tr("Unable to open file: %1").arg(tr("The file is not valid UTF-8 text.")));
        return false;
    }

    m_lineEnding = detectLineEnding(text);
    m_byteOrderMark = byteOrderMark;
    text.replace(QLatin1String("\r\n"), QLatin1String("\n"));
    text.replace(QLatin1Char('\r'), QLatin1Char('\n'));

    if (content) {
        *content = text;
    }

    m_errorString.clear();
    setCurrentFile(filePath);
    setModified(false);

    qDebug() << "Opened" << filePath;
    emit documentLoaded(displayName());

    return true;
}

bool Document::saveDocument(const QString &content)
{
    if (m_currentFile.isEmpty()) {
        reportError(tr("Unable to save file: %1").arg(tr("No file path specified")));
        return false;
    }
    return saveDocumentAs(m_currentFile, content);
}

bool Document::saveDocumentAs(const QString &filePath, const QString &content)
{
    if (filePath.isEmpty()) {
        reportError(tr("Unable to save file: %1").arg(tr("No file path specified")));
        return false;
    }

    QString text = content;
    switch (m_lineEnding) {
    case LineEnding::Windows:
        text.replace(QLatin1Char('\n'), QLatin1String("\r\n"));
        break;
    case LineEnding::ClassicMac:
        text.replace(QLatin1Char('\n'), QLatin1Char('\r'));
        break;
    case LineEnding::Unix:
        break;
    }

    QByteArray data = text.toUtf8();
    if (m_byteOrderMark) {
        data.prepend(UTF8_BOM);
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        reportError(tr("Unable to save file: %1").arg(file.errorString()));
        return false;
    }

    if (file.write(data) != data.size()) {
        const QString reason = file.errorString();
        file.cancelWriting();
        reportError(tr("Unable to save file: %1").arg(reason));
        return false;
    }

    if (!file.commit()) {
        reportError(tr("Unable to save file: %1").arg(file.errorString()));
        return false;
    }

    m_errorString.clear();
    setCurrentFile(filePath);
    setModified(false);

    qDebug() << "Saved" << filePath;
    emit documentSaved();

    return true;
}

Document::LineEnding Document::detectLineEnding(const QString &text)
{
    for (int i = 0; i < text.length(); ++i) {
        if (text.at(i) == QLatin1Char('\n')) {
            return LineEnding::Unix;
        }
        if (text.at(i) == QLatin1Char('\r')) {
            if (i + 1 < text.length() && text.at(i + 1) == QLatin1Char('\n')) {
                return LineEnding::Windows;
            }
            return LineEnding::ClassicMac;
        }
    }
    return LineEnding::Unix;
}

void Document::setCurrentFile(const QString &filePath)
{
    if (m_currentFile != filePath) {
        m_currentFile = filePath;
        emit currentFileChanged();
    }
}

void Document::reportError(const QString &message)
{
    qWarning() << message;
    m_errorString = message;
    emit errorOccurred(message);
}
