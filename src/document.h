/**
 * Notepad - A classic plain-text editor for the desktop
 *
 * document.h - Backing file of an editor window
 *
 * Copyright (c) 2026 tobsai
 * Licensed under MIT License
 */

#ifndef DOCUMENT_H
#define DOCUMENT_H

#include <QObject>
#include <QString>

/**
 * @brief The Document class tracks the file behind one editor window.
 *
 * The text itself lives in the window's text widget. Document knows where it
 * came from, whether it has unsaved edits, and how to read and write it as
 * UTF-8. Line endings and a byte-order mark found on load are remembered so
 * that saving writes the file back in the same shape.
 */
class Document : public QObject
{
    Q_OBJECT
    Q_PROPERTY(QString currentFile READ currentFile NOTIFY currentFileChanged)
    Q_PROPERTY(QString displayName READ displayName NOTIFY currentFileChanged)
    Q_PROPERTY(bool modified READ isModified WRITE setModified NOTIFY modifiedChanged)

public:
    enum class LineEnding {
        Unix,       // \n
        Windows,    // \r\n
        ClassicMac  // \r
    };

    explicit Document(QObject *parent = nullptr);

    // Property getters
    QString currentFile() const;
    QString displayName() const;
    QString suggestedFileName() const;
    bool isModified() const;
    bool isUntitled() const;
    LineEnding lineEnding() const;
    bool hasByteOrderMark() const;
    QString errorString() const;

    // Document operations
    bool loadDocument(const QString &filePath, QString *content);
    bool saveDocument(const QString &content);
    bool saveDocumentAs(const QString &filePath, const QString &content);

    static LineEnding detectLineEnding(const QString &text);

public slots:
    void newDocument();
    void setModified(bool modified);

signals:
    void currentFileChanged();
    void modifiedChanged();
    void documentLoaded(const QString &fileName);
    void documentSaved();
    void errorOccurred(const QString &message);

private:
    void setCurrentFile(const QString &filePath);
    void reportError(const QString &message);

    QString m_currentFile;
    bool m_modified;
    LineEnding m_lineEnding;
    bool m_byteOrderMark;
    QString m_errorString;

    static const QString UNTITLED_NAME;
    static const QString DEFAULT_FILE_NAME;
};

#endif // DOCUMENT_H
