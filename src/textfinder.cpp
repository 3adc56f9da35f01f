/**
 * Notepad - A classic plain-text editor for the desktop
 *
 * textfinder.cpp - Find and replace on a text widget
 *
 * Copyright (c) 2026 tobsai
 * Licensed under MIT License
 */

#include "textfinder.h"
#include <QPlainTextEdit>
#include <QTextCursor>
#include <QTextDocument>

QTextDocument::FindFlags FindOptions::flags() const
{
    QTextDocument::FindFlags result;
    if (matchCase) result |= QTextDocument::FindCaseSensitively;
    if (wholeWords) result |= QTextDocument::FindWholeWords;
    if (backward) result |= QTextDocument::FindBackward;
    return result;
}

TextFinder::TextFinder(QPlainTextEdit *editor)
    : m_editor(editor)
{
}

bool TextFinder::findNext(const QString &text, const FindOptions &options)
{
    if (text.isEmpty()) return false;

    if (m_editor->find(text, options.flags())) {
        return true;
    }
    if (!options.wrapAround) {
        return false;
    }

    // Retry from the other end of the document
    const QTextCursor saved = m_editor->textCursor();
    QTextCursor cursor = saved;
    cursor.movePosition(options.backward ? QTextCursor::End : QTextCursor::Start);
    m_editor->setTextCursor(cursor);

    if (m_editor->find(text, options.flags())) {
        return true;
    }

    m_editor->setTextCursor(saved);
    return false;
}

bool TextFinder::replace(const QString &text, const QString &replacement, const FindOptions &options)
{
    if (text.isEmpty()) return false;

    bool replaced = false;
    if (hasMatchSelected(text, options)) {
        QTextCursor cursor = m_editor->textCursor();
        cursor.insertText(replacement);
        if (options.backward) {
            cursor.setPosition(cursor.position() - replacement.length());
        }
        m_editor->setTextCursor(cursor);
        replaced = true;
    }

    findNext(text, options);
    return replaced;
}

int TextFinder::replaceAll(const QString &text, const QString &replacement, const FindOptions &options)
{
    if (text.isEmpty()) return 0;

    FindOptions forward = options;
    forward.backward = false;

    QTextDocument *document = m_editor->document();
    QTextCursor editCursor(document);
    editCursor.beginEditBlock();

    int count = 0;
    QTextCursor found(document);
    for (;;) {
        found = document->find(text, found, forward.flags());
        if (found.isNull()) break;
        found.insertText(replacement);
        ++count;
    }

    editCursor.endEditBlock();
    return count;
}

bool TextFinder::hasMatchSelected(const QString &text, const FindOptions &options) const
{
    const QTextCursor cursor = m_editor->textCursor();
    if (!cursor.hasSelection()) return false;

    const Qt::CaseSensitivity cs = options.matchCase ? Qt::CaseSensitive : Qt::CaseInsensitive;
    return cursor.selectedText().compare(text, cs) == 0;
}
