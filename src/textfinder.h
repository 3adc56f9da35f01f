/**
 * Notepad - A classic plain-text editor for the desktop
 *
 * textfinder.h - Find and replace on a text widget
 *
 * Copyright (c) 2026 tobsai
 * Licensed under MIT License
 */

#ifndef TEXTFINDER_H
#define TEXTFINDER_H

#include <QString>
#include <QTextDocument>

class QPlainTextEdit;

/**
 * @brief The FindOptions struct mirrors the checkboxes of the find dialog.
 */
struct FindOptions
{
    bool matchCase = false;
    bool wholeWords = false;
    bool wrapAround = true;
    bool backward = false;

    QTextDocument::FindFlags flags() const;
};

/**
 * @brief The TextFinder class drives the search built into QPlainTextEdit.
 *
 * Matches are selected in the editor so that the user sees them and a
 * following Replace acts on them.
 */
class TextFinder
{
public:
    explicit TextFinder(QPlainTextEdit *editor);

    bool findNext(const QString &text, const FindOptions &options);
    bool replace(const QString &text, const QString &replacement, const FindOptions &options);
    int replaceAll(const QString &text, const QString &replacement, const FindOptions &options);

    bool hasMatchSelected(const QString &text, const FindOptions &options) const;

private:
    QPlainTextEdit *m_editor;
};

#endif // TEXTFINDER_H
