/**
 * Notepad - A classic plain-text editor for the desktop
 *
 * cursorlocation.h - Line and column of the text cursor
 *
 * Copyright (c) 2026 tobsai
 * Licensed under MIT License
 */

#ifndef CURSORLOCATION_H
#define CURSORLOCATION_H

#include <QString>

class QTextCursor;

/**
 * @brief The CursorLocation struct is the 1-based line and column shown in
 * the status bar.
 *
 * Columns count user-perceived characters, so a combining sequence or a
 * surrogate pair advances the column by one.
 */
struct CursorLocation
{
    int line;
    int column;

    static CursorLocation fromOffset(const QString &text, int offset);
    static CursorLocation fromCursor(const QTextCursor &cursor);

    QString toStatusText() const;

    bool operator==(const CursorLocation &other) const
    {
        return line == other.line && column == other.column;
    }
    bool operator!=(const CursorLocation &other) const { return !(*this == other); }
};

#endif // CURSORLOCATION_H
