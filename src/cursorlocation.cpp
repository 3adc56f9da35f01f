/**
 * Notepad - A classic plain-text editor for the desktop
 *
 * cursorlocation.cpp - Line and column of the text cursor
 *
 * Copyright (c) 2026 tobsai
 * Licensed under MIT License
 */

#include "cursorlocation.h"
#include <QTextBlock>
#include <QTextBoundaryFinder>
#include <QTextCursor>

namespace {

int graphemeCount(const QString &text)
{
    if (text.isEmpty()) return 0;

    QTextBoundaryFinder finder(QTextBoundaryFinder::Grapheme, text);
    int count = 0;
    while (finder.toNextBoundary() != -1) {
        ++count;
    }
    return count;
}

} // namespace

CursorLocation CursorLocation::fromOffset(const QString &text, int offset)
{
    offset = qBound(0, offset, text.length());

    // lastIndexOf() with a negative start searches from the end
    int lineStart = 0;
    if (offset > 0) {
        lineStart = text.lastIndexOf(QLatin1Char('\n'), offset - 1) + 1;
    }

    CursorLocation location;
    location.line = text.leftRef(offset).count(QLatin1Char('\n')) + 1;
    location.column = graphemeCount(text.mid(lineStart, offset - lineStart)) + 1;
    return location;
}

CursorLocation CursorLocation::fromCursor(const QTextCursor &cursor)
{
    const QTextBlock block = cursor.block();
    CursorLocation location = fromOffset(block.text(), cursor.positionInBlock());
    location.line = block.blockNumber() + 1;
    return location;
}

QString CursorLocation::toStatusText() const
{
    return QStringLiteral("  Ln %1, Col %2").arg(line).arg(column);
}
