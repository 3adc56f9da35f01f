/**
 * Notepad - A classic plain-text editor for the desktop
 *
 * test_cursorlocation.cpp - Status bar line and column tests
 *
 * Copyright (c) 2026 tobsai
 * Licensed under MIT License
 */

#include <gtest/gtest.h>
#include "cursorlocation.h"
#include <QTextCursor>
#include <QTextDocument>

TEST(CursorLocationTest, EmptyTextIsFirstLineFirstColumn)
{
    const CursorLocation location = CursorLocation::fromOffset(QString(), 0);
    EXPECT_EQ(location.line, 1);
    EXPECT_EQ(location.column, 1);
}

TEST(CursorLocationTest, CountsLinesAndColumns)
{
    const QString text = "hello\nworld";

    CursorLocation location = CursorLocation::fromOffset(text, 8);
    EXPECT_EQ(location.line, 2);
    EXPECT_EQ(location.column, 3);

    location = CursorLocation::fromOffset(text, 5);
    EXPECT_EQ(location.line, 1);
    EXPECT_EQ(location.column, 6);
}

TEST(CursorLocationTest, OffsetAfterNewlineStartsNextLine)
{
    const QString text = "abc\n";
    const CursorLocation location = CursorLocation::fromOffset(text, 4);
    EXPECT_EQ(location.line, 2);
    EXPECT_EQ(location.column, 1);
}

TEST(CursorLocationTest, EmptyLinesAreCounted)
{
    const QString text = "a\n\n\nb";
    const CursorLocation location = CursorLocation::fromOffset(text, 4);
    EXPECT_EQ(location.line, 4);
    EXPECT_EQ(location.column, 1);
}

TEST(CursorLocationTest, OffsetIsClampedToText)
{
    const QString text = "ab";

    CursorLocation location = CursorLocation::fromOffset(text, 100);
    EXPECT_EQ(location.line, 1);
    EXPECT_EQ(location.column, 3);

    location = CursorLocation::fromOffset(text, -5);
    EXPECT_EQ(location.line, 1);
    EXPECT_EQ(location.column, 1);
}

TEST(CursorLocationTest, ColumnsCountUserPerceivedCharacters)
{
    // "e" followed by a combining acute accent, then "x"
    const QString combining = QString::fromUtf8("e\xCC\x81x");
    EXPECT_EQ(CursorLocation::fromOffset(combining, 2).column, 2);
    EXPECT_EQ(CursorLocation::fromOffset(combining, 3).column, 3);

    // U+1F600 is a surrogate pair in UTF-16
    const QString emoji = QString::fromUtf8("\xF0\x9F\x98\x80" "a");
    EXPECT_EQ(emoji.length(), 3);
    EXPECT_EQ(CursorLocation::fromOffset(emoji, 2).column, 2);
    EXPECT_EQ(CursorLocation::fromOffset(emoji, 3).column, 3);
}

TEST(CursorLocationTest, StatusTextFormat)
{
    const CursorLocation location = {3, 7};
    EXPECT_EQ(location.toStatusText(), QString("  Ln 3, Col 7"));
}

TEST(CursorLocationTest, CursorAndOffsetAgree)
{
    const QString text = "one\ntwo\n\nthree";
    QTextDocument document;
    document.setPlainText(text);

    for (int offset = 0; offset <= text.length(); ++offset) {
        QTextCursor cursor(&document);
        cursor.setPosition(offset);

        const CursorLocation fromCursor = CursorLocation::fromCursor(cursor);
        const CursorLocation fromOffset = CursorLocation::fromOffset(text, offset);
        EXPECT_EQ(fromCursor.line, fromOffset.line) << "offset " << offset;
        EXPECT_EQ(fromCursor.column, fromOffset.column) << "offset " << offset;
    }
}
