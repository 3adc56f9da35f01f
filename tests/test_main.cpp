/**
 * Notepad - A classic plain-text editor for the desktop
 *
 * test_main.cpp - Test runner with a headless QApplication
 *
 * Copyright (c) 2026 tobsai
 * Licensed under MIT License
 */

#include <gtest/gtest.h>
#include <QApplication>
#include <QStandardPaths>

int main(int argc, char **argv)
{
    // Widgets need a platform plugin even when nothing is drawn
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }
    QStandardPaths::setTestModeEnabled(true);

    QApplication app(argc, argv);
    app.setApplicationName("NotepadTests");
    app.setOrganizationName("Notepad");
    app.setQuitOnLastWindowClosed(false);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
