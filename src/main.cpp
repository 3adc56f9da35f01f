/**
 * Notepad - A classic plain-text editor for the desktop
 *
 * main.cpp - Application entry point
 *
 * Copyright (c) 2026 tobsai
 * Licensed under MIT License
 */

#include <QApplication>
#include <QCommandLineParser>

#include "notepadapp.h"
#include "preferences.h"

int main(int argc, char *argv[])
{
    // Set application attributes
    QCoreApplication::setAttribute(Qt::AA_EnableHighDpiScaling);

    QApplication app(argc, argv);
    app.setApplicationName("Notepad");
    app.setApplicationVersion(APP_VERSION);
    app.setOrganizationName("Notepad");

    // Files passed by the desktop's "open with" association
    QCommandLineParser parser;
    parser.setApplicationDescription(QCoreApplication::translate("main", "A classic plain-text editor."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("files", QCoreApplication::translate("main", "Text files to open."), "[files...]");
    parser.process(app);

    // Create application components
    Preferences preferences;
    NotepadApp notepad(&preferences);

    // One window per file, or a blank window
    notepad.openFiles(parser.positionalArguments());

    const int result = app.exec();
    preferences.sync();
    return result;
}
