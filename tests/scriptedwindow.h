/**
 * Notepad - A classic plain-text editor for the desktop
 *
 * scriptedwindow.h - Editor window with scripted dialog answers
 *
 * Copyright (c) 2026 tobsai
 * Licensed under MIT License
 */

#ifndef SCRIPTEDWINDOW_H
#define SCRIPTEDWINDOW_H

#include "notepadapp.h"
#include "notepadwindow.h"
#include <QByteArray>
#include <QFile>
#include <QFont>
#include <QStringList>

/**
 * @brief NotepadWindow whose modal dialogs return preset answers and whose
 * alerts are recorded instead of shown.
 */
class ScriptedWindow : public NotepadWindow
{
public:
    explicit ScriptedWindow(Preferences *preferences, QWidget *parent = nullptr)
        : NotepadWindow(preferences, parent)
    {
    }

    SaveChoice saveChoice = SaveChoice::Cancel;
    QString saveFileName;
    QString openFileName;
    QFont chosenFont;
    bool fontChosen = false;

    int savePrompts = 0;
    QStringList errors;
    QStringList notFound;

protected:
    SaveChoice askSaveChanges() override
    {
        ++savePrompts;
        return saveChoice;
    }

    QString askSaveFileName() override { return saveFileName; }
    QString askOpenFileName() override { return openFileName; }

    bool askFont(QFont *font) override
    {
        if (fontChosen) {
            *font = chosenFont;
        }
        return fontChosen;
    }

    void showError(const QString &message) override { errors.append(message); }
    void showNotFound(const QString &text) override { notFound.append(text); }
};

/**
 * @brief NotepadApp that creates ScriptedWindow instances.
 */
class ScriptedApp : public NotepadApp
{
public:
    explicit ScriptedApp(Preferences *preferences)
        : NotepadApp(preferences)
    {
    }

    static ScriptedWindow *scripted(NotepadWindow *window)
    {
        return static_cast<ScriptedWindow *>(window);
    }

protected:
    NotepadWindow *makeWindow() override
    {
        return new ScriptedWindow(preferences());
    }
};

inline bool writeTestFile(const QString &path, const QByteArray &data)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) return false;
    return file.write(data) == data.size();
}

inline QByteArray readTestFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) return QByteArray();
    return file.readAll();
}

#endif // SCRIPTEDWINDOW_H
