/**
 * Notepad - A classic plain-text editor for the desktop
 *
 * notepadapp.h - Application delegate managing the editor windows
 *
 * Copyright (c) 2026 tobsai
 * Licensed under MIT License
 */

#ifndef NOTEPADAPP_H
#define NOTEPADAPP_H

#include <QObject>
#include <QList>
#include <QPointer>
#include <QStringList>

class NotepadWindow;
class Preferences;

/**
 * @brief The NotepadApp class owns the lifecycle of the editor windows.
 *
 * It creates windows on request, opens files handed over by the command line
 * or the desktop, and runs the unsaved-changes check of every window before
 * quitting.
 */
class NotepadApp : public QObject
{
    Q_OBJECT

public:
    explicit NotepadApp(Preferences *preferences, QObject *parent = nullptr);

    Preferences *preferences() const;
    QList<NotepadWindow *> windows() const;

public slots:
    NotepadWindow *createNewWindow();
    NotepadWindow *openFile(const QString &filePath);
    void openFiles(const QStringList &filePaths);
    bool quit();
    void showAboutPanel();

signals:
    void windowCreated(NotepadWindow *window);

protected:
    bool eventFilter(QObject *watched, QEvent *event) override;

    virtual NotepadWindow *makeWindow();

private:
    void registerWindow(NotepadWindow *window);
    void placeWindow(NotepadWindow *window) const;
    void forgetWindow(QObject *window);

    Preferences *m_preferences;
    QList<QPointer<NotepadWindow>> m_windows;

    static const int CASCADE_OFFSET = 24;
};

#endif // NOTEPADAPP_H
