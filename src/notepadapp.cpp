/**
 * Notepad - A classic plain-text editor for the desktop
 *
 * notepadapp.cpp - Application delegate implementation
 *
 * Copyright (c) 2026 tobsai
 * Licensed under MIT License
 */

#include "notepadapp.h"
#include "notepadwindow.h"
#include "preferences.h"
#include <QApplication>
#include <QFileOpenEvent>
#include <QMessageBox>
#include <QScreen>
#include <QDebug>

NotepadApp::NotepadApp(Preferences *preferences, QObject *parent)
    : QObject(parent)
    , m_preferences(preferences)
{
    // Files handed over by the desktop arrive as QFileOpenEvent
    if (QCoreApplication *app = QCoreApplication::instance()) {
        app->installEventFilter(this);
    }
}

Preferences *NotepadApp::preferences() const
{
    return m_preferences;
}

QList<NotepadWindow *> NotepadApp::windows() const
{
    QList<NotepadWindow *> result;
    for (const QPointer<NotepadWindow> &window : m_windows) {
        if (window) {
            result.append(window.data());
        }
    }
    return result;
}

NotepadWindow *NotepadApp::createNewWindow()
{
    NotepadWindow *window = makeWindow();
    registerWindow(window);
    return window;
}

NotepadWindow *NotepadApp::openFile(const QString &filePath)
{
    // Load before showing so that a failed open leaves no blank window behind
    NotepadWindow *window = makeWindow();
    if (!window->loadFile(filePath)) {
        window->deleteLater();
        return nullptr;
    }

    registerWindow(window);
    return window;
}

void NotepadApp::openFiles(const QStringList &filePaths)
{
    for (const QString &filePath : filePaths) {
        openFile(filePath);
    }

    if (windows().isEmpty()) {
        createNewWindow();
    }
}

bool NotepadApp::quit()
{
    const QList<NotepadWindow *> openWindows = windows();
    for (NotepadWindow *window : openWindows) {
        if (!window->maybeSave()) {
            qDebug() << "Quit cancelled by" << window->windowTitle();
            return false;
        }
    }

    // Every window has answered, none is closed until all agree
    for (NotepadWindow *window : openWindows) {
        if (!window->closeConfirmed()) {
            return false;
        }
    }
    return true;
}

void NotepadApp::showAboutPanel()
{
    QMessageBox::about(QApplication::activeWindow(), tr("About Notepad"),
                       tr("<h3>Notepad %1</h3>"
                          "<p>A copy of the classic Windows Notepad.</p>")
                           .arg(QCoreApplication::applicationVersion()));
}

bool NotepadApp::eventFilter(QObject *watched, QEvent *event)
{
    if (event->type() == QEvent::FileOpen && watched == QCoreApplication::instance()) {
        const QString filePath = static_cast<QFileOpenEvent *>(event)->file();
        if (!filePath.isEmpty()) {
            openFile(filePath);
            return true;
        }
    }
    return QObject::eventFilter(watched, event);
}

NotepadWindow *NotepadApp::makeWindow()
{
    return new NotepadWindow(m_preferences);
}

void NotepadApp::registerWindow(NotepadWindow *window)
{
    window->setAttribute(Qt::WA_DeleteOnClose);

    connect(window, &NotepadWindow::newWindowRequested, this, &NotepadApp::createNewWindow);
    connect(window, &NotepadWindow::openFileRequested, this, &NotepadApp::openFile);
    connect(window, &NotepadWindow::quitRequested, this, &NotepadApp::quit);
    connect(window, &NotepadWindow::aboutRequested, this, &NotepadApp::showAboutPanel);
    connect(window, &NotepadWindow::closed, this, [this, window]() {
        forgetWindow(window);
    });
    connect(window, &QObject::destroyed, this, &NotepadApp::forgetWindow);

    placeWindow(window);
    m_windows.append(window);

    window->show();
    window->raise();
    window->activateWindow();

    qDebug() << "Opened window" << window->windowTitle() << "- windows:" << m_windows.size();
    emit windowCreated(window);
}

void NotepadApp::placeWindow(NotepadWindow *window) const
{
    QScreen *screen = QGuiApplication::primaryScreen();
    if (!screen) return;

    QRect frame(QPoint(), window->size());
    frame.moveCenter(screen->availableGeometry().center());

    // Cascade so that new windows do not hide the previous one
    const int offset = CASCADE_OFFSET * (m_windows.size() % 8);
    frame.translate(offset, offset);
    window->move(frame.topLeft());
}

void NotepadApp::forgetWindow(QObject *window)
{
    for (auto it = m_windows.begin(); it != m_windows.end();) {
        if (it->isNull() || it->data() == window) {
            it = m_windows.erase(it);
        } else {
            ++it;
        }
    }
}
