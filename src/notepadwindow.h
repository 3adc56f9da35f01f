/**
 * Notepad - A classic plain-text editor for the desktop
 *
 * notepadwindow.h - Editor window with its menus and status bar
 *
 * Copyright (c) 2026 tobsai
 * Licensed under MIT License
 */

#ifndef NOTEPADWINDOW_H
#define NOTEPADWINDOW_H

#include <QMainWindow>
#include <QDateTime>
#include <QLocale>
#include "cursorlocation.h"
#include "textfinder.h"

class QAction;
class QLabel;
class QMenu;
class QPlainTextEdit;
class Document;
class FindDialog;
class Preferences;

/**
 * @brief The NotepadWindow class is one editor window.
 *
 * It wires a QPlainTextEdit to the menu actions, keeps the title and status
 * bar current, and asks before discarding unsaved edits. Application-level
 * requests (new window, opening a file elsewhere, quit, About) are emitted as
 * signals for NotepadApp to handle.
 *
 * The ask*() and showError() hooks are where the window blocks on a modal
 * dialog. They are virtual so that a window can be driven without one.
 */
class NotepadWindow : public QMainWindow
{
    Q_OBJECT
    Q_PROPERTY(bool wordWrap READ isWordWrapEnabled WRITE setWordWrap)
    Q_PROPERTY(bool statusBarShown READ isStatusBarShown WRITE setStatusBarShown)

public:
    enum class SaveChoice {
        Save,
        Discard,
        Cancel
    };

    explicit NotepadWindow(Preferences *preferences, QWidget *parent = nullptr);

    bool loadFile(const QString &filePath);
    bool isEmptyAndUntitled() const;
    bool maybeSave();
    // Closes after the caller already ran maybeSave()
    bool closeConfirmed();

    Document *document() const;
    QPlainTextEdit *textEdit() const;
    FindDialog *findDialog() const;
    CursorLocation cursorLocation() const;
    QString statusText() const;
    bool isWordWrapEnabled() const;
    bool isStatusBarShown() const;

    static QString timeDateString(const QDateTime &dateTime, const QLocale &locale = QLocale());

public slots:
    void openDocument();
    bool saveDocument();
    bool saveDocumentAs();

    void insertTimeDate();
    void showFindDialog();
    void showReplaceDialog();
    bool findNext();
    bool replaceNext();
    int replaceAll();

    void setWordWrap(bool enabled);
    void chooseFont();
    void zoomIn();
    void zoomOut();
    void zoomReset();
    void setStatusBarShown(bool shown);

signals:
    void newWindowRequested();
    void openFileRequested(const QString &filePath);
    void quitRequested();
    void aboutRequested();
    void closed();

protected:
    void closeEvent(QCloseEvent *event) override;

    virtual SaveChoice askSaveChanges();
    virtual QString askSaveFileName();
    virtual QString askOpenFileName();
    virtual bool askFont(QFont *font);
    virtual void showError(const QString &message);
    virtual void showNotFound(const QString &text);

private slots:
    void updateTitle();
    void updateCursorLocation();
    void populateWindowMenu();

private:
    void createActions();
    void createMenus();
    void createStatusBar();
    void applyPreferences();
    void applyFont(const QFont &font);
    void toggleMaximized();
    void bringAllToFront();

    Preferences *m_preferences;
    Document *m_document;
    QPlainTextEdit *m_textEdit;
    QLabel *m_positionLabel;
    FindDialog *m_findDialog;
    TextFinder m_finder;
    bool m_closeConfirmed;

    // App menu
    QAction *m_aboutAction;
    QAction *m_quitAction;

    // File menu
    QAction *m_newAction;
    QAction *m_openAction;
    QAction *m_saveAction;
    QAction *m_saveAsAction;
    QAction *m_closeAction;

    // Edit menu
    QAction *m_undoAction;
    QAction *m_redoAction;
    QAction *m_cutAction;
    QAction *m_copyAction;
    QAction *m_pasteAction;
    QAction *m_selectAllAction;
    QAction *m_findAction;
    QAction *m_findNextAction;
    QAction *m_replaceAction;
    QAction *m_timeDateAction;

    // Format menu
    QAction *m_wordWrapAction;
    QAction *m_fontAction;

    // View menu
    QAction *m_zoomInAction;
    QAction *m_zoomOutAction;
    QAction *m_zoomResetAction;
    QAction *m_statusBarAction;

    // Window menu
    QMenu *m_windowMenu;
    QAction *m_minimizeAction;
    QAction *m_maximizeAction;
    QAction *m_bringAllToFrontAction;

    static const QSize DEFAULT_SIZE;
};

#endif // NOTEPADWINDOW_H
