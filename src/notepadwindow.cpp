/**
 * Notepad - A classic plain-text editor for the desktop
 *
 * notepadwindow.cpp - Editor window implementation
 *
 * Copyright (c) 2026 tobsai
 * Licensed under MIT License
 */

#include "notepadwindow.h"
#include "document.h"
#include "finddialog.h"
#include "preferences.h"
#include <QAction>
#include <QApplication>
#include <QCloseEvent>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QFontDialog>
#include <QLabel>
#include <QMenu>
#include <QMenuBar>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QStandardPaths>
#include <QStatusBar>
#include <QTextCursor>
#include <QTextDocument>
#include <QDebug>

const QSize NotepadWindow::DEFAULT_SIZE(800, 600);

namespace {

const char FILE_FILTER[] = QT_TRANSLATE_NOOP("NotepadWindow", "Text Documents (*.txt);;All Files (*)");

} // namespace

NotepadWindow::NotepadWindow(Preferences *preferences, QWidget *parent)
    : QMainWindow(parent)
    , m_preferences(preferences)
    , m_document(new Document(this))
    , m_textEdit(new QPlainTextEdit(this))
    , m_positionLabel(new QLabel(this))
    , m_findDialog(new FindDialog(this))
    , m_finder(m_textEdit)
    , m_closeConfirmed(false)
{
    resize(DEFAULT_SIZE);

    m_textEdit->setFrameShape(QFrame::NoFrame);
    m_textEdit->document()->setDocumentMargin(5);
    setCentralWidget(m_textEdit);

    createActions();
    createMenus();
    createStatusBar();

    // Document state follows the widget's own modification tracking
    connect(m_textEdit->document(), &QTextDocument::modificationChanged,
            m_document, &Document::setModified);
    connect(m_document, &Document::modifiedChanged, this, &NotepadWindow::updateTitle);
    connect(m_document, &Document::currentFileChanged, this, &NotepadWindow::updateTitle);
    connect(m_document, &Document::errorOccurred, this, &NotepadWindow::showError);

    connect(m_textEdit, &QPlainTextEdit::cursorPositionChanged,
            this, &NotepadWindow::updateCursorLocation);
    connect(m_textEdit, &QPlainTextEdit::textChanged,
            this, &NotepadWindow::updateCursorLocation);

    connect(m_findDialog, &FindDialog::findNextRequested, this, &NotepadWindow::findNext);
    connect(m_findDialog, &FindDialog::replaceRequested, this, &NotepadWindow::replaceNext);
    connect(m_findDialog, &FindDialog::replaceAllRequested, this, &NotepadWindow::replaceAll);

    applyPreferences();
    updateTitle();
    updateCursorLocation();
}

bool NotepadWindow::loadFile(const QString &filePath)
{
    QString content;
    if (!m_document->loadDocument(filePath, &content)) {
        return false;
    }

    m_textEdit->setPlainText(content);
    m_textEdit->document()->setModified(false);

    updateTitle();
    updateCursorLocation();
    return true;
}

bool NotepadWindow::isEmptyAndUntitled() const
{
    return m_textEdit->document()->isEmpty()
        && m_document->isUntitled()
        && !m_document->isModified();
}

bool NotepadWindow::maybeSave()
{
    if (!m_document->isModified()) {
        return true;
    }

    switch (askSaveChanges()) {
    case SaveChoice::Save:
        return saveDocument();
    case SaveChoice::Discard:
        return true;
    case SaveChoice::Cancel:
        break;
    }
    return false;
}

Document *NotepadWindow::document() const
{
    return m_document;
}

QPlainTextEdit *NotepadWindow::textEdit() const
{
    return m_textEdit;
}

FindDialog *NotepadWindow::findDialog() const
{
    return m_findDialog;
}

CursorLocation NotepadWindow::cursorLocation() const
{
    return CursorLocation::fromCursor(m_textEdit->textCursor());
}

QString NotepadWindow::statusText() const
{
    return m_positionLabel->text();
}

bool NotepadWindow::isWordWrapEnabled() const
{
    return m_textEdit->lineWrapMode() != QPlainTextEdit::NoWrap;
}

bool NotepadWindow::isStatusBarShown() const
{
    return !statusBar()->isHidden();
}

QString NotepadWindow::timeDateString(const QDateTime &dateTime, const QLocale &locale)
{
    return locale.toString(dateTime, QLocale::ShortFormat);
}

void NotepadWindow::openDocument()
{
    const QString filePath = askOpenFileName();
    if (filePath.isEmpty()) {
        return;
    }

    // A blank window is reused instead of leaving it behind
    if (isEmptyAndUntitled()) {
        loadFile(filePath);
        return;
    }

    emit openFileRequested(filePath);
}

bool NotepadWindow::saveDocument()
{
    if (m_document->isUntitled()) {
        return saveDocumentAs();
    }

    if (!m_document->saveDocument(m_textEdit->toPlainText())) {
        return false;
    }
    m_textEdit->document()->setModified(false);
    return true;
}

bool NotepadWindow::saveDocumentAs()
{
    const QString filePath = askSaveFileName();
    if (filePath.isEmpty()) {
        return false;
    }

    if (!m_document->saveDocumentAs(filePath, m_textEdit->toPlainText())) {
        return false;
    }
    m_textEdit->document()->setModified(false);
    return true;
}

void NotepadWindow::insertTimeDate()
{
    m_textEdit->insertPlainText(timeDateString(QDateTime::currentDateTime()));
}

void NotepadWindow::showFindDialog()
{
    m_findDialog->showFind(m_textEdit->textCursor().selectedText());
}

void NotepadWindow::showReplaceDialog()
{
    m_findDialog->showReplace(m_textEdit->textCursor().selectedText());
}

bool NotepadWindow::findNext()
{
    const QString text = m_findDialog->findText();
    if (text.isEmpty()) {
        showFindDialog();
        return false;
    }

    if (!m_finder.findNext(text, m_findDialog->options())) {
        showNotFound(text);
        return false;
    }
    return true;
}

bool NotepadWindow::replaceNext()
{
    const QString text = m_findDialog->findText();
    const FindOptions options = m_findDialog->options();

    if (m_finder.replace(text, m_findDialog->replaceText(), options)) {
        return true;
    }
    if (!m_finder.hasMatchSelected(text, options)) {
        showNotFound(text);
    }
    return false;
}

int NotepadWindow::replaceAll()
{
    const QString text = m_findDialog->findText();
    const int count = m_finder.replaceAll(text, m_findDialog->replaceText(), m_findDialog->options());
    if (count == 0) {
        showNotFound(text);
    }
    return count;
}

void NotepadWindow::setWordWrap(bool enabled)
{
    m_textEdit->setLineWrapMode(enabled ? QPlainTextEdit::WidgetWidth : QPlainTextEdit::NoWrap);
    m_wordWrapAction->setChecked(enabled);
    m_preferences->setWordWrap(enabled);
}

void NotepadWindow::chooseFont()
{
    QFont font = m_textEdit->font();
    if (askFont(&font)) {
        applyFont(font);
    }
}

void NotepadWindow::zoomIn()
{
    QFont font = m_textEdit->font();
    font.setPointSizeF(Preferences::zoomedIn(font.pointSizeF()));
    applyFont(font);
}

void NotepadWindow::zoomOut()
{
    QFont font = m_textEdit->font();
    font.setPointSizeF(Preferences::zoomedOut(font.pointSizeF()));
    applyFont(font);
}

void NotepadWindow::zoomReset()
{
    QFont font = m_textEdit->font();
    font.setPointSizeF(Preferences::DEFAULT_FONT_SIZE);
    applyFont(font);
}

void NotepadWindow::setStatusBarShown(bool shown)
{
    statusBar()->setVisible(shown);
    m_statusBarAction->setChecked(shown);
    m_preferences->setStatusBarVisible(shown);
}

bool NotepadWindow::closeConfirmed()
{
    m_closeConfirmed = true;
    if (!close()) {
        m_closeConfirmed = false;
        return false;
    }
    return true;
}

void NotepadWindow::closeEvent(QCloseEvent *event)
{
    if (!m_closeConfirmed && !maybeSave()) {
        event->ignore();
        return;
    }

    m_findDialog->close();
    event->accept();
    emit closed();
}

bool NotepadWindow::askFont(QFont *font)
{
    bool ok = false;
    const QFont chosen = QFontDialog::getFont(&ok, *font, this, tr("Font"));
    if (ok) {
        *font = chosen;
    }
    return ok;
}

NotepadWindow::SaveChoice NotepadWindow::askSaveChanges()
{
    QMessageBox box(this);
    box.setIcon(QMessageBox::Warning);
    box.setWindowTitle(tr("Notepad"));
    box.setText(tr("Do you want to save the changes?"));
    box.setInformativeText(tr("Your changes to \"%1\" will be lost if you don't save them.")
                               .arg(m_document->displayName()));
    box.setStandardButtons(QMessageBox::Save | QMessageBox::Discard | QMessageBox::Cancel);
    box.setDefaultButton(QMessageBox::Save);
    box.button(QMessageBox::Discard)->setText(tr("Don't Save"));

    switch (box.exec()) {
    case QMessageBox::Save:
        return SaveChoice::Save;
    case QMessageBox::Discard:
        return SaveChoice::Discard;
    default:
        return SaveChoice::Cancel;
    }
}

QString NotepadWindow::askSaveFileName()
{
    QString directory;
    if (m_document->isUntitled()) {
        directory = QStandardPaths::writableLocation(QStandardPaths::DocumentsLocation);
    } else {
        directory = QFileInfo(m_document->currentFile()).absolutePath();
    }

    return QFileDialog::getSaveFileName(this, tr("Save As"),
                                        QDir(directory).filePath(m_document->suggestedFileName()),
                                        tr(FILE_FILTER));
}

QString NotepadWindow::askOpenFileName()
{
    QString directory;
    if (!m_document->isUntitled()) {
        directory = QFileInfo(m_document->currentFile()).absolutePath();
    }

    return QFileDialog::getOpenFileName(this, tr("Open"), directory, tr(FILE_FILTER));
}

void NotepadWindow::showError(const QString &message)
{
    QMessageBox::critical(this, tr("Error"), message);
}

void NotepadWindow::showNotFound(const QString &text)
{
    QMessageBox::information(m_findDialog->isVisible() ? static_cast<QWidget *>(m_findDialog) : this,
                             tr("Notepad"), tr("Cannot find \"%1\"").arg(text));
}

void NotepadWindow::updateTitle()
{
    setWindowTitle(tr("[*]%1 - Notepad").arg(m_document->displayName()));
    setWindowModified(m_document->isModified());
}

void NotepadWindow::updateCursorLocation()
{
    m_positionLabel->setText(cursorLocation().toStatusText());
}

void NotepadWindow::populateWindowMenu()
{
    m_windowMenu->clear();
    m_windowMenu->addAction(m_minimizeAction);
    m_windowMenu->addAction(m_maximizeAction);
    m_windowMenu->addSeparator();
    m_windowMenu->addAction(m_bringAllToFrontAction);
    m_windowMenu->addSeparator();

    const QWidgetList widgets = QApplication::topLevelWidgets();
    for (QWidget *widget : widgets) {
        auto *window = qobject_cast<NotepadWindow *>(widget);
        if (!window || window->isHidden()) continue;

        QString title = window->windowTitle();
        title.replace(QLatin1String("[*]"), window->isWindowModified() ? QStringLiteral("*") : QString());

        QAction *action = m_windowMenu->addAction(title);
        action->setCheckable(true);
        action->setChecked(window == this);
        connect(action, &QAction::triggered, window, [window]() {
            if (window->isMinimized()) {
                window->showNormal();
            }
            window->raise();
            window->activateWindow();
        });
    }
}

void NotepadWindow::createActions()
{
    // App menu
    m_aboutAction = new QAction(tr("About Notepad"), this);
    m_aboutAction->setMenuRole(QAction::AboutRole);
    connect(m_aboutAction, &QAction::triggered, this, &NotepadWindow::aboutRequested);

    m_quitAction = new QAction(tr("&Quit"), this);
    m_quitAction->setShortcut(QKeySequence(tr("Ctrl+Q")));
    m_quitAction->setMenuRole(QAction::QuitRole);
    connect(m_quitAction, &QAction::triggered, this, &NotepadWindow::quitRequested);

    // File menu
    m_newAction = new QAction(tr("&New"), this);
    m_newAction->setShortcut(QKeySequence::New);
    connect(m_newAction, &QAction::triggered, this, &NotepadWindow::newWindowRequested);

    m_openAction = new QAction(tr("&Open..."), this);
    m_openAction->setShortcut(QKeySequence::Open);
    connect(m_openAction, &QAction::triggered, this, &NotepadWindow::openDocument);

    m_saveAction = new QAction(tr("&Save"), this);
    m_saveAction->setShortcut(QKeySequence::Save);
    connect(m_saveAction, &QAction::triggered, this, &NotepadWindow::saveDocument);

    m_saveAsAction = new QAction(tr("Save &As..."), this);
    m_saveAsAction->setShortcut(QKeySequence(tr("Ctrl+Shift+S")));
    connect(m_saveAsAction, &QAction::triggered, this, &NotepadWindow::saveDocumentAs);

    m_closeAction = new QAction(tr("&Close Window"), this);
    m_closeAction->setShortcut(QKeySequence(tr("Ctrl+W")));
    connect(m_closeAction, &QAction::triggered, this, &QWidget::close);

    // Edit menu
    m_undoAction = new QAction(tr("&Undo"), this);
    m_undoAction->setShortcut(QKeySequence::Undo);
    m_undoAction->setEnabled(false);
    connect(m_undoAction, &QAction::triggered, m_textEdit, &QPlainTextEdit::undo);
    connect(m_textEdit, &QPlainTextEdit::undoAvailable, m_undoAction, &QAction::setEnabled);

    m_redoAction = new QAction(tr("&Redo"), this);
    m_redoAction->setShortcut(QKeySequence(tr("Ctrl+Shift+Z")));
    m_redoAction->setEnabled(false);
    connect(m_redoAction, &QAction::triggered, m_textEdit, &QPlainTextEdit::redo);
    connect(m_textEdit, &QPlainTextEdit::redoAvailable, m_redoAction, &QAction::setEnabled);

    m_cutAction = new QAction(tr("Cu&t"), this);
    m_cutAction->setShortcut(QKeySequence::Cut);
    m_cutAction->setEnabled(false);
    connect(m_cutAction, &QAction::triggered, m_textEdit, &QPlainTextEdit::cut);
    connect(m_textEdit, &QPlainTextEdit::copyAvailable, m_cutAction, &QAction::setEnabled);

    m_copyAction = new QAction(tr("&Copy"), this);
    m_copyAction->setShortcut(QKeySequence::Copy);
    m_copyAction->setEnabled(false);
    connect(m_copyAction, &QAction::triggered, m_textEdit, &QPlainTextEdit::copy);
    connect(m_textEdit, &QPlainTextEdit::copyAvailable, m_copyAction, &QAction::setEnabled);

    m_pasteAction = new QAction(tr("&Paste"), this);
    m_pasteAction->setShortcut(QKeySequence::Paste);
    connect(m_pasteAction, &QAction::triggered, m_textEdit, &QPlainTextEdit::paste);

    m_selectAllAction = new QAction(tr("Select &All"), this);
    m_selectAllAction->setShortcut(QKeySequence::SelectAll);
    connect(m_selectAllAction, &QAction::triggered, m_textEdit, &QPlainTextEdit::selectAll);

    m_findAction = new QAction(tr("&Find..."), this);
    m_findAction->setShortcut(QKeySequence(tr("Ctrl+F")));
    connect(m_findAction, &QAction::triggered, this, &NotepadWindow::showFindDialog);

    m_findNextAction = new QAction(tr("Find &Next"), this);
    m_findNextAction->setShortcut(QKeySequence(tr("F3")));
    connect(m_findNextAction, &QAction::triggered, this, &NotepadWindow::findNext);

    m_replaceAction = new QAction(tr("Find and &Replace..."), this);
    m_replaceAction->setShortcut(QKeySequence(tr("Ctrl+H")));
    connect(m_replaceAction, &QAction::triggered, this, &NotepadWindow::showReplaceDialog);

    m_timeDateAction = new QAction(tr("Time/&Date"), this);
    m_timeDateAction->setShortcut(QKeySequence(tr("F5")));
    connect(m_timeDateAction, &QAction::triggered, this, &NotepadWindow::insertTimeDate);

    // Format menu
    m_wordWrapAction = new QAction(tr("&Word Wrap"), this);
    m_wordWrapAction->setCheckable(true);
    connect(m_wordWrapAction, &QAction::toggled, this, &NotepadWindow::setWordWrap);

    m_fontAction = new QAction(tr("&Font..."), this);
    connect(m_fontAction, &QAction::triggered, this, &NotepadWindow::chooseFont);

    // View menu
    m_zoomInAction = new QAction(tr("Zoom &In"), this);
    m_zoomInAction->setShortcut(QKeySequence(tr("Ctrl++")));
    connect(m_zoomInAction, &QAction::triggered, this, &NotepadWindow::zoomIn);

    m_zoomOutAction = new QAction(tr("Zoom &Out"), this);
    m_zoomOutAction->setShortcut(QKeySequence(tr("Ctrl+-")));
    connect(m_zoomOutAction, &QAction::triggered, this, &NotepadWindow::zoomOut);

    m_zoomResetAction = new QAction(tr("&Restore Default Zoom"), this);
    m_zoomResetAction->setShortcut(QKeySequence(tr("Ctrl+0")));
    connect(m_zoomResetAction, &QAction::triggered, this, &NotepadWindow::zoomReset);

    m_statusBarAction = new QAction(tr("&Status Bar"), this);
    m_statusBarAction->setCheckable(true);
    connect(m_statusBarAction, &QAction::toggled, this, &NotepadWindow::setStatusBarShown);

    // Window menu
    m_minimizeAction = new QAction(tr("Mi&nimize"), this);
    m_minimizeAction->setShortcut(QKeySequence(tr("Ctrl+M")));
    connect(m_minimizeAction, &QAction::triggered, this, &QWidget::showMinimized);

    m_maximizeAction = new QAction(tr("&Zoom"), this);
    connect(m_maximizeAction, &QAction::triggered, this, &NotepadWindow::toggleMaximized);

    m_bringAllToFrontAction = new QAction(tr("&Bring All to Front"), this);
    connect(m_bringAllToFrontAction, &QAction::triggered, this, &NotepadWindow::bringAllToFront);
}

void NotepadWindow::createMenus()
{
    QMenu *appMenu = menuBar()->addMenu(tr("&Notepad"));
    appMenu->addAction(m_aboutAction);
    appMenu->addSeparator();
    appMenu->addAction(m_quitAction);

    QMenu *fileMenu = menuBar()->addMenu(tr("&File"));
    fileMenu->addAction(m_newAction);
    fileMenu->addAction(m_openAction);
    fileMenu->addAction(m_saveAction);
    fileMenu->addAction(m_saveAsAction);
    fileMenu->addSeparator();
    fileMenu->addAction(m_closeAction);

    QMenu *editMenu = menuBar()->addMenu(tr("&Edit"));
    editMenu->addAction(m_undoAction);
    editMenu->addAction(m_redoAction);
    editMenu->addSeparator();
    editMenu->addAction(m_cutAction);
    editMenu->addAction(m_copyAction);
    editMenu->addAction(m_pasteAction);
    editMenu->addSeparator();
    editMenu->addAction(m_selectAllAction);
    editMenu->addSeparator();
    editMenu->addAction(m_findAction);
    editMenu->addAction(m_findNextAction);
    editMenu->addAction(m_replaceAction);
    editMenu->addSeparator();
    editMenu->addAction(m_timeDateAction);

    QMenu *formatMenu = menuBar()->addMenu(tr("F&ormat"));
    formatMenu->addAction(m_wordWrapAction);
    formatMenu->addAction(m_fontAction);

    QMenu *viewMenu = menuBar()->addMenu(tr("&View"));
    QMenu *zoomMenu = viewMenu->addMenu(tr("&Zoom"));
    zoomMenu->addAction(m_zoomInAction);
    zoomMenu->addAction(m_zoomOutAction);
    zoomMenu->addAction(m_zoomResetAction);
    viewMenu->addSeparator();
    viewMenu->addAction(m_statusBarAction);

    m_windowMenu = menuBar()->addMenu(tr("&Window"));
    connect(m_windowMenu, &QMenu::aboutToShow, this, &NotepadWindow::populateWindowMenu);
    populateWindowMenu();
}

void NotepadWindow::createStatusBar()
{
    statusBar()->addWidget(m_positionLabel, 1);
}

void NotepadWindow::applyPreferences()
{
    m_textEdit->setFont(m_preferences->font());
    setWordWrap(m_preferences->wordWrap());
    setStatusBarShown(m_preferences->statusBarVisible());
}

void NotepadWindow::applyFont(const QFont &font)
{
    QFont clamped = font;
    if (clamped.pointSizeF() < Preferences::MIN_FONT_SIZE) {
        clamped.setPointSizeF(Preferences::MIN_FONT_SIZE);
    }
    m_textEdit->setFont(clamped);
    m_preferences->setFont(clamped);
}

void NotepadWindow::toggleMaximized()
{
    if (isMaximized()) {
        showNormal();
    } else {
        showMaximized();
    }
}

void NotepadWindow::bringAllToFront()
{
    const QWidgetList widgets = QApplication::topLevelWidgets();
    for (QWidget *widget : widgets) {
        auto *window = qobject_cast<NotepadWindow *>(widget);
        if (window && window != this && !window->isHidden()) {
            window->raise();
        }
    }
    raise();
    activateWindow();
}
