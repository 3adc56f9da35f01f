/**
 * Notepad - A classic plain-text editor for the desktop
 *
 * finddialog.h - Find and Replace dialog
 *
 * Copyright (c) 2026 tobsai
 * Licensed under MIT License
 */

#ifndef FINDDIALOG_H
#define FINDDIALOG_H

#include <QDialog>
#include "textfinder.h"

class QLabel;
class QLineEdit;
class QCheckBox;
class QGroupBox;
class QRadioButton;
class QPushButton;

/**
 * @brief The FindDialog class is the non-modal Find / Replace box of a window.
 *
 * The dialog only collects input. The owning window performs the search when
 * one of the request signals fires.
 */
class FindDialog : public QDialog
{
    Q_OBJECT

public:
    explicit FindDialog(QWidget *parent = nullptr);

    QString findText() const;
    QString replaceText() const;
    FindOptions options() const;

    void setFindText(const QString &text);
    void setReplaceText(const QString &text);

public slots:
    void showFind(const QString &initialText = QString());
    void showReplace(const QString &initialText = QString());

signals:
    void findNextRequested();
    void replaceRequested();
    void replaceAllRequested();

private slots:
    void updateButtons();

private:
    void setReplaceMode(bool enabled);
    void present(const QString &initialText);

    QLineEdit *m_findEdit;
    QLineEdit *m_replaceEdit;
    QLabel *m_replaceLabel;
    QCheckBox *m_matchCaseBox;
    QCheckBox *m_wholeWordsBox;
    QCheckBox *m_wrapAroundBox;
    QGroupBox *m_directionBox;
    QRadioButton *m_upButton;
    QRadioButton *m_downButton;
    QPushButton *m_findNextButton;
    QPushButton *m_replaceButton;
    QPushButton *m_replaceAllButton;
};

#endif // FINDDIALOG_H
