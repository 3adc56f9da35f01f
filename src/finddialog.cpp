/**
 * Notepad - A classic plain-text editor for the desktop
 *
 * finddialog.cpp - Find and Replace dialog implementation
 *
 * Copyright (c) 2026 tobsai
 * Licensed under MIT License
 */

#include "finddialog.h"
#include <QCheckBox>
#include <QGridLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QRadioButton>
#include <QVBoxLayout>

FindDialog::FindDialog(QWidget *parent)
    : QDialog(parent)
    , m_findEdit(new QLineEdit(this))
    , m_replaceEdit(new QLineEdit(this))
    , m_replaceLabel(new QLabel(tr("Re&place with:"), this))
    , m_matchCaseBox(new QCheckBox(tr("Match &case"), this))
    , m_wholeWordsBox(new QCheckBox(tr("Match &whole word only"), this))
    , m_wrapAroundBox(new QCheckBox(tr("W&rap around"), this))
    , m_directionBox(new QGroupBox(tr("Direction"), this))
    , m_upButton(new QRadioButton(tr("&Up"), this))
    , m_downButton(new QRadioButton(tr("&Down"), this))
    , m_findNextButton(new QPushButton(tr("&Find Next"), this))
    , m_replaceButton(new QPushButton(tr("&Replace"), this))
    , m_replaceAllButton(new QPushButton(tr("Replace &All"), this))
{
    setModal(false);

    auto *findLabel = new QLabel(tr("Fi&nd what:"), this);
    findLabel->setBuddy(m_findEdit);
    m_replaceLabel->setBuddy(m_replaceEdit);

    auto *fields = new QGridLayout;
    fields->addWidget(findLabel, 0, 0);
    fields->addWidget(m_findEdit, 0, 1);
    fields->addWidget(m_replaceLabel, 1, 0);
    fields->addWidget(m_replaceEdit, 1, 1);

    auto *directionLayout = new QHBoxLayout(m_directionBox);
    directionLayout->addWidget(m_upButton);
    directionLayout->addWidget(m_downButton);
    m_downButton->setChecked(true);

    m_wrapAroundBox->setChecked(true);

    auto *optionsLayout = new QVBoxLayout;
    optionsLayout->addWidget(m_matchCaseBox);
    optionsLayout->addWidget(m_wholeWordsBox);
    optionsLayout->addWidget(m_wrapAroundBox);

    auto *bottom = new QHBoxLayout;
    bottom->addLayout(optionsLayout);
    bottom->addWidget(m_directionBox);

    auto *left = new QVBoxLayout;
    left->addLayout(fields);
    left->addLayout(bottom);
    left->addStretch(1);

    auto *cancelButton = new QPushButton(tr("Cancel"), this);
    auto *buttons = new QVBoxLayout;
    buttons->addWidget(m_findNextButton);
    buttons->addWidget(m_replaceButton);
    buttons->addWidget(m_replaceAllButton);
    buttons->addWidget(cancelButton);
    buttons->addStretch(1);

    auto *layout = new QHBoxLayout(this);
    layout->addLayout(left);
    layout->addLayout(buttons);

    m_findNextButton->setDefault(true);

    connect(m_findNextButton, &QPushButton::clicked, this, &FindDialog::findNextRequested);
    connect(m_replaceButton, &QPushButton::clicked, this, &FindDialog::replaceRequested);
    connect(m_replaceAllButton, &QPushButton::clicked, this, &FindDialog::replaceAllRequested);
    connect(cancelButton, &QPushButton::clicked, this, &QDialog::reject);
    connect(m_findEdit, &QLineEdit::textChanged, this, &FindDialog::updateButtons);

    updateButtons();
}

QString FindDialog::findText() const
{
    return m_findEdit->text();
}

QString FindDialog::replaceText() const
{
    return m_replaceEdit->text();
}

FindOptions FindDialog::options() const
{
    FindOptions options;
    options.matchCase = m_matchCaseBox->isChecked();
    options.wholeWords = m_wholeWordsBox->isChecked();
    options.wrapAround = m_wrapAroundBox->isChecked();
    options.backward = m_upButton->isChecked();
    return options;
}

void FindDialog::setFindText(const QString &text)
{
    m_findEdit->setText(text);
}

void FindDialog::setReplaceText(const QString &text)
{
    m_replaceEdit->setText(text);
}

void FindDialog::showFind(const QString &initialText)
{
    setWindowTitle(tr("Find"));
    setReplaceMode(false);
    present(initialText);
}

void FindDialog::showReplace(const QString &initialText)
{
    setWindowTitle(tr("Replace"));
    setReplaceMode(true);
    present(initialText);
}

void FindDialog::updateButtons()
{
    const bool hasText = !m_findEdit->text().isEmpty();
    m_findNextButton->setEnabled(hasText);
    m_replaceButton->setEnabled(hasText);
    m_replaceAllButton->setEnabled(hasText);
}

void FindDialog::setReplaceMode(bool enabled)
{
    m_replaceLabel->setVisible(enabled);
    m_replaceEdit->setVisible(enabled);
    m_replaceButton->setVisible(enabled);
    m_replaceAllButton->setVisible(enabled);

    // Replace works forward only
    m_directionBox->setVisible(!enabled);
    if (enabled) {
        m_downButton->setChecked(true);
    }
    adjustSize();
}

void FindDialog::present(const QString &initialText)
{
    if (!initialText.isEmpty() && !initialText.contains(QChar::ParagraphSeparator)) {
        m_findEdit->setText(initialText);
    }
    m_findEdit->selectAll();
    m_findEdit->setFocus();

    show();
    raise();
    activateWindow();
}
