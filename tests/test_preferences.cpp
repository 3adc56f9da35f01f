/**
 * Notepad - A classic plain-text editor for the desktop
 *
 * test_preferences.cpp - Persisted preference tests
 *
 * Copyright (c) 2026 tobsai
 * Licensed under MIT License
 */

#include <gtest/gtest.h>
#include "preferences.h"
#include <QSettings>
#include <QTemporaryDir>

class PreferencesTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
        m_fileName = m_dir.filePath("notepad.ini");
    }

    QTemporaryDir m_dir;
    QString m_fileName;
};

TEST_F(PreferencesTest, DefaultsWhenStoreIsEmpty)
{
    Preferences preferences(m_fileName);

    EXPECT_EQ(preferences.fontFamily(), Preferences::defaultFontFamily());
    EXPECT_DOUBLE_EQ(preferences.fontSize(), 12.0);
    EXPECT_FALSE(preferences.wordWrap());
    EXPECT_TRUE(preferences.statusBarVisible());
}

TEST_F(PreferencesTest, ValuesPersistAcrossInstances)
{
    {
        Preferences preferences(m_fileName);
        preferences.setFont("DejaVu Sans Mono", 16.0);
        preferences.setWordWrap(true);
        preferences.setStatusBarVisible(false);
        preferences.sync();
    }

    Preferences reloaded(m_fileName);
    EXPECT_EQ(reloaded.fontFamily(), QString("DejaVu Sans Mono"));
    EXPECT_DOUBLE_EQ(reloaded.fontSize(), 16.0);
    EXPECT_TRUE(reloaded.wordWrap());
    EXPECT_FALSE(reloaded.statusBarVisible());
}

TEST_F(PreferencesTest, StoredKeysUseNotepadGroup)
{
    {
        Preferences preferences(m_fileName);
        preferences.setFont("Courier", 10.0);
        preferences.setWordWrap(true);
        preferences.setStatusBarVisible(false);
        preferences.sync();
    }

    QSettings settings(m_fileName, QSettings::IniFormat);
    EXPECT_EQ(settings.value("Notepad/FontName").toString(), QString("Courier"));
    EXPECT_DOUBLE_EQ(settings.value("Notepad/FontSize").toReal(), 10.0);
    EXPECT_TRUE(settings.value("Notepad/WordWrap").toBool());
    EXPECT_FALSE(settings.value("Notepad/ShowStatus").toBool());
}

TEST_F(PreferencesTest, UnusableFontSizeFallsBackToDefault)
{
    {
        QSettings settings(m_fileName, QSettings::IniFormat);
        settings.setValue("Notepad/FontSize", 0);
    }
    EXPECT_DOUBLE_EQ(Preferences(m_fileName).fontSize(), 12.0);

    {
        QSettings settings(m_fileName, QSettings::IniFormat);
        settings.setValue("Notepad/FontSize", "large");
    }
    EXPECT_DOUBLE_EQ(Preferences(m_fileName).fontSize(), 12.0);
}

TEST_F(PreferencesTest, FontSizeIsClampedToMinimum)
{
    Preferences preferences(m_fileName);
    preferences.setFont("Courier", 2.0);
    EXPECT_DOUBLE_EQ(preferences.fontSize(), 4.0);
}

TEST_F(PreferencesTest, FontCarriesFamilyAndSize)
{
    Preferences preferences(m_fileName);
    preferences.setFont("Courier", 18.0);

    const QFont font = preferences.font();
    EXPECT_EQ(font.family(), QString("Courier"));
    EXPECT_DOUBLE_EQ(font.pointSizeF(), 18.0);
}

TEST_F(PreferencesTest, SignalsOnlyOnChange)
{
    Preferences preferences(m_fileName);
    int fontChanges = 0;
    int wrapChanges = 0;
    int statusChanges = 0;
    QObject::connect(&preferences, &Preferences::fontChanged, [&fontChanges]() { ++fontChanges; });
    QObject::connect(&preferences, &Preferences::wordWrapChanged, [&wrapChanges]() { ++wrapChanges; });
    QObject::connect(&preferences, &Preferences::statusBarVisibleChanged, [&statusChanges]() { ++statusChanges; });

    preferences.setWordWrap(false);
    preferences.setWordWrap(true);
    preferences.setWordWrap(true);
    preferences.setStatusBarVisible(true);
    preferences.setStatusBarVisible(false);
    preferences.setFont("Courier", 14.0);
    preferences.setFont("Courier", 14.0);

    EXPECT_EQ(wrapChanges, 1);
    EXPECT_EQ(statusChanges, 1);
    EXPECT_EQ(fontChanges, 1);
}

TEST(PreferencesZoomTest, StepsByTwoPointsWithFloor)
{
    EXPECT_DOUBLE_EQ(Preferences::zoomedIn(12.0), 14.0);
    EXPECT_DOUBLE_EQ(Preferences::zoomedOut(12.0), 10.0);
    EXPECT_DOUBLE_EQ(Preferences::zoomedOut(5.0), 4.0);
    EXPECT_DOUBLE_EQ(Preferences::zoomedOut(4.0), 4.0);
}
