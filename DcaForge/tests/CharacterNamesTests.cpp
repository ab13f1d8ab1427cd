// tests/CharacterNamesTests.cpp - Character heading normalization
#include <gtest/gtest.h>

#include "TestScripts.h"
#include "core/CharacterNames.h"

TEST(CharacterNamesTest, SplitsJointHeadingAndDropsExtensions)
{
    const QStringList names = CharacterNames::split("HORTON (V.O.) & MAYZIE");
    ASSERT_EQ(names.size(), 2);
    EXPECT_EQ(names[0], "Horton");
    EXPECT_EQ(names[1], "Mayzie");
}

TEST(CharacterNamesTest, KeepsMixedCaseNamesAsWritten)
{
    const QStringList names = CharacterNames::split("Dr. Seuss & THE CAT");
    ASSERT_EQ(names.size(), 2);
    EXPECT_EQ(names[0], "Dr. Seuss");
    EXPECT_EQ(names[1], "The Cat");
}

TEST(CharacterNamesTest, TitleCaseStartsWordsAfterAnyNonLetter)
{
    EXPECT_EQ(CharacterNames::titleCase("MR. MAYOR"), "Mr. Mayor");
    EXPECT_EQ(CharacterNames::titleCase("GERTRUDE MCFUZZ"), "Gertrude Mcfuzz");
    EXPECT_EQ(CharacterNames::titleCase("WHO-GIRL 2"), "Who-Girl 2");
}

TEST(CharacterNamesTest, EmptyPiecesAreDropped)
{
    EXPECT_TRUE(CharacterNames::split("").isEmpty());
    EXPECT_TRUE(CharacterNames::split("(O.S.)").isEmpty());

    const QStringList names = CharacterNames::split("JOJO & ");
    ASSERT_EQ(names.size(), 1);
    EXPECT_EQ(names[0], "Jojo");
}

TEST(CharacterNamesTest, IdentitiesAreTruncatedToLabelWidth)
{
    const QStringList ids = CharacterNames::identities("WICKERSHAM BROTHERS & JOJO");
    ASSERT_EQ(ids.size(), 2);
    EXPECT_EQ(ids[0], "Wickersham B");
    EXPECT_EQ(ids[0].size(), CharacterNames::MaxNameLength);
    EXPECT_EQ(ids[1], "Jojo");
}

// Two different long names collapse to one identity; kept as-is for label fidelity
TEST(CharacterNamesTest, LongNamesSharingPrefixCollide)
{
    EXPECT_NE(CharacterNames::split("WICKERSHAM BROTHERS"), CharacterNames::split("WICKERSHAM BROS"));
    EXPECT_EQ(CharacterNames::identities("WICKERSHAM BROTHERS"), CharacterNames::identities("WICKERSHAM BROS"));
}

TEST(CharacterNamesTest, AllCharactersSortedAndUnique)
{
    Script script;
    script << sceneHeading("INT. JUNGLE - DAY")
           << character("MAYZIE") << dialogue("Hi")
           << character("HORTON & MAYZIE") << dialogue("Together")
           << comment("Page 3")
           << character("HORTON (CONT'D)") << dialogue("Again");

    const QStringList characters = CharacterNames::allCharacters(script);
    ASSERT_EQ(characters.size(), 2);
    EXPECT_EQ(characters[0], "Horton");
    EXPECT_EQ(characters[1], "Mayzie");
}
