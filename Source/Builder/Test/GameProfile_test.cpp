#include "gtest/gtest.h"
#include "NifMesh.h"

namespace {

using namespace Nif;

TEST(GameProfileTest, NamesAreCaseInsensitive) {
    EGameProfile game = EGameProfile::Morrowind;
    EXPECT_TRUE(GameProfile::FromName("skyrim", game));
    EXPECT_EQ(game, EGameProfile::Skyrim);
    EXPECT_EQ(GameProfile::GetName(EGameProfile::Fallout3), "FALLOUT_3");
    EXPECT_FALSE(GameProfile::FromName("Starfield", game));
    EXPECT_EQ(game, EGameProfile::Skyrim);
}

TEST(GameProfileTest, ShapeFlags) {
    EXPECT_EQ(GameProfile::GetDefaultShapeFlags(EGameProfile::Oblivion, "Tri Body", false), 0x000E);
    EXPECT_EQ(GameProfile::GetDefaultShapeFlags(EGameProfile::CivilizationIV, "Tri Body", false), 0x0010);
    EXPECT_EQ(GameProfile::GetDefaultShapeFlags(EGameProfile::Divinity2, "Tri Body_LOW", false), 0x0014);
    EXPECT_EQ(GameProfile::GetDefaultShapeFlags(EGameProfile::Divinity2, "Tri Body", false), 0x0016);
    EXPECT_EQ(GameProfile::GetDefaultShapeFlags(EGameProfile::Morrowind, "Tri Body", true), 0x0005);
    EXPECT_EQ(GameProfile::GetDefaultShapeFlags(EGameProfile::Morrowind, "Tri Body", false), 0x0004);
}

TEST(GameProfileTest, Capabilities) {
    EXPECT_TRUE(GameProfile::SupportsBodyParts(EGameProfile::Skyrim));
    EXPECT_FALSE(GameProfile::SupportsBodyParts(EGameProfile::Oblivion));
    EXPECT_FALSE(GameProfile::SupportsMultipleUVLayers(EGameProfile::Fallout3));
    EXPECT_TRUE(GameProfile::SupportsTangentSpace(EGameProfile::Oblivion));
    EXPECT_FALSE(GameProfile::SupportsTangentSpace(EGameProfile::Morrowind));
    EXPECT_EQ(GameProfile::GetRecommendedBonesPerPartition(EGameProfile::Skyrim), 24u);
    EXPECT_EQ(GameProfile::GetRecommendedBonesPerPartition(EGameProfile::Morrowind), 0u);
}

TEST(OptionsTest, Validate) {
    Options options;
    EXPECT_NO_THROW(options.Validate());
    options.maxBonesPerVertex = 0;
    EXPECT_THROW(options.Validate(), ExportException);
    options.maxBonesPerVertex = 4;
    options.epsilon = 0.f;
    EXPECT_THROW(options.Validate(), ExportException);
}

TEST(OptionsTest, BonesPerPartitionFitInOneByte) {
    Options options;
    options.maxBonesPerPartition = Configuration::MaxBonesPerPartition;
    EXPECT_NO_THROW(options.Validate());
    options.maxBonesPerPartition = 300;
    try {
        options.Validate();
        FAIL() << "expected InvalidOptions";
    } catch (const ExportException& e) {
        EXPECT_EQ(e.kind, ExportException::EErrorKind::InvalidOptions);
    }
}

}  // namespace
