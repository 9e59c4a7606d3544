#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>

#include "nwss-toolpath/config.h"

using namespace nwss::toolpath;

class ToolpathConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = (std::filesystem::temp_directory_path() / "nwss_toolpath_config_test.conf").string();
        std::remove(path.c_str());
    }

    void TearDown() override {
        std::remove(path.c_str());
    }

    void writeFile(const std::string& text) {
        std::ofstream file(path);
        file << text;
    }

    std::string path;
};

TEST_F(ToolpathConfigTest, Defaults) {
    ToolpathConfig config;
    EXPECT_EQ(config.getController(), "Mach3");
    EXPECT_DOUBLE_EQ(config.getMaxX(), 24.0);
    EXPECT_DOUBLE_EQ(config.getMaxY(), 18.0);
    EXPECT_TRUE(config.getSupportsSubroutines());
    EXPECT_EQ(config.getGCodeBasePath(), "C:\\Mach3\\GCode");
    EXPECT_EQ(config.getCircleLeadIn(), LeadInType::HELICAL);
    EXPECT_EQ(config.getLineLeadIn(), LeadInType::RAMP);
    EXPECT_EQ(config.getToolType(), ToolType::END_MILL);
}

TEST_F(ToolpathConfigTest, FirstRunWhenFileIsMissing) {
    EXPECT_TRUE(ToolpathConfig::isFirstRun(path));

    ToolpathConfig config;
    ASSERT_TRUE(config.saveToFile(path));
    EXPECT_FALSE(ToolpathConfig::isFirstRun(path));
}

TEST_F(ToolpathConfigTest, SaveAndLoadRoundTrip) {
    ToolpathConfig config;
    config.setMachineName("Shop Router");
    config.setMaxX(30.0);
    config.setSupportsSubroutines(false);
    config.setGCodeBasePath("D:\\Jobs");
    config.setSafetyHeight(0.75);
    config.setHexagonLeadIn(LeadInType::RAMP);
    config.setRampAngle(5.0);
    config.setToolType(ToolType::DRILL);
    config.setToolDiameter(0.1875);
    config.setSpindleSpeed(12000);

    MaterialSpec tube;
    tube.name = "2x1 tube";
    tube.form = MaterialForm::TUBE;
    tube.outerWidth = 2.0;
    tube.outerHeight = 1.0;
    tube.wallThickness = 0.125;
    config.setMaterial(tube);

    ASSERT_TRUE(config.saveToFile(path));

    ToolpathConfig loaded;
    ASSERT_TRUE(loaded.loadFromFile(path));
    EXPECT_EQ(loaded.getMachineName(), "Shop Router");
    EXPECT_DOUBLE_EQ(loaded.getMaxX(), 30.0);
    EXPECT_FALSE(loaded.getSupportsSubroutines());
    EXPECT_EQ(loaded.getGCodeBasePath(), "D:\\Jobs");
    EXPECT_DOUBLE_EQ(loaded.getSafetyHeight(), 0.75);
    EXPECT_EQ(loaded.getHexagonLeadIn(), LeadInType::RAMP);
    EXPECT_DOUBLE_EQ(loaded.getRampAngle(), 5.0);
    EXPECT_EQ(loaded.getToolType(), ToolType::DRILL);
    EXPECT_DOUBLE_EQ(loaded.getToolDiameter(), 0.1875);
    EXPECT_EQ(loaded.getSpindleSpeed(), 12000);

    MaterialSpec material = loaded.toMaterialSpec();
    EXPECT_EQ(material.name, "2x1 tube");
    EXPECT_EQ(material.form, MaterialForm::TUBE);
    EXPECT_DOUBLE_EQ(material.wallThickness, 0.125);
}

TEST_F(ToolpathConfigTest, MissingKeysKeepDefaults) {
    writeFile("# partial\n[general]\nsafety_height = 1.0\ncircle_lead_in = Ramp\n");

    ToolpathConfig config;
    ASSERT_TRUE(config.loadFromFile(path));
    EXPECT_DOUBLE_EQ(config.getSafetyHeight(), 1.0);
    EXPECT_EQ(config.getCircleLeadIn(), LeadInType::RAMP);
    EXPECT_DOUBLE_EQ(config.getTravelHeight(), 0.2);
    EXPECT_DOUBLE_EQ(config.getMaxY(), 18.0);
}

TEST_F(ToolpathConfigTest, MalformedValuesFail) {
    ToolpathConfig config;

    writeFile("[general]\nsafety_height=abc\n");
    EXPECT_FALSE(config.loadFromFile(path));

    writeFile("[general]\ncorner_slowdown=maybe\n");
    EXPECT_FALSE(config.loadFromFile(path));

    writeFile("[tool]\ntype=saw\n");
    EXPECT_FALSE(config.loadFromFile(path));
}

TEST_F(ToolpathConfigTest, UnreadableFileFails) {
    ToolpathConfig config;
    EXPECT_FALSE(config.loadFromFile(path));
}

TEST_F(ToolpathConfigTest, ToolTypeStrings) {
    ToolpathConfig config;
    EXPECT_TRUE(config.setToolTypeFromString("drill"));
    EXPECT_EQ(config.getToolTypeString(), "drill");
    EXPECT_TRUE(config.setToolTypeFromString("endmill"));
    EXPECT_EQ(config.getToolTypeString(), "end_mill");
    EXPECT_FALSE(config.setToolTypeFromString("saw"));
}

TEST_F(ToolpathConfigTest, GenerationSettingsCarryTheValues) {
    ToolpathConfig config;
    config.setTravelHeight(0.3);
    config.setCutThroughBuffer(0.01);

    GenerationSettings settings = config.toGenerationSettings();
    EXPECT_DOUBLE_EQ(settings.travelHeight, 0.3);
    EXPECT_DOUBLE_EQ(settings.cutThroughBuffer, 0.01);
    EXPECT_FALSE(settings.verbose);
}
