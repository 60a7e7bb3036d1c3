#include "cosmic/config/MeasurementLoader.hpp"
#include "cosmic/core/Exception.hpp"
#include "cosmic/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

namespace cosmic {
namespace config {

class MeasurementLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/MeasurementLoader_test.log",
                                         Logger::Level::DEBUG,
                                         false);
        test_dir_ = "test_measurement_loader";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
        Logger::getInstance().shutdown();
    }

    // 辅助函数：写入配置文件
    core::Path writeConfig(const std::string& name, const std::string& text) const {
        std::string path = test_dir_ + "/" + name;
        std::ofstream out(path, std::ios::binary);
        out << text;
        return core::Path(path);
    }

    std::string test_dir_;
};

// 测试1: 文件不存在
TEST_F(MeasurementLoaderTest, MissingFile) {
    core::Path missing(test_dir_ + "/absent.yaml");
    try {
        loadMeasurement(missing);
        FAIL() << "expected FileException";
    } catch (const core::FileException& e) {
        EXPECT_EQ(e.getErrorCode(), core::ErrorCode::FileNotFound);
        EXPECT_EQ(std::string(e.what()), "Configuration file '" + missing.string() + "' does not exist.");
        EXPECT_EQ(e.getFilename(), missing.string());
    }
}

TEST_F(MeasurementLoaderTest, DirectoryIsNotAConfig) {
    core::Path dir(test_dir_);
    try {
        loadDocument(dir);
        FAIL() << "expected FileException";
    } catch (const core::FileException& e) {
        EXPECT_EQ(e.getErrorCode(), core::ErrorCode::FileReadError);
    }
}

// 测试2: YAML 配置
TEST_F(MeasurementLoaderTest, LoadsYaml) {
    core::Path path = writeConfig("shop.yaml",
        "# measurement\n"
        "system:\n"
        "  name: Shop\n"
        "functional_processes:\n"
        "  - name: Browse\n"
        "    data_movements:\n"
        "      - type: E\n"
        "        description: Search query\n"
        "      - type: X\n"
        "        description: Results\n");

    model::SystemMeasurement m = loadMeasurement(path);
    EXPECT_EQ(m.name, "Shop");
    ASSERT_EQ(m.functional_processes.size(), 1u);
    EXPECT_EQ(m.totalCfp(), 2u);
}

// 测试3: JSON 配置使用 yaml-cpp 后端
TEST_F(MeasurementLoaderTest, LoadsJson) {
    core::Path path = writeConfig("shop.json",
        "{\n"
        "  \"system\": {\"name\": \"Shop\"},\n"
        "  \"functional_processes\": [\n"
        "    {\"name\": \"Pay\", \"data_movements\": [\n"
        "      {\"type\": \"E\", \"description\": \"Card\"},\n"
        "      {\"type\": \"W\", \"description\": \"Payment\"},\n"
        "      {\"type\": \"X\", \"description\": \"Receipt\"}\n"
        "    ]}\n"
        "  ]\n"
        "}\n");

    model::SystemMeasurement m = loadMeasurement(path);
    EXPECT_EQ(m.name, "Shop");
    EXPECT_EQ(m.totalCfp(), 3u);
}

// 测试4: 指定 yaml-cpp 后端读取 YAML
TEST_F(MeasurementLoaderTest, ExplicitYamlCppBackend) {
    core::Path path = writeConfig("flow.yaml",
        "system: {name: Flow}\n"
        "functional_processes:\n"
        "  - {name: P, data_movements: [{type: R, description: Load}]}\n");

    core::ParserOptions options;
    options.backend = core::ParserBackend::YamlCpp;
    model::SystemMeasurement m = loadMeasurement(path, options);
    EXPECT_EQ(m.name, "Flow");
    EXPECT_EQ(m.totalCfp(), 1u);

    // 内置解析器不支持流式集合，按普通字符串处理后校验失败
    EXPECT_THROW(loadMeasurement(path), core::CosmicException);
}

// 测试5: 解析错误被包装并带上文件名
TEST_F(MeasurementLoaderTest, ParseErrorIsWrapped) {
    core::Path path = writeConfig("broken.yaml", "a: 1\n- b\n");
    try {
        loadDocument(path);
        FAIL() << "expected ParseException";
    } catch (const core::ParseException& e) {
        std::string message = e.what();
        EXPECT_EQ(message.rfind("Failed to parse YAML configuration file '" + path.string() + "': ", 0), 0u);
        EXPECT_NE(message.find("Mixed list and mapping structures"), std::string::npos);
        EXPECT_EQ(e.getSourceLine(), 0u);
        ASSERT_EQ(e.getContext().size(), 1u);
        EXPECT_EQ(e.getContext()[0], "parser: builtin");
    }

    core::Path json = writeConfig("broken.json", "{\"a\": [1, 2}");
    try {
        loadDocument(json);
        FAIL() << "expected ParseException";
    } catch (const core::ParseException& e) {
        EXPECT_EQ(std::string(e.what()).rfind("Failed to parse JSON configuration file", 0), 0u);
        EXPECT_EQ(e.getContext()[0], "parser: yaml-cpp");
    }
}

// 测试6: 根节点必须是映射
TEST_F(MeasurementLoaderTest, RootMustBeMapping) {
    core::Path path = writeConfig("list.yaml", "- a\n- b\n");
    EXPECT_TRUE(loadDocument(path).isList());
    EXPECT_THROW(loadMeasurement(path), core::ConfigException);
}

// 测试7: 空文件得到没有处理的默认度量
TEST_F(MeasurementLoaderTest, EmptyFile) {
    core::Path path = writeConfig("empty.yaml", "");
    model::SystemMeasurement m = loadMeasurement(path);
    EXPECT_EQ(m.name, model::SystemMeasurement::DEFAULT_NAME);
    EXPECT_TRUE(m.functional_processes.empty());
}

}} // namespace cosmic::config
