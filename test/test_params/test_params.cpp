#include <gtest/gtest.h>

#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>

#include "file_frontend.hpp"
#include "front.hpp"
#include "gateway/gateway_frontend.hpp"
#include "utils/utils.hpp"

struct TestParams {
    uint8_t count = 3;
    int16_t offset = -5;
    float gain = 1.5f;
    double scale = 76.8;
    bool enabled = true;
    etl::array<char, 16> label = {{"anchor"}};
}ULS_PACKED;

class TestFrontend : public FileFrontend<TestParams> {
public:
    TestFrontend() : FileFrontend<TestParams>("test") {}

    etl::span<const ParamDef> GetParamLayout() const override {
        return etl::span<const ParamDef>(s_ParamDefs, sizeof(s_ParamDefs)/sizeof(ParamDef));
    }

    static constexpr ParamDef s_ParamDefs[] = {
        PARAM_DEF(TestParams, count),
        PARAM_DEF(TestParams, offset),
        PARAM_DEF(TestParams, gain),
        PARAM_DEF(TestParams, scale),
        PARAM_DEF(TestParams, enabled),
        PARAM_DEF(TestParams, label),
    };
};

class ParamsTest : public ::testing::Test {
protected:
    std::string path;

    void SetUp() override {
        char name[] = "/tmp/magicloc_params_XXXXXX";
        int fd = mkstemp(name);
        ASSERT_GE(fd, 0);
        close(fd);
        path = name;
        Front::SetParamsPath(path.c_str());
    }

    void TearDown() override {
        std::remove(path.c_str());
        Front::SetParamsPath("params.txt");
    }

    void WriteFile(const std::string& content) {
        std::ofstream out(path, std::ios::trunc);
        out << content;
    }

    std::string ReadFile() {
        std::ifstream in(path);
        std::stringstream content;
        content << in.rdbuf();
        return content.str();
    }
};

TEST_F(ParamsTest, DefaultsWhenFileIsMissing)
{
    std::remove(path.c_str());

    TestFrontend front;
    EXPECT_EQ(front.LoadParams(), ErrorParam::FILE_NOT_FOUND);
    EXPECT_EQ(+front.GetParams().count, 3);
    EXPECT_EQ(+front.GetParams().offset, -5);
    EXPECT_STREQ(front.GetParams().label.data(), "anchor");
}

TEST_F(ParamsTest, LoadsOwnGroupOnly)
{
    WriteFile("# comment\n"
              "\n"
              "other.count: 9\n"
              "test.count: 7\n"
              "  test.offset :  -300  \n"
              "test.gain: 0.25\n"
              "test.scale: 12.5\n"
              "test.enabled: false\n"
              "test.label: tag-01\n");

    TestFrontend front;
    ASSERT_EQ(front.LoadParams(), ErrorParam::OK);

    const TestParams& params = front.GetParams();
    EXPECT_EQ(+params.count, 7);
    EXPECT_EQ(+params.offset, -300);
    EXPECT_FLOAT_EQ(static_cast<float>(params.gain), 0.25f);
    EXPECT_DOUBLE_EQ(static_cast<double>(params.scale), 12.5);
    EXPECT_FALSE(static_cast<bool>(params.enabled));
    EXPECT_STREQ(params.label.data(), "tag-01");
}

TEST_F(ParamsTest, RejectedLinesKeepDefaults)
{
    WriteFile("test.count: 300\n"
              "test.unknown: 1\n"
              "not a parameter line\n"
              "test.gain: 2.5\n");

    TestFrontend front;
    EXPECT_NE(front.LoadParams(), ErrorParam::OK);
    EXPECT_EQ(+front.GetParams().count, 3);
    EXPECT_FLOAT_EQ(static_cast<float>(front.GetParams().gain), 2.5f);
}

TEST_F(ParamsTest, SaveKeepsOtherGroups)
{
    WriteFile("other.value: 1\n"
              "test.count: 4\n");

    TestFrontend front;
    ASSERT_EQ(front.LoadParams(), ErrorParam::OK);
    ASSERT_EQ(front.SetParam("scale", "3.25", 4), ErrorParam::OK);
    ASSERT_EQ(front.SaveParams(), ErrorParam::OK);

    const std::string content = ReadFile();
    EXPECT_NE(content.find("other.value: 1"), std::string::npos);
    EXPECT_NE(content.find("test.count: 4"), std::string::npos);
    EXPECT_NE(content.find("test.scale: 3.25"), std::string::npos);
    EXPECT_NE(content.find("test.label: anchor"), std::string::npos);

    TestFrontend reloaded;
    ASSERT_EQ(reloaded.LoadParams(), ErrorParam::OK);
    EXPECT_EQ(+reloaded.GetParams().count, 4);
    EXPECT_DOUBLE_EQ(static_cast<double>(reloaded.GetParams().scale), 3.25);
    EXPECT_FLOAT_EQ(static_cast<float>(reloaded.GetParams().gain), 1.5f);
}

TEST_F(ParamsTest, StringMustLeaveRoomForTerminator)
{
    TestFrontend front;
    const char* fits = "123456789012345";
    const char* tooLong = "1234567890123456";
    EXPECT_EQ(front.SetParam("label", fits, static_cast<uint32_t>(strlen(fits))), ErrorParam::OK);
    EXPECT_EQ(front.SetParam("label", tooLong, static_cast<uint32_t>(strlen(tooLong))), ErrorParam::PARAM_TOO_LONG);
    EXPECT_STREQ(front.GetParams().label.data(), fits);
}

TEST_F(ParamsTest, GetParamFormatsValues)
{
    TestFrontend front;
    char value[64] = {};
    uint32_t len = 0;
    ParamType type = ParamType::UNDEFINED;

    ASSERT_EQ(front.GetParam("offset", value, len, type), ErrorParam::OK);
    EXPECT_STREQ(value, "-5");
    EXPECT_EQ(type, ParamType::INT16);

    ASSERT_EQ(front.GetParam("enabled", value, len, type), ErrorParam::OK);
    EXPECT_STREQ(value, "true");
    EXPECT_EQ(type, ParamType::BOOL);

    EXPECT_EQ(front.GetParam("missing", value, len, type), ErrorParam::NAME_NOT_FOUND);
}

TEST(GatewayParams, CommandLineAssignments)
{
    EXPECT_EQ(Front::ApplyAssignment("gateway.rangeBias=10.5"), ErrorParam::OK);
    EXPECT_DOUBLE_EQ(static_cast<double>(Front::gatewayFront.GetParams().rangeBias), 10.5);
    EXPECT_EQ(Front::ApplyAssignment("gateway.rangeBias = 76.8"), ErrorParam::OK);
    EXPECT_DOUBLE_EQ(static_cast<double>(Front::gatewayFront.GetParams().rangeBias), 76.8);

    EXPECT_EQ(Front::ApplyAssignment("gateway.logUdpHost="), ErrorParam::OK);
    EXPECT_EQ(Front::gatewayFront.GetParams().logUdpHost[0], '\0');

    EXPECT_EQ(Front::ApplyAssignment("gateway.noSuchParam=1"), ErrorParam::NAME_NOT_FOUND);
    EXPECT_EQ(Front::ApplyAssignment("nosuchgroup.baudRate=1"), ErrorParam::GROUP_NOT_FOUND);
    EXPECT_EQ(Front::ApplyAssignment("gateway.baudRate=fast"), ErrorParam::INVALID_DATA);
    EXPECT_EQ(Front::ApplyAssignment("gateway.anchorCount=-1"), ErrorParam::INVALID_DATA);
    EXPECT_EQ(Front::ApplyAssignment("gateway.baudRate"), ErrorParam::INVALID_DATA);
    EXPECT_EQ(Front::ApplyAssignment(std::string("gateway.publishHost=" + std::string(64, 'a')).c_str()),
              ErrorParam::PARAM_TOO_LONG);
}

TEST(GatewayParams, PrintAllParamsWritesParameterFile)
{
    ASSERT_EQ(Front::ApplyAssignment("gateway.rangeBias=76.8"), ErrorParam::OK);
    ASSERT_EQ(Front::ApplyAssignment("gateway.publishHost=10.0.0.2"), ErrorParam::OK);

    FILE* out = tmpfile();
    ASSERT_NE(out, nullptr);
    EXPECT_EQ(Front::PrintAllParams(out), ErrorParam::OK);

    std::string content;
    rewind(out);
    char line[256];
    while (fgets(line, sizeof(line), out) != nullptr) {
        content += line;
    }
    fclose(out);

    EXPECT_NE(content.find("gateway.anchorCount: 8\n"), std::string::npos);
    EXPECT_NE(content.find("gateway.rangeBias: 76.8\n"), std::string::npos);
    EXPECT_NE(content.find("gateway.lowLatency: true\n"), std::string::npos);
    EXPECT_NE(content.find("gateway.publishHost: 10.0.0.2\n"), std::string::npos);
    EXPECT_NE(content.find("gateway.logUdpHost: \n"), std::string::npos);

    ASSERT_EQ(Front::ApplyAssignment("gateway.publishHost=127.0.0.1"), ErrorParam::OK);
}

TEST(GatewayParams, AnchorTableFollowsCount)
{
    GatewayParams params;
    EXPECT_EQ(MakeAnchorTable(params).size(), localization::kMaxAnchors);

    params.anchorCount = 5;
    params.x1 = 1.25;
    localization::AnchorTable table = MakeAnchorTable(params);
    ASSERT_EQ(table.size(), 5u);
    EXPECT_DOUBLE_EQ(table[0].x, 1.25);
    EXPECT_DOUBLE_EQ(table[4].z, localization::kDefaultAnchors[4].z);

    params.anchorCount = 200;
    EXPECT_EQ(MakeAnchorTable(params).size(), localization::kMaxAnchors);
}

TEST(Utils, TransformStrToDataChecksWidth)
{
    uint8_t u8 = 0;
    EXPECT_EQ(Utils::TransformStrToData(ParamType::UINT8, "255", &u8), Utils::ErrorTransform::OK);
    EXPECT_EQ(u8, 255);
    EXPECT_NE(Utils::TransformStrToData(ParamType::UINT8, "256", &u8), Utils::ErrorTransform::OK);
    EXPECT_EQ(u8, 255);

    int16_t i16 = 0;
    EXPECT_EQ(Utils::TransformStrToData(ParamType::INT16, "-32768", &i16), Utils::ErrorTransform::OK);
    EXPECT_EQ(i16, -32768);
    EXPECT_NE(Utils::TransformStrToData(ParamType::INT16, "12x", &i16), Utils::ErrorTransform::OK);

    bool flag = false;
    EXPECT_EQ(Utils::TransformStrToData(ParamType::BOOL, "1", &flag), Utils::ErrorTransform::OK);
    EXPECT_TRUE(flag);
    EXPECT_NE(Utils::TransformStrToData(ParamType::BOOL, "yes", &flag), Utils::ErrorTransform::OK);
}

TEST(Utils, SplitParamAssignment)
{
    etl::string_view group;
    etl::string_view name;
    etl::string_view value;

    ASSERT_TRUE(Utils::SplitParamAssignment(etl::string_view(" gateway.baudRate : 115200 "), ':', group, name, value));
    EXPECT_TRUE(group == etl::string_view("gateway"));
    EXPECT_TRUE(name == etl::string_view("baudRate"));
    EXPECT_TRUE(value == etl::string_view("115200"));

    EXPECT_FALSE(Utils::SplitParamAssignment(etl::string_view("gateway:1"), ':', group, name, value));
    EXPECT_FALSE(Utils::SplitParamAssignment(etl::string_view("gateway.baudRate"), ':', group, name, value));
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
